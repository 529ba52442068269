// Copyright 2026 mfaferek93
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <map>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

#include "parts_compat/types.hpp"

namespace parts_compat {

/// Decides whether equipment (manufacturer, model) is covered by a compatibility rule.
///
/// The manufacturer is always compared exactly after normalization. Only the model
/// axis is fuzzy, according to the rule's match type:
/// - Any: every model
/// - Exact: "D6T" matches "d6t" but not "D6TX"
/// - Prefix: "JL-" matches "JL-100", "jl-200-a" but not "XJL-100"
/// - Wildcard: "D*T" matches "D6T", "D10T" but not "D6R" ('?' = exactly one character)
///
/// Compiled wildcard patterns are cached; the cache is thread-safe.
class RuleMatcher {
 public:
  RuleMatcher() = default;

  /// Check if a rule covers the given equipment
  /// @param rule Stored (normalized) rule
  /// @param manufacturer Equipment manufacturer as entered
  /// @param model Equipment model as entered (may be empty)
  /// @return true if the rule matches
  bool matches(const CompatibilityRule & rule, const std::string & manufacturer, const std::string & model) const;

  /// Check if any rule in the list covers the equipment (stops at the first match)
  bool matches_any(const std::vector<CompatibilityRule> & rules, const std::string & manufacturer,
                   const std::string & model) const;

 private:
  /// Compiled pattern (pattern string -> regex)
  struct CompiledPattern {
    std::string original;
    std::regex regex;
  };

  /// Compile a wildcard pattern to an anchored regex
  static CompiledPattern compile_pattern(const std::string & pattern);

  /// Get or compile pattern regex
  const CompiledPattern & get_compiled(const std::string & pattern) const;

  /// Compiled pattern cache (normalized pattern -> compiled)
  mutable std::map<std::string, CompiledPattern> compiled_cache_;

  /// Mutex for thread-safe cache access
  mutable std::mutex cache_mutex_;
};

}  // namespace parts_compat
