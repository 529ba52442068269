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

#include <cstddef>
#include <optional>
#include <string>

#include "parts_compat/errors.hpp"
#include "parts_compat/types.hpp"

namespace parts_compat {

/// Limits applied to Wildcard patterns
struct PatternLimits {
  /// Minimum characters left after removing wildcards and separators.
  /// Rejects over-broad patterns like "*" or "*-*".
  std::size_t min_literal_chars{2};

  /// Maximum number of '*' in one pattern
  std::size_t max_wildcards{2};
};

/// Check a rule model against its match type before it is stored.
///
/// - Any: model must be absent (or blank)
/// - Exact, Prefix: model required, no '*' or '?'
/// - Wildcard: model required, at most max_wildcards '*', at least min_literal_chars literals
///
/// @param type Declared match type
/// @param model Rule model (pattern for Prefix/Wildcard)
/// @param limits Wildcard limits
/// @return void on success, ErrorCode::Validation with the specific ValidationIssue otherwise
Result<void> validate_pattern(MatchType type, const std::optional<std::string> & model,
                              const PatternLimits & limits = PatternLimits{});

/// Count characters that are neither wildcards ('*', '?') nor separators (whitespace, '-', '_', '.', '/')
std::size_t count_literal_chars(const std::string & pattern);

/// True if the value contains '*' or '?'
bool has_wildcard_chars(const std::string & value);

}  // namespace parts_compat
