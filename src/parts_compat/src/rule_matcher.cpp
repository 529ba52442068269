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

#include "parts_compat/rule_matcher.hpp"

#include <sstream>

#include "parts_compat/normalizer.hpp"

namespace parts_compat {

bool RuleMatcher::matches(const CompatibilityRule & rule, const std::string & manufacturer,
                          const std::string & model) const {
  if (normalize(manufacturer) != rule.manufacturer_norm) {
    return false;
  }

  if (rule.match_type == MatchType::Any) {
    return true;
  }

  // Non-Any rules always carry a model; a stored row without one matches nothing
  if (!rule.model_norm || rule.model_norm->empty()) {
    return false;
  }

  const std::string model_norm = normalize(model);
  const std::string & pattern = *rule.model_norm;

  switch (rule.match_type) {
    case MatchType::Exact:
      return model_norm == pattern;
    case MatchType::Prefix:
      return model_norm.compare(0, pattern.size(), pattern) == 0;
    case MatchType::Wildcard:
      return std::regex_match(model_norm, get_compiled(pattern).regex);
    case MatchType::Any:
      return true;
  }
  return false;
}

bool RuleMatcher::matches_any(const std::vector<CompatibilityRule> & rules, const std::string & manufacturer,
                              const std::string & model) const {
  for (const auto & rule : rules) {
    if (matches(rule, manufacturer, model)) {
      return true;
    }
  }
  return false;
}

RuleMatcher::CompiledPattern RuleMatcher::compile_pattern(const std::string & pattern) {
  CompiledPattern result;
  result.original = pattern;

  // Convert wildcard pattern to regex:
  // - Escape regex special characters
  // - Replace '*' with '.*' and '?' with '.'
  std::ostringstream regex_str;
  regex_str << "^";

  for (char c : pattern) {
    switch (c) {
      case '*':
        regex_str << ".*";
        break;
      case '?':
        regex_str << '.';
        break;
      // Escape regex special characters
      case '.':
      case '+':
      case '[':
      case ']':
      case '(':
      case ')':
      case '{':
      case '}':
      case '|':
      case '^':
      case '$':
      case '\\':
        regex_str << '\\' << c;
        break;
      default:
        regex_str << c;
        break;
    }
  }

  regex_str << "$";

  result.regex = std::regex(regex_str.str(), std::regex::ECMAScript | std::regex::icase);
  return result;
}

const RuleMatcher::CompiledPattern & RuleMatcher::get_compiled(const std::string & pattern) const {
  std::lock_guard<std::mutex> lock(cache_mutex_);

  auto it = compiled_cache_.find(pattern);
  if (it != compiled_cache_.end()) {
    return it->second;
  }

  auto inserted = compiled_cache_.emplace(pattern, compile_pattern(pattern));
  return inserted.first->second;
}

}  // namespace parts_compat
