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

#include "parts_compat/pattern_validator.hpp"

#include <algorithm>
#include <cctype>

#include "parts_compat/normalizer.hpp"

namespace parts_compat {

namespace {

bool is_separator(char c) {
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '/':
      return true;
    default:
      return std::isspace(static_cast<unsigned char>(c)) != 0;
  }
}

}  // namespace

std::size_t count_literal_chars(const std::string & pattern) {
  return static_cast<std::size_t>(std::count_if(pattern.begin(), pattern.end(), [](char c) {
    return c != '*' && c != '?' && !is_separator(c);
  }));
}

bool has_wildcard_chars(const std::string & value) {
  return value.find_first_of("*?") != std::string::npos;
}

Result<void> validate_pattern(MatchType type, const std::optional<std::string> & model,
                              const PatternLimits & limits) {
  const std::string pattern = model ? normalize(*model) : std::string();

  switch (type) {
    case MatchType::Any:
      if (!pattern.empty()) {
        return make_validation_error(ValidationIssue::ModelNotAllowedForAny,
                                     "ANY rules match every model and cannot carry a model");
      }
      return {};

    case MatchType::Exact:
      if (pattern.empty()) {
        return make_validation_error(ValidationIssue::EmptyPattern, "Model cannot be empty for match type exact");
      }
      if (has_wildcard_chars(pattern)) {
        return make_validation_error(ValidationIssue::WildcardNotAllowedInExact,
                                     "EXACT models cannot contain wildcards. Use a WILDCARD rule instead");
      }
      return {};

    case MatchType::Prefix:
      if (pattern.empty()) {
        return make_validation_error(ValidationIssue::EmptyPattern, "Pattern cannot be empty for match type prefix");
      }
      if (has_wildcard_chars(pattern)) {
        return make_validation_error(
            ValidationIssue::WildcardNotAllowedInPrefix,
            "PREFIX patterns cannot contain wildcards. Use the pattern text directly (e.g., \"jl-\" instead of \"jl-*\")");
      }
      return {};

    case MatchType::Wildcard: {
      if (pattern.empty()) {
        return make_validation_error(ValidationIssue::EmptyPattern,
                                     "Pattern cannot be empty for match type wildcard");
      }
      auto star_count = static_cast<std::size_t>(std::count(pattern.begin(), pattern.end(), '*'));
      if (star_count > limits.max_wildcards) {
        return make_validation_error(ValidationIssue::TooManyWildcards,
                                     "WILDCARD patterns can have at most " + std::to_string(limits.max_wildcards) +
                                         " wildcards (*)");
      }
      if (count_literal_chars(pattern) < limits.min_literal_chars) {
        return make_validation_error(ValidationIssue::TooFewLiteralCharacters,
                                     "WILDCARD patterns must include at least " +
                                         std::to_string(limits.min_literal_chars) + " non-wildcard characters");
      }
      return {};
    }
  }

  return {};
}

}  // namespace parts_compat
