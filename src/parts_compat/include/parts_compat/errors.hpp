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

#include <string>

#include <tl/expected.hpp>

namespace parts_compat {

/// Outcome category of a failed engine operation
enum class ErrorCode {
  Validation,     // Bad pattern or missing required field, rejected before persistence
  Duplicate,      // Unique constraint violated
  AccessDenied,   // Cross-tenant access or missing ownership
  NotFound,       // Record absent (also used where existence must not leak)
  TransientStore  // Backend failure, transaction rolled back
};

/// Detail for ErrorCode::Validation
enum class ValidationIssue {
  None,
  EmptyManufacturer,
  EmptyPattern,
  WildcardNotAllowedInPrefix,
  WildcardNotAllowedInExact,
  TooFewLiteralCharacters,
  TooManyWildcards,
  ModelNotAllowedForAny,
  EmptyName,
  EmptyIdentifier,
  InvalidStatusTransition,
  InvalidMemberReference,
  MalformedPayload
};

/// Typed error for engine operations
struct PartsError {
  ErrorCode code;
  std::string message;
  ValidationIssue issue{ValidationIssue::None};
};

template <typename T>
using Result = tl::expected<T, PartsError>;

inline tl::unexpected<PartsError> make_error(ErrorCode code, const std::string & message) {
  return tl::make_unexpected(PartsError{code, message, ValidationIssue::None});
}

inline tl::unexpected<PartsError> make_validation_error(ValidationIssue issue, const std::string & message) {
  return tl::make_unexpected(PartsError{ErrorCode::Validation, message, issue});
}

std::string error_code_to_string(ErrorCode code);

std::string validation_issue_to_string(ValidationIssue issue);

}  // namespace parts_compat
