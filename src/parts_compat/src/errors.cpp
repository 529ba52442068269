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

#include "parts_compat/errors.hpp"

namespace parts_compat {

std::string error_code_to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Validation:
      return "validation";
    case ErrorCode::Duplicate:
      return "duplicate";
    case ErrorCode::AccessDenied:
      return "access_denied";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::TransientStore:
      return "transient_store";
    default:
      return "unknown";
  }
}

std::string validation_issue_to_string(ValidationIssue issue) {
  switch (issue) {
    case ValidationIssue::None:
      return "none";
    case ValidationIssue::EmptyManufacturer:
      return "empty_manufacturer";
    case ValidationIssue::EmptyPattern:
      return "empty_pattern";
    case ValidationIssue::WildcardNotAllowedInPrefix:
      return "wildcard_not_allowed_in_prefix";
    case ValidationIssue::WildcardNotAllowedInExact:
      return "wildcard_not_allowed_in_exact";
    case ValidationIssue::TooFewLiteralCharacters:
      return "too_few_literal_characters";
    case ValidationIssue::TooManyWildcards:
      return "too_many_wildcards";
    case ValidationIssue::ModelNotAllowedForAny:
      return "model_not_allowed_for_any";
    case ValidationIssue::EmptyName:
      return "empty_name";
    case ValidationIssue::EmptyIdentifier:
      return "empty_identifier";
    case ValidationIssue::InvalidStatusTransition:
      return "invalid_status_transition";
    case ValidationIssue::InvalidMemberReference:
      return "invalid_member_reference";
    case ValidationIssue::MalformedPayload:
      return "malformed_payload";
    default:
      return "unknown";
  }
}

}  // namespace parts_compat
