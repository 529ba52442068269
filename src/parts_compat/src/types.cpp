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

#include "parts_compat/types.hpp"

#include <stdexcept>

#include "parts_compat/normalizer.hpp"

namespace parts_compat {

MatchType string_to_match_type(const std::string & str) {
  std::string lower = normalize(str);

  if (lower == "any") {
    return MatchType::Any;
  }
  if (lower == "exact") {
    return MatchType::Exact;
  }
  if (lower == "prefix" || lower == "starts_with") {
    return MatchType::Prefix;
  }
  if (lower == "wildcard" || lower == "pattern") {
    return MatchType::Wildcard;
  }
  throw std::invalid_argument("Invalid match type: " + str + ". Valid values: any, exact, prefix, wildcard");
}

std::string match_type_to_string(MatchType type) {
  switch (type) {
    case MatchType::Any:
      return "any";
    case MatchType::Exact:
      return "exact";
    case MatchType::Prefix:
      return "prefix";
    case MatchType::Wildcard:
      return "wildcard";
    default:
      return "unknown";
  }
}

VerificationStatus string_to_verification_status(const std::string & str) {
  std::string lower = normalize(str);

  if (lower == "unverified") {
    return VerificationStatus::Unverified;
  }
  if (lower == "verified") {
    return VerificationStatus::Verified;
  }
  if (lower == "deprecated") {
    return VerificationStatus::Deprecated;
  }
  throw std::invalid_argument("Invalid verification status: " + str +
                              ". Valid values: unverified, verified, deprecated");
}

std::string verification_status_to_string(VerificationStatus status) {
  switch (status) {
    case VerificationStatus::Unverified:
      return "unverified";
    case VerificationStatus::Verified:
      return "verified";
    case VerificationStatus::Deprecated:
      return "deprecated";
    default:
      return "unknown";
  }
}

IdentifierType string_to_identifier_type(const std::string & str) {
  std::string lower = normalize(str);

  if (lower == "oem") {
    return IdentifierType::Oem;
  }
  if (lower == "aftermarket") {
    return IdentifierType::Aftermarket;
  }
  if (lower == "mpn" || lower == "manufacturer_pn") {
    return IdentifierType::ManufacturerPn;
  }
  if (lower == "upc") {
    return IdentifierType::Upc;
  }
  if (lower == "cross_ref" || lower == "cross_reference") {
    return IdentifierType::CrossReference;
  }
  throw std::invalid_argument("Invalid identifier type: " + str +
                              ". Valid values: oem, aftermarket, mpn, upc, cross_ref");
}

std::string identifier_type_to_string(IdentifierType type) {
  switch (type) {
    case IdentifierType::Oem:
      return "oem";
    case IdentifierType::Aftermarket:
      return "aftermarket";
    case IdentifierType::ManufacturerPn:
      return "mpn";
    case IdentifierType::Upc:
      return "upc";
    case IdentifierType::CrossReference:
      return "cross_ref";
    default:
      return "unknown";
  }
}

}  // namespace parts_compat
