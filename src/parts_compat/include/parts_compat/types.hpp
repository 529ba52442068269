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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parts_compat {

/// How a compatibility rule compares the equipment model
enum class MatchType {
  /// Every model of the manufacturer (rule has no model)
  Any,
  /// Normalized model equals the rule model
  Exact,
  /// Normalized model starts with the rule model
  Prefix,
  /// Rule model is a pattern: '*' = any run of characters, '?' = exactly one character
  Wildcard
};

/// Confidence level of a rule or alternate group
enum class VerificationStatus {
  Unverified,
  Verified,
  Deprecated
};

/// Kind of cataloged part number
enum class IdentifierType {
  Oem,
  Aftermarket,
  ManufacturerPn,
  Upc,
  CrossReference
};

// ============================================================================
// External records (read-only for the engine)
// ============================================================================

/// Fleet equipment record owned by the equipment subsystem
struct Equipment {
  std::string id;
  std::string organization_id;
  std::string manufacturer;
  std::string model;
};

/// Stocked inventory item owned by the inventory subsystem
struct InventoryItem {
  std::string id;
  std::string organization_id;
  std::string name;
  std::string sku;
  std::string external_id;
  int32_t quantity_on_hand{0};
  std::optional<int32_t> low_stock_threshold;
  std::optional<double> default_unit_cost;
  std::string location;
  std::string image_url;
};

// ============================================================================
// Compatibility rules
// ============================================================================

/// Rule as submitted by a caller (single add or one entry of a bulk replace)
struct RuleInput {
  std::string manufacturer;
  std::optional<std::string> model;
  /// Absent: Exact when a model is given, Any otherwise
  std::optional<MatchType> match_type;
  std::optional<VerificationStatus> status;
  std::string notes;
};

/// Stored compatibility rule attached to one inventory item
struct CompatibilityRule {
  std::string id;
  std::string inventory_item_id;
  std::string manufacturer;  ///< Display value (trimmed)
  std::optional<std::string> model;
  std::string manufacturer_norm;
  std::optional<std::string> model_norm;  ///< Present iff model is present
  MatchType match_type{MatchType::Any};
  VerificationStatus status{VerificationStatus::Unverified};
  std::string notes;
  int64_t created_at_ns{0};
};

// ============================================================================
// Part identifiers and alternate groups
// ============================================================================

struct PartIdentifierInput {
  IdentifierType identifier_type{IdentifierType::Oem};
  std::string raw_value;
  std::string manufacturer;
  std::optional<std::string> inventory_item_id;
  std::string notes;
};

struct PartIdentifier {
  std::string id;
  std::string organization_id;
  IdentifierType identifier_type{IdentifierType::Oem};
  std::string raw_value;   ///< Trimmed value as entered
  std::string norm_value;  ///< normalize(raw_value)
  std::string manufacturer;
  std::optional<std::string> inventory_item_id;
  std::string notes;
  std::string created_by;
  int64_t created_at_ns{0};
};

struct AlternateGroupInput {
  std::string name;
  std::string description;
  std::optional<VerificationStatus> status;
  std::string notes;
  std::string evidence_url;
};

/// Partial update. Unset fields are left untouched.
struct AlternateGroupPatch {
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<VerificationStatus> status;
  std::optional<std::string> notes;
  std::optional<std::string> evidence_url;
};

struct AlternateGroup {
  std::string id;
  std::string organization_id;
  std::string name;
  std::string description;
  VerificationStatus status{VerificationStatus::Unverified};
  std::string notes;
  std::string evidence_url;
  std::string created_by;
  std::optional<std::string> verified_by;
  std::optional<int64_t> verified_at_ns;
  int64_t created_at_ns{0};
  int64_t updated_at_ns{0};
};

/// Group membership. Exactly one of part_identifier_id / inventory_item_id is set.
struct AlternateGroupMember {
  std::string id;
  std::string group_id;
  std::optional<std::string> part_identifier_id;
  std::optional<std::string> inventory_item_id;
  bool is_primary{false};
  std::string notes;
  int64_t created_at_ns{0};
};

/// Member flattened with the display fields of the record it references
struct AlternateGroupMemberView {
  std::string id;
  std::string group_id;
  std::optional<std::string> part_identifier_id;
  std::optional<std::string> inventory_item_id;
  bool is_primary{false};
  std::string notes;
  int64_t created_at_ns{0};

  std::optional<IdentifierType> identifier_type;
  std::string identifier_value;
  std::string identifier_manufacturer;

  std::string inventory_name;
  std::string inventory_sku;
  int32_t quantity_on_hand{0};
};

struct AlternateGroupWithMembers {
  AlternateGroup group;
  std::vector<AlternateGroupMemberView> members;
};

// ============================================================================
// Lookup results
// ============================================================================

/// One member of an alternate group matched by a lookup, enriched with stock data
struct AlternateResult {
  std::string group_id;
  std::string group_name;
  VerificationStatus group_status{VerificationStatus::Unverified};
  bool group_verified{false};
  std::string group_notes;

  std::optional<std::string> identifier_id;
  std::optional<IdentifierType> identifier_type;
  std::string identifier_value;
  std::string identifier_manufacturer;

  std::optional<std::string> inventory_item_id;
  std::string inventory_name;
  std::string inventory_sku;
  int32_t quantity_on_hand{0};
  int32_t low_stock_threshold{0};
  std::optional<double> default_unit_cost;
  std::string location;
  std::string image_url;
  bool is_in_stock{false};
  bool is_low_stock{false};

  bool is_primary{false};
  /// Row matches the searched part number (or is the searched inventory item)
  bool is_match{false};
};

/// Inventory item covered by a rule matching the requested equipment
struct CompatiblePart {
  std::string inventory_item_id;
  std::string name;
  std::string sku;
  std::string external_id;
  int32_t quantity_on_hand{0};
  int32_t low_stock_threshold{0};
  std::optional<double> default_unit_cost;
  std::string location;
  std::string image_url;
  MatchType rule_match_type{MatchType::Any};
  VerificationStatus rule_status{VerificationStatus::Unverified};
  bool is_in_stock{false};
  bool is_verified{false};
};

/// Convert string to MatchType (case-insensitive)
/// @throws std::invalid_argument if the string is not a known match type
MatchType string_to_match_type(const std::string & str);

std::string match_type_to_string(MatchType type);

/// Convert string to VerificationStatus (case-insensitive)
/// @throws std::invalid_argument if the string is not a known status
VerificationStatus string_to_verification_status(const std::string & str);

std::string verification_status_to_string(VerificationStatus status);

/// Convert string to IdentifierType (case-insensitive, accepts short and long forms)
/// @throws std::invalid_argument if the string is not a known identifier type
IdentifierType string_to_identifier_type(const std::string & str);

std::string identifier_type_to_string(IdentifierType type);

}  // namespace parts_compat
