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

#include "parts_compat/json_serialization.hpp"

#include <optional>
#include <stdexcept>

namespace parts_compat {

namespace {

double ns_to_seconds(int64_t ns) {
  return static_cast<double>(ns) / 1e9;
}

template <typename T>
json optional_to_json(const std::optional<T> & value) {
  return value ? json(*value) : json(nullptr);
}

tl::unexpected<PartsError> malformed(const std::string & message) {
  return make_validation_error(ValidationIssue::MalformedPayload, message);
}

/// Optional string field; null and missing both mean absent
std::optional<std::string> optional_string_field(const json & entry, const char * key, size_t index) {
  if (!entry.contains(key) || entry[key].is_null()) {
    return std::nullopt;
  }
  if (!entry[key].is_string()) {
    throw std::invalid_argument("Rule " + std::to_string(index) + ": '" + key + "' must be a string");
  }
  return entry[key].get<std::string>();
}

}  // namespace

json rule_to_json(const CompatibilityRule & rule) {
  json j;
  j["id"] = rule.id;
  j["inventory_item_id"] = rule.inventory_item_id;
  j["manufacturer"] = rule.manufacturer;
  j["model"] = optional_to_json(rule.model);
  j["manufacturer_norm"] = rule.manufacturer_norm;
  j["model_norm"] = optional_to_json(rule.model_norm);
  j["match_type"] = match_type_to_string(rule.match_type);
  j["status"] = verification_status_to_string(rule.status);
  j["notes"] = rule.notes;
  j["created_at"] = ns_to_seconds(rule.created_at_ns);
  return j;
}

json identifier_to_json(const PartIdentifier & identifier) {
  json j;
  j["id"] = identifier.id;
  j["organization_id"] = identifier.organization_id;
  j["identifier_type"] = identifier_type_to_string(identifier.identifier_type);
  j["raw_value"] = identifier.raw_value;
  j["norm_value"] = identifier.norm_value;
  j["manufacturer"] = identifier.manufacturer;
  j["inventory_item_id"] = optional_to_json(identifier.inventory_item_id);
  j["notes"] = identifier.notes;
  j["created_by"] = identifier.created_by;
  j["created_at"] = ns_to_seconds(identifier.created_at_ns);
  return j;
}

json group_to_json(const AlternateGroup & group) {
  json j;
  j["id"] = group.id;
  j["organization_id"] = group.organization_id;
  j["name"] = group.name;
  j["description"] = group.description;
  j["status"] = verification_status_to_string(group.status);
  j["notes"] = group.notes;
  j["evidence_url"] = group.evidence_url;
  j["created_by"] = group.created_by;
  j["verified_by"] = optional_to_json(group.verified_by);
  j["verified_at"] = group.verified_at_ns ? json(ns_to_seconds(*group.verified_at_ns)) : json(nullptr);
  j["created_at"] = ns_to_seconds(group.created_at_ns);
  j["updated_at"] = ns_to_seconds(group.updated_at_ns);
  return j;
}

json member_view_to_json(const AlternateGroupMemberView & member) {
  json j;
  j["id"] = member.id;
  j["group_id"] = member.group_id;
  j["part_identifier_id"] = optional_to_json(member.part_identifier_id);
  j["inventory_item_id"] = optional_to_json(member.inventory_item_id);
  j["is_primary"] = member.is_primary;
  j["notes"] = member.notes;
  j["created_at"] = ns_to_seconds(member.created_at_ns);
  j["identifier_type"] =
      member.identifier_type ? json(identifier_type_to_string(*member.identifier_type)) : json(nullptr);
  j["identifier_value"] = member.identifier_value;
  j["identifier_manufacturer"] = member.identifier_manufacturer;
  j["inventory_name"] = member.inventory_name;
  j["inventory_sku"] = member.inventory_sku;
  j["quantity_on_hand"] = member.quantity_on_hand;
  return j;
}

json group_with_members_to_json(const AlternateGroupWithMembers & group) {
  json j = group_to_json(group.group);
  json members = json::array();
  for (const auto & member : group.members) {
    members.push_back(member_view_to_json(member));
  }
  j["members"] = members;
  return j;
}

json alternate_result_to_json(const AlternateResult & result) {
  json j;
  j["group_id"] = result.group_id;
  j["group_name"] = result.group_name;
  j["group_status"] = verification_status_to_string(result.group_status);
  j["group_verified"] = result.group_verified;
  j["group_notes"] = result.group_notes;
  j["identifier_id"] = optional_to_json(result.identifier_id);
  j["identifier_type"] =
      result.identifier_type ? json(identifier_type_to_string(*result.identifier_type)) : json(nullptr);
  j["identifier_value"] = result.identifier_value;
  j["identifier_manufacturer"] = result.identifier_manufacturer;
  j["inventory_item_id"] = optional_to_json(result.inventory_item_id);
  j["inventory_name"] = result.inventory_name;
  j["inventory_sku"] = result.inventory_sku;
  j["quantity_on_hand"] = result.quantity_on_hand;
  j["low_stock_threshold"] = result.low_stock_threshold;
  j["default_unit_cost"] = optional_to_json(result.default_unit_cost);
  j["location"] = result.location;
  j["image_url"] = result.image_url;
  j["is_in_stock"] = result.is_in_stock;
  j["is_low_stock"] = result.is_low_stock;
  j["is_primary"] = result.is_primary;
  j["is_match"] = result.is_match;
  return j;
}

json compatible_part_to_json(const CompatiblePart & part) {
  json j;
  j["inventory_item_id"] = part.inventory_item_id;
  j["name"] = part.name;
  j["sku"] = part.sku;
  j["external_id"] = part.external_id;
  j["quantity_on_hand"] = part.quantity_on_hand;
  j["low_stock_threshold"] = part.low_stock_threshold;
  j["default_unit_cost"] = optional_to_json(part.default_unit_cost);
  j["location"] = part.location;
  j["image_url"] = part.image_url;
  j["rule_match_type"] = match_type_to_string(part.rule_match_type);
  j["rule_status"] = verification_status_to_string(part.rule_status);
  j["is_in_stock"] = part.is_in_stock;
  j["is_verified"] = part.is_verified;
  return j;
}

json error_to_json(const PartsError & error) {
  json j;
  j["error"] = error_code_to_string(error.code);
  j["message"] = error.message;
  if (error.code == ErrorCode::Validation) {
    j["issue"] = validation_issue_to_string(error.issue);
  }
  return j;
}

Result<std::vector<RuleInput>> parse_rule_inputs(const json & payload) {
  if (!payload.is_array()) {
    return malformed("Rule payload must be a JSON array");
  }

  std::vector<RuleInput> inputs;
  inputs.reserve(payload.size());
  try {
    for (size_t i = 0; i < payload.size(); ++i) {
      const json & entry = payload[i];
      if (!entry.is_object()) {
        return malformed("Rule " + std::to_string(i) + " must be an object");
      }

      RuleInput input;
      input.manufacturer = optional_string_field(entry, "manufacturer", i).value_or("");
      input.model = optional_string_field(entry, "model", i);
      if (auto match_type = optional_string_field(entry, "match_type", i)) {
        input.match_type = string_to_match_type(*match_type);
      }
      if (auto status = optional_string_field(entry, "status", i)) {
        input.status = string_to_verification_status(*status);
      }
      input.notes = optional_string_field(entry, "notes", i).value_or("");
      inputs.push_back(std::move(input));
    }
  } catch (const std::invalid_argument & e) {
    return malformed(e.what());
  }
  return inputs;
}

Result<std::vector<RuleInput>> parse_rule_payload(const std::string & payload_text) {
  json payload;
  try {
    payload = json::parse(payload_text);
  } catch (const json::parse_error & e) {
    return malformed(std::string("Invalid JSON in rule payload: ") + e.what());
  }
  return parse_rule_inputs(payload);
}

}  // namespace parts_compat
