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

#include "parts_compat/storage/in_memory_parts_storage.hpp"

#include <algorithm>
#include <set>

#include "parts_compat/normalizer.hpp"

namespace parts_compat {

namespace {

void throw_if_cancelled(const CancellationToken * cancel) {
  if (is_cancelled(cancel)) {
    throw QueryCancelledException();
  }
}

/// manufacturer, then model with absent models last
bool rule_order_less(const CompatibilityRule & a, const CompatibilityRule & b) {
  if (a.manufacturer_norm != b.manufacturer_norm) {
    return a.manufacturer_norm < b.manufacturer_norm;
  }
  if (a.model_norm.has_value() != b.model_norm.has_value()) {
    return a.model_norm.has_value();
  }
  if (a.model_norm && *a.model_norm != *b.model_norm) {
    return *a.model_norm < *b.model_norm;
  }
  if (a.created_at_ns != b.created_at_ns) {
    return a.created_at_ns < b.created_at_ns;
  }
  return a.id < b.id;
}

bool same_rule_key(const CompatibilityRule & a, const CompatibilityRule & b) {
  return a.inventory_item_id == b.inventory_item_id && a.manufacturer_norm == b.manufacturer_norm &&
         a.model_norm.value_or("") == b.model_norm.value_or("") && a.match_type == b.match_type;
}

}  // namespace

void InMemoryPartsStorage::upsert_inventory_item(const InventoryItem & item) {
  std::lock_guard<std::mutex> lock(mutex_);
  items_[item.id] = item;
}

void InMemoryPartsStorage::upsert_equipment(const Equipment & equipment) {
  std::lock_guard<std::mutex> lock(mutex_);
  equipment_[equipment.id] = equipment;
}

// ============================================================================
// CatalogStore
// ============================================================================

std::optional<InventoryItem> InMemoryPartsStorage::get_inventory_item(const std::string & item_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = items_.find(item_id);
  if (it == items_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<InventoryItem> InMemoryPartsStorage::find_inventory_items_by_code(const std::string & organization_id,
                                                                              const std::string & code_norm,
                                                                              const CancellationToken * cancel) const {
  throw_if_cancelled(cancel);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<InventoryItem> result;
  for (const auto & [id, item] : items_) {
    if (item.organization_id != organization_id) {
      continue;
    }
    if ((!item.sku.empty() && normalize(item.sku) == code_norm) ||
        (!item.external_id.empty() && normalize(item.external_id) == code_norm)) {
      result.push_back(item);
    }
  }
  throw_if_cancelled(cancel);
  return result;
}

std::vector<Equipment> InMemoryPartsStorage::list_equipment(const std::string & organization_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Equipment> result;
  for (const auto & [id, equipment] : equipment_) {
    if (equipment.organization_id == organization_id) {
      result.push_back(equipment);
    }
  }
  return result;
}

std::vector<Equipment> InMemoryPartsStorage::get_equipment(const std::string & organization_id,
                                                           const std::vector<std::string> & equipment_ids) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> wanted(equipment_ids.begin(), equipment_ids.end());
  std::vector<Equipment> result;
  for (const auto & id : wanted) {
    auto it = equipment_.find(id);
    if (it != equipment_.end() && it->second.organization_id == organization_id) {
      result.push_back(it->second);
    }
  }
  return result;
}

// ============================================================================
// RuleStore
// ============================================================================

std::vector<CompatibilityRule> InMemoryPartsStorage::list_rules(const std::string & item_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CompatibilityRule> result;
  for (const auto & [id, rule] : rules_) {
    if (rule.inventory_item_id == item_id) {
      result.push_back(rule);
    }
  }
  std::sort(result.begin(), result.end(), rule_order_less);
  return result;
}

std::optional<CompatibilityRule> InMemoryPartsStorage::get_rule(const std::string & rule_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rules_.find(rule_id);
  if (it == rules_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryPartsStorage::check_rule_unique(const CompatibilityRule & rule) const {
  if (rules_.count(rule.id) > 0) {
    throw UniqueViolationException("part_compatibility_rules.id");
  }
  for (const auto & [id, existing] : rules_) {
    if (same_rule_key(existing, rule)) {
      throw UniqueViolationException("part_compatibility_rules_unique");
    }
  }
}

void InMemoryPartsStorage::insert_rule(const CompatibilityRule & rule) {
  std::lock_guard<std::mutex> lock(mutex_);
  check_rule_unique(rule);
  rules_.emplace(rule.id, rule);
}

bool InMemoryPartsStorage::delete_rule(const std::string & rule_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return rules_.erase(rule_id) > 0;
}

size_t InMemoryPartsStorage::replace_rules(const std::string & item_id, const std::vector<CompatibilityRule> & rules) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Readers take the same mutex, so they never observe the intermediate state
  auto backup = rules_;
  for (auto it = rules_.begin(); it != rules_.end();) {
    if (it->second.inventory_item_id == item_id) {
      it = rules_.erase(it);
    } else {
      ++it;
    }
  }

  try {
    for (const auto & rule : rules) {
      check_rule_unique(rule);
      rules_.emplace(rule.id, rule);
    }
  } catch (...) {
    rules_ = std::move(backup);
    throw;
  }
  return rules.size();
}

std::vector<CompatibilityRule> InMemoryPartsStorage::find_rules_by_manufacturer(
    const std::string & organization_id, const std::string & manufacturer_norm) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CompatibilityRule> result;
  for (const auto & [id, rule] : rules_) {
    if (rule.manufacturer_norm != manufacturer_norm) {
      continue;
    }
    auto item_it = items_.find(rule.inventory_item_id);
    if (item_it != items_.end() && item_it->second.organization_id == organization_id) {
      result.push_back(rule);
    }
  }
  std::sort(result.begin(), result.end(), rule_order_less);
  return result;
}

// ============================================================================
// AlternatesStore: identifiers
// ============================================================================

void InMemoryPartsStorage::insert_identifier(const PartIdentifier & identifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (identifiers_.count(identifier.id) > 0) {
    throw UniqueViolationException("part_identifiers.id");
  }
  for (const auto & [id, existing] : identifiers_) {
    if (existing.organization_id == identifier.organization_id && existing.norm_value == identifier.norm_value) {
      throw UniqueViolationException("part_identifiers.organization_id, part_identifiers.norm_value");
    }
  }
  identifiers_.emplace(identifier.id, identifier);
}

std::optional<PartIdentifier> InMemoryPartsStorage::get_identifier(const std::string & identifier_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = identifiers_.find(identifier_id);
  if (it == identifiers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<PartIdentifier> InMemoryPartsStorage::find_identifiers_by_value(const std::string & organization_id,
                                                                            const std::string & value_norm,
                                                                            const CancellationToken * cancel) const {
  throw_if_cancelled(cancel);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PartIdentifier> result;
  for (const auto & [id, identifier] : identifiers_) {
    if (identifier.organization_id == organization_id && identifier.norm_value == value_norm) {
      result.push_back(identifier);
    }
  }
  throw_if_cancelled(cancel);
  return result;
}

std::vector<PartIdentifier> InMemoryPartsStorage::find_identifiers_by_item(const std::string & inventory_item_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PartIdentifier> result;
  for (const auto & [id, identifier] : identifiers_) {
    if (identifier.inventory_item_id && *identifier.inventory_item_id == inventory_item_id) {
      result.push_back(identifier);
    }
  }
  return result;
}

std::vector<PartIdentifier> InMemoryPartsStorage::search_identifiers(const std::string & organization_id,
                                                                     const std::string & term_norm, size_t limit,
                                                                     const CancellationToken * cancel) const {
  throw_if_cancelled(cancel);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PartIdentifier> result;
  for (const auto & [id, identifier] : identifiers_) {
    if (identifier.organization_id == organization_id && identifier.norm_value.find(term_norm) != std::string::npos) {
      result.push_back(identifier);
    }
  }
  throw_if_cancelled(cancel);

  std::sort(result.begin(), result.end(), [](const PartIdentifier & a, const PartIdentifier & b) {
    if (a.raw_value != b.raw_value) {
      return a.raw_value < b.raw_value;
    }
    return a.id < b.id;
  });
  if (result.size() > limit) {
    result.resize(limit);
  }
  return result;
}

// ============================================================================
// AlternatesStore: groups
// ============================================================================

void InMemoryPartsStorage::insert_group(const AlternateGroup & group) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!groups_.emplace(group.id, group).second) {
    throw UniqueViolationException("part_alternate_groups.id");
  }
}

std::optional<AlternateGroup> InMemoryPartsStorage::get_group(const std::string & group_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(group_id);
  if (it == groups_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<AlternateGroup> InMemoryPartsStorage::list_groups(const std::string & organization_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AlternateGroup> result;
  for (const auto & [id, group] : groups_) {
    if (group.organization_id == organization_id) {
      result.push_back(group);
    }
  }
  std::sort(result.begin(), result.end(), [](const AlternateGroup & a, const AlternateGroup & b) {
    if (a.name != b.name) {
      return a.name < b.name;
    }
    return a.id < b.id;
  });
  return result;
}

bool InMemoryPartsStorage::update_group(const AlternateGroup & group) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = groups_.find(group.id);
  if (it == groups_.end()) {
    return false;
  }
  it->second = group;
  return true;
}

bool InMemoryPartsStorage::delete_group(const std::string & group_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (groups_.erase(group_id) == 0) {
    return false;
  }
  for (auto it = members_.begin(); it != members_.end();) {
    if (it->second.member.group_id == group_id) {
      it = members_.erase(it);
    } else {
      ++it;
    }
  }
  return true;
}

// ============================================================================
// AlternatesStore: members
// ============================================================================

void InMemoryPartsStorage::insert_member(const AlternateGroupMember & member) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (groups_.count(member.group_id) == 0) {
    throw StorageException("Group not found: " + member.group_id);
  }
  if (members_.count(member.id) > 0) {
    throw UniqueViolationException("part_alternate_group_members.id");
  }
  for (const auto & [id, entry] : members_) {
    const auto & existing = entry.member;
    if (existing.group_id != member.group_id) {
      continue;
    }
    if (member.part_identifier_id && existing.part_identifier_id == member.part_identifier_id) {
      throw UniqueViolationException("part_alternate_group_members.group_id, part_identifier_id");
    }
    if (member.inventory_item_id && existing.inventory_item_id == member.inventory_item_id) {
      throw UniqueViolationException("part_alternate_group_members.group_id, inventory_item_id");
    }
  }
  members_.emplace(member.id, MemberEntry{member, next_member_sequence_++});
}

std::optional<AlternateGroupMember> InMemoryPartsStorage::get_member(const std::string & member_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = members_.find(member_id);
  if (it == members_.end()) {
    return std::nullopt;
  }
  return it->second.member;
}

bool InMemoryPartsStorage::delete_member(const std::string & member_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return members_.erase(member_id) > 0;
}

std::vector<AlternateGroupMember> InMemoryPartsStorage::list_members(const std::string & group_id,
                                                                     const CancellationToken * cancel) const {
  throw_if_cancelled(cancel);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<const MemberEntry *> entries;
  for (const auto & [id, entry] : members_) {
    if (entry.member.group_id == group_id) {
      entries.push_back(&entry);
    }
  }
  std::sort(entries.begin(), entries.end(), [](const MemberEntry * a, const MemberEntry * b) {
    if (a->member.is_primary != b->member.is_primary) {
      return a->member.is_primary;
    }
    if (a->member.created_at_ns != b->member.created_at_ns) {
      return a->member.created_at_ns < b->member.created_at_ns;
    }
    return a->sequence < b->sequence;
  });

  std::vector<AlternateGroupMember> result;
  result.reserve(entries.size());
  for (const auto * entry : entries) {
    result.push_back(entry->member);
  }
  return result;
}

std::vector<std::string> InMemoryPartsStorage::find_group_ids_by_members(
    const std::vector<std::string> & identifier_ids, const std::vector<std::string> & inventory_item_ids,
    const CancellationToken * cancel) const {
  throw_if_cancelled(cancel);
  std::set<std::string> wanted_identifiers(identifier_ids.begin(), identifier_ids.end());
  std::set<std::string> wanted_items(inventory_item_ids.begin(), inventory_item_ids.end());

  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> group_ids;
  for (const auto & [id, entry] : members_) {
    const auto & member = entry.member;
    if ((member.part_identifier_id && wanted_identifiers.count(*member.part_identifier_id) > 0) ||
        (member.inventory_item_id && wanted_items.count(*member.inventory_item_id) > 0)) {
      group_ids.insert(member.group_id);
    }
  }
  throw_if_cancelled(cancel);
  return {group_ids.begin(), group_ids.end()};
}

}  // namespace parts_compat
