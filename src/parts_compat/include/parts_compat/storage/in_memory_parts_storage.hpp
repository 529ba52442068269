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
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "parts_compat/storage/parts_storage.hpp"

namespace parts_compat {

/// Thread-safe in-memory implementation of all storage interfaces
class InMemoryPartsStorage : public CatalogStore,
                             public CatalogWriter,
                             public RuleStore,
                             public AlternatesStore {
 public:
  InMemoryPartsStorage() = default;

  // CatalogWriter
  void upsert_inventory_item(const InventoryItem & item) override;
  void upsert_equipment(const Equipment & equipment) override;

  // CatalogStore
  std::optional<InventoryItem> get_inventory_item(const std::string & item_id) const override;
  std::vector<InventoryItem> find_inventory_items_by_code(const std::string & organization_id,
                                                          const std::string & code_norm,
                                                          const CancellationToken * cancel = nullptr) const override;
  std::vector<Equipment> list_equipment(const std::string & organization_id) const override;
  std::vector<Equipment> get_equipment(const std::string & organization_id,
                                       const std::vector<std::string> & equipment_ids) const override;

  // RuleStore
  std::vector<CompatibilityRule> list_rules(const std::string & item_id) const override;
  std::optional<CompatibilityRule> get_rule(const std::string & rule_id) const override;
  void insert_rule(const CompatibilityRule & rule) override;
  bool delete_rule(const std::string & rule_id) override;
  size_t replace_rules(const std::string & item_id, const std::vector<CompatibilityRule> & rules) override;
  std::vector<CompatibilityRule> find_rules_by_manufacturer(const std::string & organization_id,
                                                            const std::string & manufacturer_norm) const override;

  // AlternatesStore
  void insert_identifier(const PartIdentifier & identifier) override;
  std::optional<PartIdentifier> get_identifier(const std::string & identifier_id) const override;
  std::vector<PartIdentifier> find_identifiers_by_value(const std::string & organization_id,
                                                        const std::string & value_norm,
                                                        const CancellationToken * cancel = nullptr) const override;
  std::vector<PartIdentifier> find_identifiers_by_item(const std::string & inventory_item_id) const override;
  std::vector<PartIdentifier> search_identifiers(const std::string & organization_id, const std::string & term_norm,
                                                 size_t limit,
                                                 const CancellationToken * cancel = nullptr) const override;

  void insert_group(const AlternateGroup & group) override;
  std::optional<AlternateGroup> get_group(const std::string & group_id) const override;
  std::vector<AlternateGroup> list_groups(const std::string & organization_id) const override;
  bool update_group(const AlternateGroup & group) override;
  bool delete_group(const std::string & group_id) override;

  void insert_member(const AlternateGroupMember & member) override;
  std::optional<AlternateGroupMember> get_member(const std::string & member_id) const override;
  bool delete_member(const std::string & member_id) override;
  std::vector<AlternateGroupMember> list_members(const std::string & group_id,
                                                 const CancellationToken * cancel = nullptr) const override;
  std::vector<std::string> find_group_ids_by_members(const std::vector<std::string> & identifier_ids,
                                                     const std::vector<std::string> & inventory_item_ids,
                                                     const CancellationToken * cancel = nullptr) const override;

 private:
  /// Throws UniqueViolationException if an equivalent rule is stored. Caller holds mutex_.
  void check_rule_unique(const CompatibilityRule & rule) const;

  /// Member plus insertion sequence (tie breaker for equal creation times)
  struct MemberEntry {
    AlternateGroupMember member;
    uint64_t sequence{0};
  };

  mutable std::mutex mutex_;
  std::map<std::string, InventoryItem> items_;
  std::map<std::string, Equipment> equipment_;
  std::map<std::string, CompatibilityRule> rules_;
  std::map<std::string, PartIdentifier> identifiers_;
  std::map<std::string, AlternateGroup> groups_;
  std::map<std::string, MemberEntry> members_;
  uint64_t next_member_sequence_{0};
};

}  // namespace parts_compat
