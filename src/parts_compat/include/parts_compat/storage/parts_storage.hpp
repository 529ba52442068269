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
#include <vector>

#include "parts_compat/cancellation.hpp"
#include "parts_compat/storage/storage_exceptions.hpp"
#include "parts_compat/types.hpp"

namespace parts_compat {

// Storage contract shared by all interfaces below:
// - Backend failures throw StorageException.
// - Inserts that violate a unique constraint throw UniqueViolationException.
// - Methods taking a CancellationToken throw QueryCancelledException when the token
//   fires before or during the query. A null token is never treated as cancelled.
// - Stores persist what they are given; ids and timestamps are assigned by callers.

/// Read-only view of the Equipment and InventoryItem records owned by other subsystems
class CatalogStore {
 public:
  virtual ~CatalogStore() = default;

  /// Get an inventory item by id (any organization)
  virtual std::optional<InventoryItem> get_inventory_item(const std::string & item_id) const = 0;

  /// Find items of the organization whose normalized sku or external_id equals code_norm
  virtual std::vector<InventoryItem> find_inventory_items_by_code(const std::string & organization_id,
                                                                  const std::string & code_norm,
                                                                  const CancellationToken * cancel = nullptr) const = 0;

  /// List all equipment of an organization
  virtual std::vector<Equipment> list_equipment(const std::string & organization_id) const = 0;

  /// Get equipment records by id, restricted to the organization (unknown ids are skipped)
  virtual std::vector<Equipment> get_equipment(const std::string & organization_id,
                                               const std::vector<std::string> & equipment_ids) const = 0;

 protected:
  CatalogStore() = default;
  CatalogStore(const CatalogStore &) = default;
  CatalogStore & operator=(const CatalogStore &) = default;
  CatalogStore(CatalogStore &&) = default;
  CatalogStore & operator=(CatalogStore &&) = default;
};

/// Write side for the external records, used by whatever keeps the engine's copy in sync
class CatalogWriter {
 public:
  virtual ~CatalogWriter() = default;

  /// Insert or overwrite an inventory item by id
  virtual void upsert_inventory_item(const InventoryItem & item) = 0;

  /// Insert or overwrite an equipment record by id
  virtual void upsert_equipment(const Equipment & equipment) = 0;

 protected:
  CatalogWriter() = default;
  CatalogWriter(const CatalogWriter &) = default;
  CatalogWriter & operator=(const CatalogWriter &) = default;
  CatalogWriter(CatalogWriter &&) = default;
  CatalogWriter & operator=(CatalogWriter &&) = default;
};

/// Persistence of compatibility rules
class RuleStore {
 public:
  virtual ~RuleStore() = default;

  /// Rules of an item ordered by manufacturer, then model (rules without model last)
  virtual std::vector<CompatibilityRule> list_rules(const std::string & item_id) const = 0;

  virtual std::optional<CompatibilityRule> get_rule(const std::string & rule_id) const = 0;

  /// Insert a rule
  /// @throws UniqueViolationException if (item, manufacturer_norm, model_norm, match_type) exists
  virtual void insert_rule(const CompatibilityRule & rule) = 0;

  /// Delete a rule
  /// @return true if the rule existed
  virtual bool delete_rule(const std::string & rule_id) = 0;

  /// Atomically replace every rule of an item.
  /// Concurrent readers observe either the old or the new complete set. If any insert
  /// fails the old set is restored and the exception is rethrown.
  /// @return Number of rules stored
  virtual size_t replace_rules(const std::string & item_id, const std::vector<CompatibilityRule> & rules) = 0;

  /// Rules with the given manufacturer_norm whose item belongs to the organization
  virtual std::vector<CompatibilityRule> find_rules_by_manufacturer(const std::string & organization_id,
                                                                    const std::string & manufacturer_norm) const = 0;

 protected:
  RuleStore() = default;
  RuleStore(const RuleStore &) = default;
  RuleStore & operator=(const RuleStore &) = default;
  RuleStore(RuleStore &&) = default;
  RuleStore & operator=(RuleStore &&) = default;
};

/// Persistence of part identifiers, alternate groups and group members
class AlternatesStore {
 public:
  virtual ~AlternatesStore() = default;

  // ---- Part identifiers ----

  /// @throws UniqueViolationException if (organization, norm_value) exists
  virtual void insert_identifier(const PartIdentifier & identifier) = 0;

  virtual std::optional<PartIdentifier> get_identifier(const std::string & identifier_id) const = 0;

  /// Identifiers of the organization whose norm_value equals value_norm
  virtual std::vector<PartIdentifier> find_identifiers_by_value(const std::string & organization_id,
                                                                const std::string & value_norm,
                                                                const CancellationToken * cancel = nullptr) const = 0;

  /// Identifiers linked to an inventory item
  virtual std::vector<PartIdentifier> find_identifiers_by_item(const std::string & inventory_item_id) const = 0;

  /// Identifiers of the organization whose norm_value contains term_norm, ordered by raw value
  virtual std::vector<PartIdentifier> search_identifiers(const std::string & organization_id,
                                                         const std::string & term_norm, size_t limit,
                                                         const CancellationToken * cancel = nullptr) const = 0;

  // ---- Groups ----

  virtual void insert_group(const AlternateGroup & group) = 0;

  virtual std::optional<AlternateGroup> get_group(const std::string & group_id) const = 0;

  /// Groups of an organization ordered by name
  virtual std::vector<AlternateGroup> list_groups(const std::string & organization_id) const = 0;

  /// Overwrite a stored group
  /// @return true if the group existed
  virtual bool update_group(const AlternateGroup & group) = 0;

  /// Delete a group and all of its members
  /// @return true if the group existed
  virtual bool delete_group(const std::string & group_id) = 0;

  // ---- Members ----

  /// @throws UniqueViolationException if the group already references the identifier or item
  virtual void insert_member(const AlternateGroupMember & member) = 0;

  virtual std::optional<AlternateGroupMember> get_member(const std::string & member_id) const = 0;

  /// @return true if the member existed
  virtual bool delete_member(const std::string & member_id) = 0;

  /// Members of a group, primary first, then by creation time
  virtual std::vector<AlternateGroupMember> list_members(const std::string & group_id,
                                                         const CancellationToken * cancel = nullptr) const = 0;

  /// Distinct ids of groups with a member referencing any of the identifiers or items
  virtual std::vector<std::string> find_group_ids_by_members(const std::vector<std::string> & identifier_ids,
                                                             const std::vector<std::string> & inventory_item_ids,
                                                             const CancellationToken * cancel = nullptr) const = 0;

 protected:
  AlternatesStore() = default;
  AlternatesStore(const AlternatesStore &) = default;
  AlternatesStore & operator=(const AlternatesStore &) = default;
  AlternatesStore(AlternatesStore &&) = default;
  AlternatesStore & operator=(AlternatesStore &&) = default;
};

/// Generate a UUID v4 string
/// @return A new UUID in format "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
std::string generate_uuid();

}  // namespace parts_compat
