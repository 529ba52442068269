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

#include <sqlite3.h>

#include <mutex>
#include <string>
#include <vector>

#include "parts_compat/storage/parts_storage.hpp"

namespace parts_compat {

/// SQLite-based implementation of all storage interfaces with persistence
/// Thread-safe implementation using mutex protection
class SqlitePartsStorage : public CatalogStore,
                           public CatalogWriter,
                           public RuleStore,
                           public AlternatesStore {
 public:
  /// Create SQLite parts storage
  /// @param db_path Path to SQLite database file. Use ":memory:" for in-memory database.
  /// @throws StorageException if database cannot be opened or initialized
  explicit SqlitePartsStorage(const std::string & db_path);

  /// Destructor - closes database connection
  ~SqlitePartsStorage() override;

  // Non-copyable, non-movable (owns SQLite connection)
  SqlitePartsStorage(const SqlitePartsStorage &) = delete;
  SqlitePartsStorage & operator=(const SqlitePartsStorage &) = delete;
  SqlitePartsStorage(SqlitePartsStorage &&) = delete;
  SqlitePartsStorage & operator=(SqlitePartsStorage &&) = delete;

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

  /// Get the database path
  const std::string & db_path() const {
    return db_path_;
  }

 private:
  /// Initialize database schema
  void initialize_schema();

  /// Execute one or more statements without results
  /// @throws StorageException on failure
  void exec(const char * sql, const char * context);

  /// Insert one rule row. Caller holds mutex_.
  void insert_rule_locked(const CompatibilityRule & rule);

  std::string db_path_;
  sqlite3 * db_{nullptr};
  mutable std::mutex mutex_;
};

}  // namespace parts_compat
