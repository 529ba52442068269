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

#include "parts_compat/storage/sqlite_parts_storage.hpp"

#include <limits>
#include <set>
#include <sstream>

#include "rcutils/logging_macros.h"

namespace parts_compat {

namespace {

/// Number of SQLite VM instructions between cancellation checks
constexpr int kProgressCheckInterval = 100;

/// Translate a failed sqlite3_step result into the storage exception hierarchy
[[noreturn]] void throw_step_error(sqlite3 * db, int rc, const std::string & context) {
  if (rc == SQLITE_INTERRUPT) {
    throw QueryCancelledException();
  }
  const int extended = sqlite3_extended_errcode(db);
  if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
    throw UniqueViolationException(sqlite3_errmsg(db));
  }
  throw StorageException(context + ": " + sqlite3_errmsg(db));
}

/// RAII wrapper for SQLite statements
class SqliteStatement {
 public:
  SqliteStatement(sqlite3 * db, const char * sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StorageException(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }
  }

  SqliteStatement(sqlite3 * db, const std::string & sql) : SqliteStatement(db, sql.c_str()) {
  }

  ~SqliteStatement() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  SqliteStatement(const SqliteStatement &) = delete;
  SqliteStatement & operator=(const SqliteStatement &) = delete;

  void bind_text(int index, const std::string & value) {
    const auto size = value.size();
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
      throw StorageException("Failed to bind text: value size exceeds SQLite int length limit");
    }
    const auto length = static_cast<int>(size);
    if (sqlite3_bind_text(stmt_, index, value.c_str(), length, SQLITE_TRANSIENT) != SQLITE_OK) {
      throw StorageException(std::string("Failed to bind text: ") + sqlite3_errmsg(db_));
    }
  }

  void bind_optional_text(int index, const std::optional<std::string> & value) {
    if (value) {
      bind_text(index, *value);
    } else {
      bind_null(index);
    }
  }

  void bind_int(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
      throw StorageException(std::string("Failed to bind int: ") + sqlite3_errmsg(db_));
    }
  }

  void bind_int64(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
      throw StorageException(std::string("Failed to bind int64: ") + sqlite3_errmsg(db_));
    }
  }

  void bind_optional_int64(int index, const std::optional<int64_t> & value) {
    if (value) {
      bind_int64(index, *value);
    } else {
      bind_null(index);
    }
  }

  void bind_optional_double(int index, const std::optional<double> & value) {
    if (!value) {
      bind_null(index);
      return;
    }
    if (sqlite3_bind_double(stmt_, index, *value) != SQLITE_OK) {
      throw StorageException(std::string("Failed to bind double: ") + sqlite3_errmsg(db_));
    }
  }

  void bind_null(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
      throw StorageException(std::string("Failed to bind null: ") + sqlite3_errmsg(db_));
    }
  }

  int step() {
    return sqlite3_step(stmt_);
  }

  /// Step a statement that returns no rows
  void execute(const std::string & context) {
    const int rc = step();
    if (rc != SQLITE_DONE) {
      throw_step_error(db_, rc, context);
    }
  }

  bool column_is_null(int index) {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
  }

  std::string column_text(int index) {
    const auto * text = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, index));
    return text ? std::string(text) : std::string();
  }

  std::optional<std::string> column_optional_text(int index) {
    if (column_is_null(index)) {
      return std::nullopt;
    }
    return column_text(index);
  }

  int column_int(int index) {
    return sqlite3_column_int(stmt_, index);
  }

  int64_t column_int64(int index) {
    return sqlite3_column_int64(stmt_, index);
  }

  std::optional<int64_t> column_optional_int64(int index) {
    if (column_is_null(index)) {
      return std::nullopt;
    }
    return column_int64(index);
  }

  std::optional<double> column_optional_double(int index) {
    if (column_is_null(index)) {
      return std::nullopt;
    }
    return sqlite3_column_double(stmt_, index);
  }

 private:
  sqlite3 * db_;
  sqlite3_stmt * stmt_{nullptr};
};

/// Installs a progress handler that interrupts the running statement once the token fires
class CancellationGuard {
 public:
  CancellationGuard(sqlite3 * db, const CancellationToken * cancel) : db_(db), active_(cancel != nullptr) {
    if (is_cancelled(cancel)) {
      throw QueryCancelledException();
    }
    if (active_) {
      sqlite3_progress_handler(db_, kProgressCheckInterval, &CancellationGuard::on_progress,
                               const_cast<CancellationToken *>(cancel));
    }
  }

  ~CancellationGuard() {
    if (active_) {
      sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    }
  }

  CancellationGuard(const CancellationGuard &) = delete;
  CancellationGuard & operator=(const CancellationGuard &) = delete;

 private:
  static int on_progress(void * arg) {
    return static_cast<const CancellationToken *>(arg)->is_cancelled() ? 1 : 0;
  }

  sqlite3 * db_;
  bool active_;
};

void exec_or_throw(sqlite3 * db, const char * sql, const std::string & context) {
  char * err_msg = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    std::string error = err_msg ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    throw StorageException(context + ": " + error);
  }
}

/// RAII write transaction; rolls back unless committed
class SqliteTransaction {
 public:
  explicit SqliteTransaction(sqlite3 * db) : db_(db) {
    exec_or_throw(db_, "BEGIN IMMEDIATE;", "Failed to begin transaction");
  }

  ~SqliteTransaction() {
    if (committed_) {
      return;
    }
    char * err_msg = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
      RCUTILS_LOG_ERROR_NAMED("sqlite_parts_storage", "Failed to roll back transaction: %s",
                              err_msg ? err_msg : "Unknown error");
      sqlite3_free(err_msg);
    }
  }

  SqliteTransaction(const SqliteTransaction &) = delete;
  SqliteTransaction & operator=(const SqliteTransaction &) = delete;

  void commit() {
    exec_or_throw(db_, "COMMIT;", "Failed to commit transaction");
    committed_ = true;
  }

 private:
  sqlite3 * db_;
  bool committed_{false};
};

/// "?,?,?" with count placeholders
std::string placeholders(size_t count) {
  std::ostringstream oss;
  for (size_t i = 0; i < count; ++i) {
    oss << (i > 0 ? ",?" : "?");
  }
  return oss.str();
}

constexpr const char * kItemColumns =
    "id, organization_id, name, sku, external_id, quantity_on_hand, low_stock_threshold, default_unit_cost, "
    "location, image_url";

InventoryItem read_item(SqliteStatement & stmt) {
  InventoryItem item;
  item.id = stmt.column_text(0);
  item.organization_id = stmt.column_text(1);
  item.name = stmt.column_text(2);
  item.sku = stmt.column_text(3);
  item.external_id = stmt.column_text(4);
  item.quantity_on_hand = stmt.column_int(5);
  if (!stmt.column_is_null(6)) {
    item.low_stock_threshold = stmt.column_int(6);
  }
  item.default_unit_cost = stmt.column_optional_double(7);
  item.location = stmt.column_text(8);
  item.image_url = stmt.column_text(9);
  return item;
}

Equipment read_equipment(SqliteStatement & stmt) {
  Equipment equipment;
  equipment.id = stmt.column_text(0);
  equipment.organization_id = stmt.column_text(1);
  equipment.manufacturer = stmt.column_text(2);
  equipment.model = stmt.column_text(3);
  return equipment;
}

constexpr const char * kRuleColumns =
    "r.id, r.inventory_item_id, r.manufacturer, r.model, r.manufacturer_norm, r.model_norm, r.match_type, r.status, "
    "r.notes, r.created_at_ns";

// Rules without a model sort after rules with one
constexpr const char * kRuleOrder = "r.manufacturer_norm, r.model_norm IS NULL, r.model_norm, r.created_at_ns, r.id";

CompatibilityRule read_rule(SqliteStatement & stmt) {
  CompatibilityRule rule;
  rule.id = stmt.column_text(0);
  rule.inventory_item_id = stmt.column_text(1);
  rule.manufacturer = stmt.column_text(2);
  rule.model = stmt.column_optional_text(3);
  rule.manufacturer_norm = stmt.column_text(4);
  rule.model_norm = stmt.column_optional_text(5);
  rule.match_type = string_to_match_type(stmt.column_text(6));
  rule.status = string_to_verification_status(stmt.column_text(7));
  rule.notes = stmt.column_text(8);
  rule.created_at_ns = stmt.column_int64(9);
  return rule;
}

constexpr const char * kIdentifierColumns =
    "id, organization_id, identifier_type, raw_value, norm_value, manufacturer, inventory_item_id, notes, "
    "created_by, created_at_ns";

PartIdentifier read_identifier(SqliteStatement & stmt) {
  PartIdentifier identifier;
  identifier.id = stmt.column_text(0);
  identifier.organization_id = stmt.column_text(1);
  identifier.identifier_type = string_to_identifier_type(stmt.column_text(2));
  identifier.raw_value = stmt.column_text(3);
  identifier.norm_value = stmt.column_text(4);
  identifier.manufacturer = stmt.column_text(5);
  identifier.inventory_item_id = stmt.column_optional_text(6);
  identifier.notes = stmt.column_text(7);
  identifier.created_by = stmt.column_text(8);
  identifier.created_at_ns = stmt.column_int64(9);
  return identifier;
}

constexpr const char * kGroupColumns =
    "id, organization_id, name, description, status, notes, evidence_url, created_by, verified_by, verified_at_ns, "
    "created_at_ns, updated_at_ns";

AlternateGroup read_group(SqliteStatement & stmt) {
  AlternateGroup group;
  group.id = stmt.column_text(0);
  group.organization_id = stmt.column_text(1);
  group.name = stmt.column_text(2);
  group.description = stmt.column_text(3);
  group.status = string_to_verification_status(stmt.column_text(4));
  group.notes = stmt.column_text(5);
  group.evidence_url = stmt.column_text(6);
  group.created_by = stmt.column_text(7);
  group.verified_by = stmt.column_optional_text(8);
  group.verified_at_ns = stmt.column_optional_int64(9);
  group.created_at_ns = stmt.column_int64(10);
  group.updated_at_ns = stmt.column_int64(11);
  return group;
}

constexpr const char * kMemberColumns =
    "id, group_id, part_identifier_id, inventory_item_id, is_primary, notes, created_at_ns";

AlternateGroupMember read_member(SqliteStatement & stmt) {
  AlternateGroupMember member;
  member.id = stmt.column_text(0);
  member.group_id = stmt.column_text(1);
  member.part_identifier_id = stmt.column_optional_text(2);
  member.inventory_item_id = stmt.column_optional_text(3);
  member.is_primary = stmt.column_int(4) != 0;
  member.notes = stmt.column_text(5);
  member.created_at_ns = stmt.column_int64(6);
  return member;
}

}  // namespace

SqlitePartsStorage::SqlitePartsStorage(const std::string & db_path) : db_path_(db_path) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw StorageException("Failed to open database '" + db_path + "': " + error);
  }

  try {
    // Enable WAL mode for better concurrent performance
    exec("PRAGMA journal_mode=WAL;", "Failed to enable WAL mode");
    // Member and rule rows cascade with their parents
    exec("PRAGMA foreign_keys=ON;", "Failed to enable foreign keys");
    initialize_schema();
  } catch (const StorageException &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  // Set busy timeout to handle concurrent access
  sqlite3_busy_timeout(db_, 5000);
}

SqlitePartsStorage::~SqlitePartsStorage() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqlitePartsStorage::exec(const char * sql, const char * context) {
  exec_or_throw(db_, sql, context);
}

void SqlitePartsStorage::initialize_schema() {
  // External records mirrored from the inventory and equipment subsystems
  exec(R"(
    CREATE TABLE IF NOT EXISTS inventory_items (
      id TEXT PRIMARY KEY,
      organization_id TEXT NOT NULL,
      name TEXT NOT NULL DEFAULT '',
      sku TEXT NOT NULL DEFAULT '',
      external_id TEXT NOT NULL DEFAULT '',
      quantity_on_hand INTEGER NOT NULL DEFAULT 0,
      low_stock_threshold INTEGER,
      default_unit_cost REAL,
      location TEXT NOT NULL DEFAULT '',
      image_url TEXT NOT NULL DEFAULT ''
    );
    CREATE INDEX IF NOT EXISTS idx_inventory_items_org ON inventory_items(organization_id);

    CREATE TABLE IF NOT EXISTS equipment (
      id TEXT PRIMARY KEY,
      organization_id TEXT NOT NULL,
      manufacturer TEXT NOT NULL DEFAULT '',
      model TEXT NOT NULL DEFAULT ''
    );
    CREATE INDEX IF NOT EXISTS idx_equipment_org ON equipment(organization_id);
  )",
       "Failed to create catalog tables");

  exec(R"(
    CREATE TABLE IF NOT EXISTS part_compatibility_rules (
      id TEXT PRIMARY KEY,
      inventory_item_id TEXT NOT NULL REFERENCES inventory_items(id) ON DELETE CASCADE,
      manufacturer TEXT NOT NULL,
      model TEXT,
      manufacturer_norm TEXT NOT NULL,
      model_norm TEXT,
      match_type TEXT NOT NULL,
      status TEXT NOT NULL,
      notes TEXT NOT NULL DEFAULT '',
      created_at_ns INTEGER NOT NULL,
      CHECK ((model IS NULL) = (model_norm IS NULL))
    );
    CREATE UNIQUE INDEX IF NOT EXISTS idx_part_compatibility_rules_unique
      ON part_compatibility_rules(inventory_item_id, manufacturer_norm, IFNULL(model_norm, ''), match_type);
    CREATE INDEX IF NOT EXISTS idx_part_compatibility_rules_mfr ON part_compatibility_rules(manufacturer_norm);
  )",
       "Failed to create part_compatibility_rules table");

  exec(R"(
    CREATE TABLE IF NOT EXISTS part_identifiers (
      id TEXT PRIMARY KEY,
      organization_id TEXT NOT NULL,
      identifier_type TEXT NOT NULL,
      raw_value TEXT NOT NULL,
      norm_value TEXT NOT NULL,
      manufacturer TEXT NOT NULL DEFAULT '',
      inventory_item_id TEXT REFERENCES inventory_items(id) ON DELETE SET NULL,
      notes TEXT NOT NULL DEFAULT '',
      created_by TEXT NOT NULL DEFAULT '',
      created_at_ns INTEGER NOT NULL,
      UNIQUE (organization_id, norm_value)
    );
    CREATE INDEX IF NOT EXISTS idx_part_identifiers_item ON part_identifiers(inventory_item_id);
  )",
       "Failed to create part_identifiers table");

  exec(R"(
    CREATE TABLE IF NOT EXISTS part_alternate_groups (
      id TEXT PRIMARY KEY,
      organization_id TEXT NOT NULL,
      name TEXT NOT NULL,
      description TEXT NOT NULL DEFAULT '',
      status TEXT NOT NULL,
      notes TEXT NOT NULL DEFAULT '',
      evidence_url TEXT NOT NULL DEFAULT '',
      created_by TEXT NOT NULL DEFAULT '',
      verified_by TEXT,
      verified_at_ns INTEGER,
      created_at_ns INTEGER NOT NULL,
      updated_at_ns INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_part_alternate_groups_org ON part_alternate_groups(organization_id, name);

    CREATE TABLE IF NOT EXISTS part_alternate_group_members (
      id TEXT PRIMARY KEY,
      group_id TEXT NOT NULL REFERENCES part_alternate_groups(id) ON DELETE CASCADE,
      part_identifier_id TEXT REFERENCES part_identifiers(id) ON DELETE CASCADE,
      inventory_item_id TEXT REFERENCES inventory_items(id) ON DELETE CASCADE,
      is_primary INTEGER NOT NULL DEFAULT 0,
      notes TEXT NOT NULL DEFAULT '',
      created_at_ns INTEGER NOT NULL,
      CHECK ((part_identifier_id IS NULL) <> (inventory_item_id IS NULL)),
      UNIQUE (group_id, part_identifier_id),
      UNIQUE (group_id, inventory_item_id)
    );
    CREATE INDEX IF NOT EXISTS idx_part_alternate_group_members_identifier
      ON part_alternate_group_members(part_identifier_id);
    CREATE INDEX IF NOT EXISTS idx_part_alternate_group_members_item
      ON part_alternate_group_members(inventory_item_id);
  )",
       "Failed to create alternate group tables");
}

// ============================================================================
// Seeding helpers
// ============================================================================

void SqlitePartsStorage::upsert_inventory_item(const InventoryItem & item) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, R"(
    INSERT INTO inventory_items (id, organization_id, name, sku, external_id, quantity_on_hand,
                                 low_stock_threshold, default_unit_cost, location, image_url)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      organization_id = excluded.organization_id,
      name = excluded.name,
      sku = excluded.sku,
      external_id = excluded.external_id,
      quantity_on_hand = excluded.quantity_on_hand,
      low_stock_threshold = excluded.low_stock_threshold,
      default_unit_cost = excluded.default_unit_cost,
      location = excluded.location,
      image_url = excluded.image_url
  )");
  stmt.bind_text(1, item.id);
  stmt.bind_text(2, item.organization_id);
  stmt.bind_text(3, item.name);
  stmt.bind_text(4, item.sku);
  stmt.bind_text(5, item.external_id);
  stmt.bind_int(6, item.quantity_on_hand);
  if (item.low_stock_threshold) {
    stmt.bind_int(7, *item.low_stock_threshold);
  } else {
    stmt.bind_null(7);
  }
  stmt.bind_optional_double(8, item.default_unit_cost);
  stmt.bind_text(9, item.location);
  stmt.bind_text(10, item.image_url);
  stmt.execute("Failed to upsert inventory item");
}

void SqlitePartsStorage::upsert_equipment(const Equipment & equipment) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, R"(
    INSERT INTO equipment (id, organization_id, manufacturer, model) VALUES (?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      organization_id = excluded.organization_id,
      manufacturer = excluded.manufacturer,
      model = excluded.model
  )");
  stmt.bind_text(1, equipment.id);
  stmt.bind_text(2, equipment.organization_id);
  stmt.bind_text(3, equipment.manufacturer);
  stmt.bind_text(4, equipment.model);
  stmt.execute("Failed to upsert equipment");
}

// ============================================================================
// CatalogStore
// ============================================================================

std::optional<InventoryItem> SqlitePartsStorage::get_inventory_item(const std::string & item_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, std::string("SELECT ") + kItemColumns + " FROM inventory_items WHERE id = ?");
  stmt.bind_text(1, item_id);
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return read_item(stmt);
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to get inventory item");
  }
  return std::nullopt;
}

std::vector<InventoryItem> SqlitePartsStorage::find_inventory_items_by_code(const std::string & organization_id,
                                                                            const std::string & code_norm,
                                                                            const CancellationToken * cancel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  CancellationGuard guard(db_, cancel);

  // lower(trim(...)) mirrors normalize() for ASCII input
  SqliteStatement stmt(db_, std::string("SELECT ") + kItemColumns + R"( FROM inventory_items
    WHERE organization_id = ?1
      AND ((sku <> '' AND lower(trim(sku, char(32, 9, 10, 11, 12, 13))) = ?2)
        OR (external_id <> '' AND lower(trim(external_id, char(32, 9, 10, 11, 12, 13))) = ?2))
    ORDER BY id)");
  stmt.bind_text(1, organization_id);
  stmt.bind_text(2, code_norm);

  std::vector<InventoryItem> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_item(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to find inventory items by code");
  }
  return result;
}

std::vector<Equipment> SqlitePartsStorage::list_equipment(const std::string & organization_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(
      db_, "SELECT id, organization_id, manufacturer, model FROM equipment WHERE organization_id = ? ORDER BY id");
  stmt.bind_text(1, organization_id);

  std::vector<Equipment> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_equipment(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to list equipment");
  }
  return result;
}

std::vector<Equipment> SqlitePartsStorage::get_equipment(const std::string & organization_id,
                                                         const std::vector<std::string> & equipment_ids) const {
  std::set<std::string> wanted(equipment_ids.begin(), equipment_ids.end());
  if (wanted.empty()) {
    return {};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, "SELECT id, organization_id, manufacturer, model FROM equipment WHERE organization_id = ? "
                            "AND id IN (" + placeholders(wanted.size()) + ") ORDER BY id");
  stmt.bind_text(1, organization_id);
  int index = 2;
  for (const auto & id : wanted) {
    stmt.bind_text(index++, id);
  }

  std::vector<Equipment> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_equipment(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to get equipment");
  }
  return result;
}

// ============================================================================
// RuleStore
// ============================================================================

std::vector<CompatibilityRule> SqlitePartsStorage::list_rules(const std::string & item_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, std::string("SELECT ") + kRuleColumns +
                                " FROM part_compatibility_rules r WHERE r.inventory_item_id = ? ORDER BY " +
                                kRuleOrder);
  stmt.bind_text(1, item_id);

  std::vector<CompatibilityRule> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_rule(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to list rules");
  }
  return result;
}

std::optional<CompatibilityRule> SqlitePartsStorage::get_rule(const std::string & rule_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, std::string("SELECT ") + kRuleColumns + " FROM part_compatibility_rules r WHERE r.id = ?");
  stmt.bind_text(1, rule_id);
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return read_rule(stmt);
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to get rule");
  }
  return std::nullopt;
}

void SqlitePartsStorage::insert_rule_locked(const CompatibilityRule & rule) {
  SqliteStatement stmt(db_, R"(
    INSERT INTO part_compatibility_rules (id, inventory_item_id, manufacturer, model, manufacturer_norm, model_norm,
                                          match_type, status, notes, created_at_ns)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  stmt.bind_text(1, rule.id);
  stmt.bind_text(2, rule.inventory_item_id);
  stmt.bind_text(3, rule.manufacturer);
  stmt.bind_optional_text(4, rule.model);
  stmt.bind_text(5, rule.manufacturer_norm);
  stmt.bind_optional_text(6, rule.model_norm);
  stmt.bind_text(7, match_type_to_string(rule.match_type));
  stmt.bind_text(8, verification_status_to_string(rule.status));
  stmt.bind_text(9, rule.notes);
  stmt.bind_int64(10, rule.created_at_ns);
  stmt.execute("Failed to insert rule");
}

void SqlitePartsStorage::insert_rule(const CompatibilityRule & rule) {
  std::lock_guard<std::mutex> lock(mutex_);
  insert_rule_locked(rule);
}

bool SqlitePartsStorage::delete_rule(const std::string & rule_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, "DELETE FROM part_compatibility_rules WHERE id = ?");
  stmt.bind_text(1, rule_id);
  stmt.execute("Failed to delete rule");
  return sqlite3_changes(db_) > 0;
}

size_t SqlitePartsStorage::replace_rules(const std::string & item_id, const std::vector<CompatibilityRule> & rules) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteTransaction transaction(db_);

  SqliteStatement delete_stmt(db_, "DELETE FROM part_compatibility_rules WHERE inventory_item_id = ?");
  delete_stmt.bind_text(1, item_id);
  delete_stmt.execute("Failed to delete existing rules");

  for (const auto & rule : rules) {
    insert_rule_locked(rule);
  }

  transaction.commit();
  return rules.size();
}

std::vector<CompatibilityRule> SqlitePartsStorage::find_rules_by_manufacturer(
    const std::string & organization_id, const std::string & manufacturer_norm) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, std::string("SELECT ") + kRuleColumns + R"( FROM part_compatibility_rules r
    JOIN inventory_items i ON i.id = r.inventory_item_id
    WHERE i.organization_id = ? AND r.manufacturer_norm = ?
    ORDER BY )" + kRuleOrder);
  stmt.bind_text(1, organization_id);
  stmt.bind_text(2, manufacturer_norm);

  std::vector<CompatibilityRule> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_rule(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to find rules by manufacturer");
  }
  return result;
}

// ============================================================================
// AlternatesStore: identifiers
// ============================================================================

void SqlitePartsStorage::insert_identifier(const PartIdentifier & identifier) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, R"(
    INSERT INTO part_identifiers (id, organization_id, identifier_type, raw_value, norm_value, manufacturer,
                                  inventory_item_id, notes, created_by, created_at_ns)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  stmt.bind_text(1, identifier.id);
  stmt.bind_text(2, identifier.organization_id);
  stmt.bind_text(3, identifier_type_to_string(identifier.identifier_type));
  stmt.bind_text(4, identifier.raw_value);
  stmt.bind_text(5, identifier.norm_value);
  stmt.bind_text(6, identifier.manufacturer);
  stmt.bind_optional_text(7, identifier.inventory_item_id);
  stmt.bind_text(8, identifier.notes);
  stmt.bind_text(9, identifier.created_by);
  stmt.bind_int64(10, identifier.created_at_ns);
  stmt.execute("Failed to insert part identifier");
}

std::optional<PartIdentifier> SqlitePartsStorage::get_identifier(const std::string & identifier_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, std::string("SELECT ") + kIdentifierColumns + " FROM part_identifiers WHERE id = ?");
  stmt.bind_text(1, identifier_id);
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return read_identifier(stmt);
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to get part identifier");
  }
  return std::nullopt;
}

std::vector<PartIdentifier> SqlitePartsStorage::find_identifiers_by_value(const std::string & organization_id,
                                                                          const std::string & value_norm,
                                                                          const CancellationToken * cancel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  CancellationGuard guard(db_, cancel);
  SqliteStatement stmt(db_, std::string("SELECT ") + kIdentifierColumns +
                                " FROM part_identifiers WHERE organization_id = ? AND norm_value = ? ORDER BY id");
  stmt.bind_text(1, organization_id);
  stmt.bind_text(2, value_norm);

  std::vector<PartIdentifier> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_identifier(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to find part identifiers");
  }
  return result;
}

std::vector<PartIdentifier> SqlitePartsStorage::find_identifiers_by_item(const std::string & inventory_item_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, std::string("SELECT ") + kIdentifierColumns +
                                " FROM part_identifiers WHERE inventory_item_id = ? ORDER BY id");
  stmt.bind_text(1, inventory_item_id);

  std::vector<PartIdentifier> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_identifier(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to find part identifiers for item");
  }
  return result;
}

std::vector<PartIdentifier> SqlitePartsStorage::search_identifiers(const std::string & organization_id,
                                                                   const std::string & term_norm, size_t limit,
                                                                   const CancellationToken * cancel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  CancellationGuard guard(db_, cancel);
  SqliteStatement stmt(db_, std::string("SELECT ") + kIdentifierColumns + R"( FROM part_identifiers
    WHERE organization_id = ? AND instr(norm_value, ?) > 0
    ORDER BY raw_value, id
    LIMIT ?)");
  stmt.bind_text(1, organization_id);
  stmt.bind_text(2, term_norm);
  const auto max_limit = static_cast<size_t>(std::numeric_limits<int64_t>::max());
  stmt.bind_int64(3, static_cast<int64_t>(limit > max_limit ? max_limit : limit));

  std::vector<PartIdentifier> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_identifier(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to search part identifiers");
  }
  return result;
}

// ============================================================================
// AlternatesStore: groups
// ============================================================================

void SqlitePartsStorage::insert_group(const AlternateGroup & group) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, R"(
    INSERT INTO part_alternate_groups (id, organization_id, name, description, status, notes, evidence_url,
                                       created_by, verified_by, verified_at_ns, created_at_ns, updated_at_ns)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  stmt.bind_text(1, group.id);
  stmt.bind_text(2, group.organization_id);
  stmt.bind_text(3, group.name);
  stmt.bind_text(4, group.description);
  stmt.bind_text(5, verification_status_to_string(group.status));
  stmt.bind_text(6, group.notes);
  stmt.bind_text(7, group.evidence_url);
  stmt.bind_text(8, group.created_by);
  stmt.bind_optional_text(9, group.verified_by);
  stmt.bind_optional_int64(10, group.verified_at_ns);
  stmt.bind_int64(11, group.created_at_ns);
  stmt.bind_int64(12, group.updated_at_ns);
  stmt.execute("Failed to insert alternate group");
}

std::optional<AlternateGroup> SqlitePartsStorage::get_group(const std::string & group_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, std::string("SELECT ") + kGroupColumns + " FROM part_alternate_groups WHERE id = ?");
  stmt.bind_text(1, group_id);
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return read_group(stmt);
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to get alternate group");
  }
  return std::nullopt;
}

std::vector<AlternateGroup> SqlitePartsStorage::list_groups(const std::string & organization_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, std::string("SELECT ") + kGroupColumns +
                                " FROM part_alternate_groups WHERE organization_id = ? ORDER BY name, id");
  stmt.bind_text(1, organization_id);

  std::vector<AlternateGroup> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_group(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to list alternate groups");
  }
  return result;
}

bool SqlitePartsStorage::update_group(const AlternateGroup & group) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, R"(
    UPDATE part_alternate_groups
    SET name = ?, description = ?, status = ?, notes = ?, evidence_url = ?, verified_by = ?, verified_at_ns = ?,
        updated_at_ns = ?
    WHERE id = ?
  )");
  stmt.bind_text(1, group.name);
  stmt.bind_text(2, group.description);
  stmt.bind_text(3, verification_status_to_string(group.status));
  stmt.bind_text(4, group.notes);
  stmt.bind_text(5, group.evidence_url);
  stmt.bind_optional_text(6, group.verified_by);
  stmt.bind_optional_int64(7, group.verified_at_ns);
  stmt.bind_int64(8, group.updated_at_ns);
  stmt.bind_text(9, group.id);
  stmt.execute("Failed to update alternate group");
  return sqlite3_changes(db_) > 0;
}

bool SqlitePartsStorage::delete_group(const std::string & group_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, "DELETE FROM part_alternate_groups WHERE id = ?");
  stmt.bind_text(1, group_id);
  stmt.execute("Failed to delete alternate group");
  return sqlite3_changes(db_) > 0;
}

// ============================================================================
// AlternatesStore: members
// ============================================================================

void SqlitePartsStorage::insert_member(const AlternateGroupMember & member) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, R"(
    INSERT INTO part_alternate_group_members (id, group_id, part_identifier_id, inventory_item_id, is_primary, notes,
                                              created_at_ns)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )");
  stmt.bind_text(1, member.id);
  stmt.bind_text(2, member.group_id);
  stmt.bind_optional_text(3, member.part_identifier_id);
  stmt.bind_optional_text(4, member.inventory_item_id);
  stmt.bind_int(5, member.is_primary ? 1 : 0);
  stmt.bind_text(6, member.notes);
  stmt.bind_int64(7, member.created_at_ns);
  stmt.execute("Failed to insert alternate group member");
}

std::optional<AlternateGroupMember> SqlitePartsStorage::get_member(const std::string & member_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_,
                       std::string("SELECT ") + kMemberColumns + " FROM part_alternate_group_members WHERE id = ?");
  stmt.bind_text(1, member_id);
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return read_member(stmt);
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to get alternate group member");
  }
  return std::nullopt;
}

bool SqlitePartsStorage::delete_member(const std::string & member_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  SqliteStatement stmt(db_, "DELETE FROM part_alternate_group_members WHERE id = ?");
  stmt.bind_text(1, member_id);
  stmt.execute("Failed to delete alternate group member");
  return sqlite3_changes(db_) > 0;
}

std::vector<AlternateGroupMember> SqlitePartsStorage::list_members(const std::string & group_id,
                                                                   const CancellationToken * cancel) const {
  std::lock_guard<std::mutex> lock(mutex_);
  CancellationGuard guard(db_, cancel);
  SqliteStatement stmt(db_, std::string("SELECT ") + kMemberColumns + R"( FROM part_alternate_group_members
    WHERE group_id = ?
    ORDER BY is_primary DESC, created_at_ns ASC, rowid ASC)");
  stmt.bind_text(1, group_id);

  std::vector<AlternateGroupMember> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(read_member(stmt));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to list alternate group members");
  }
  return result;
}

std::vector<std::string> SqlitePartsStorage::find_group_ids_by_members(
    const std::vector<std::string> & identifier_ids, const std::vector<std::string> & inventory_item_ids,
    const CancellationToken * cancel) const {
  if (identifier_ids.empty() && inventory_item_ids.empty()) {
    return {};
  }

  std::string where;
  if (!identifier_ids.empty()) {
    where += "part_identifier_id IN (" + placeholders(identifier_ids.size()) + ")";
  }
  if (!inventory_item_ids.empty()) {
    if (!where.empty()) {
      where += " OR ";
    }
    where += "inventory_item_id IN (" + placeholders(inventory_item_ids.size()) + ")";
  }

  std::lock_guard<std::mutex> lock(mutex_);
  CancellationGuard guard(db_, cancel);
  SqliteStatement stmt(db_, "SELECT DISTINCT group_id FROM part_alternate_group_members WHERE " + where +
                                " ORDER BY group_id");
  int index = 1;
  for (const auto & id : identifier_ids) {
    stmt.bind_text(index++, id);
  }
  for (const auto & id : inventory_item_ids) {
    stmt.bind_text(index++, id);
  }

  std::vector<std::string> result;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    result.push_back(stmt.column_text(0));
  }
  if (rc != SQLITE_DONE) {
    throw_step_error(db_, rc, "Failed to find groups by member");
  }
  return result;
}

}  // namespace parts_compat
