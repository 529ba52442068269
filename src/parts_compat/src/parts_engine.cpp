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

#include "parts_compat/parts_engine.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

#include "parts_compat/storage/in_memory_parts_storage.hpp"
#include "parts_compat/storage/sqlite_parts_storage.hpp"
#include "rcutils/logging_macros.h"

namespace parts_compat {

namespace {

void ensure_database_directory(const std::string & database_path) {
  if (database_path == ":memory:") {
    return;
  }

  std::filesystem::path db_path(database_path);
  auto parent_dir = db_path.parent_path();
  std::string parent_dir_str = parent_dir.string();
  if (!parent_dir_str.empty() && !std::filesystem::exists(parent_dir)) {
    try {
      std::filesystem::create_directories(parent_dir);
      RCUTILS_LOG_INFO_NAMED("parts_engine", "Created database directory: %s", parent_dir_str.c_str());
    } catch (const std::filesystem::filesystem_error & e) {
      RCUTILS_LOG_ERROR_NAMED("parts_engine", "Failed to create database directory for parts storage at '%s': %s",
                              parent_dir_str.c_str(), e.what());
      throw;
    }
  }
}

}  // namespace

std::unique_ptr<PartsEngine> PartsEngine::create(const EngineConfig & config) {
  auto validation = validate_config(config);
  for (const auto & warning : validation.warnings) {
    RCUTILS_LOG_WARN_NAMED("parts_engine", "Configuration warning: %s", warning.c_str());
  }
  if (!validation.valid) {
    std::string message = "Invalid parts_compat configuration:";
    for (const auto & error : validation.errors) {
      RCUTILS_LOG_ERROR_NAMED("parts_engine", "Configuration error: %s", error.c_str());
      message += " " + error + ";";
    }
    throw std::invalid_argument(message);
  }

  if (config.storage.type == "memory") {
    RCUTILS_LOG_INFO_NAMED("parts_engine", "Using in-memory parts storage");
    return with_storage(std::make_shared<InMemoryPartsStorage>(), config);
  }

  ensure_database_directory(config.storage.database_path);
  RCUTILS_LOG_INFO_NAMED("parts_engine", "Using SQLite parts storage: %s", config.storage.database_path.c_str());
  return with_storage(std::make_shared<SqlitePartsStorage>(config.storage.database_path), config);
}

PartsEngine::PartsEngine(std::shared_ptr<CatalogStore> catalog, std::shared_ptr<CatalogWriter> catalog_writer,
                         std::shared_ptr<RuleStore> rules, std::shared_ptr<AlternatesStore> alternates,
                         const EngineConfig & config)
  : config_(config), catalog_writer_(std::move(catalog_writer)) {
  const PatternLimits limits = config_.pattern_limits();
  rule_service_ = std::make_unique<CompatibilityRuleService>(catalog, rules, limits);
  match_counter_ = std::make_unique<EquipmentMatchCounter>(catalog, limits);
  group_manager_ = std::make_unique<AlternateGroupManager>(catalog, alternates);
  identifier_registry_ =
      std::make_unique<PartIdentifierRegistry>(catalog, alternates, config_.lookup.search_result_limit);
  lookup_service_ = std::make_unique<PartLookupService>(catalog, rules, alternates,
                                                        config_.lookup.default_low_stock_threshold);
}

}  // namespace parts_compat
