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

#include <memory>

#include "parts_compat/alternate_group_manager.hpp"
#include "parts_compat/compatibility_rule_service.hpp"
#include "parts_compat/engine_config.hpp"
#include "parts_compat/equipment_match_counter.hpp"
#include "parts_compat/part_identifier_registry.hpp"
#include "parts_compat/part_lookup_service.hpp"
#include "parts_compat/storage/parts_storage.hpp"

namespace parts_compat {

/// Entry point that owns the configured storage backend and wires every service over it
class PartsEngine {
 public:
  /// Build an engine from configuration.
  /// Creates the database directory for SQLite storage when it does not exist.
  /// @throws std::invalid_argument if the configuration does not validate
  /// @throws StorageException if the backend cannot be opened
  static std::unique_ptr<PartsEngine> create(const EngineConfig & config);

  /// Wire services over a caller-provided backend implementing every storage interface
  template <typename Storage>
  static std::unique_ptr<PartsEngine> with_storage(std::shared_ptr<Storage> storage,
                                                   const EngineConfig & config = EngineConfig{}) {
    return std::unique_ptr<PartsEngine>(new PartsEngine(storage, storage, storage, storage, config));
  }

  // Non-copyable, non-movable (services hold references into the shared storage)
  PartsEngine(const PartsEngine &) = delete;
  PartsEngine & operator=(const PartsEngine &) = delete;
  PartsEngine(PartsEngine &&) = delete;
  PartsEngine & operator=(PartsEngine &&) = delete;

  CompatibilityRuleService & rules() {
    return *rule_service_;
  }

  EquipmentMatchCounter & match_counter() {
    return *match_counter_;
  }

  AlternateGroupManager & groups() {
    return *group_manager_;
  }

  PartIdentifierRegistry & identifiers() {
    return *identifier_registry_;
  }

  PartLookupService & lookup() {
    return *lookup_service_;
  }

  /// Sync side for the external inventory and equipment records
  CatalogWriter & catalog_writer() {
    return *catalog_writer_;
  }

  const EngineConfig & config() const {
    return config_;
  }

 private:
  PartsEngine(std::shared_ptr<CatalogStore> catalog, std::shared_ptr<CatalogWriter> catalog_writer,
              std::shared_ptr<RuleStore> rules, std::shared_ptr<AlternatesStore> alternates,
              const EngineConfig & config);

  EngineConfig config_;
  std::shared_ptr<CatalogWriter> catalog_writer_;
  std::unique_ptr<CompatibilityRuleService> rule_service_;
  std::unique_ptr<EquipmentMatchCounter> match_counter_;
  std::unique_ptr<AlternateGroupManager> group_manager_;
  std::unique_ptr<PartIdentifierRegistry> identifier_registry_;
  std::unique_ptr<PartLookupService> lookup_service_;
};

}  // namespace parts_compat
