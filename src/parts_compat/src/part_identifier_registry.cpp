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

#include "parts_compat/part_identifier_registry.hpp"

#include <utility>

#include "parts_compat/normalizer.hpp"
#include "parts_compat/time_utils.hpp"
#include "rcutils/logging_macros.h"

namespace parts_compat {

PartIdentifierRegistry::PartIdentifierRegistry(std::shared_ptr<CatalogStore> catalog,
                                               std::shared_ptr<AlternatesStore> store, size_t search_limit)
  : catalog_(std::move(catalog)), store_(std::move(store)), search_limit_(search_limit) {
}

Result<PartIdentifier> PartIdentifierRegistry::create(const std::string & organization_id,
                                                      const std::string & actor_id,
                                                      const PartIdentifierInput & input) {
  PartIdentifier identifier;
  identifier.raw_value = trim(input.raw_value);
  if (identifier.raw_value.empty()) {
    RCUTILS_LOG_DEBUG_NAMED("part_identifier_registry", "Rejected blank part number");
    return make_validation_error(ValidationIssue::EmptyIdentifier, "Part number is required");
  }

  try {
    if (input.inventory_item_id && !is_blank(*input.inventory_item_id)) {
      auto item = catalog_->get_inventory_item(*input.inventory_item_id);
      if (!item || item->organization_id != organization_id) {
        RCUTILS_LOG_WARN_NAMED("part_identifier_registry", "Denied link to item '%s' for organization '%s'",
                               input.inventory_item_id->c_str(), organization_id.c_str());
        return make_error(ErrorCode::AccessDenied, "Inventory item not found or access denied");
      }
      identifier.inventory_item_id = item->id;
    }

    identifier.id = generate_uuid();
    identifier.organization_id = organization_id;
    identifier.identifier_type = input.identifier_type;
    identifier.norm_value = normalize(identifier.raw_value);
    identifier.manufacturer = trim(input.manufacturer);
    identifier.notes = input.notes;
    identifier.created_by = actor_id;
    identifier.created_at_ns = get_wall_clock_ns();
    store_->insert_identifier(identifier);
    return identifier;
  } catch (const UniqueViolationException & e) {
    RCUTILS_LOG_DEBUG_NAMED("part_identifier_registry", "Duplicate part number '%s': %s",
                            identifier.raw_value.c_str(), e.what());
    return make_error(ErrorCode::Duplicate, "This part number already exists");
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("part_identifier_registry", "Failed to create part number '%s': %s",
                            identifier.raw_value.c_str(), e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to create part identifier: ") + e.what());
  }
}

Result<std::vector<PartIdentifier>> PartIdentifierRegistry::search(const std::string & organization_id,
                                                                   const std::string & term,
                                                                   const CancellationToken * cancel) const {
  const std::string term_norm = normalize(term);
  if (term_norm.empty() || is_cancelled(cancel)) {
    return std::vector<PartIdentifier>{};
  }

  try {
    auto found = store_->search_identifiers(organization_id, term_norm, search_limit_, cancel);
    if (is_cancelled(cancel)) {
      return std::vector<PartIdentifier>{};
    }
    return found;
  } catch (const QueryCancelledException & e) {
    // Interrupts this caller did not request are faults
    if (is_cancelled(cancel)) {
      return std::vector<PartIdentifier>{};
    }
    RCUTILS_LOG_ERROR_NAMED("part_identifier_registry", "Part number search failed: %s", e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to search part identifiers: ") + e.what());
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("part_identifier_registry", "Part number search failed: %s", e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to search part identifiers: ") + e.what());
  }
}

}  // namespace parts_compat
