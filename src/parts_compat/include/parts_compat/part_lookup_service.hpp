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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "parts_compat/cancellation.hpp"
#include "parts_compat/errors.hpp"
#include "parts_compat/rule_matcher.hpp"
#include "parts_compat/storage/parts_storage.hpp"
#include "parts_compat/types.hpp"

namespace parts_compat {

/// Runtime lookups used by technicians: which parts can stand in for a part number or a
/// stocked item, and which stocked parts fit a given piece of equipment.
///
/// Lookups triggered by live typing take an optional cancellation token. When the token
/// fires before or during the query the lookup returns an empty list without logging.
/// Without a token every backend failure is logged and returned as TransientStore.
class PartLookupService {
 public:
  static constexpr int32_t kDefaultLowStockThreshold = 5;

  PartLookupService(std::shared_ptr<CatalogStore> catalog, std::shared_ptr<RuleStore> rules,
                    std::shared_ptr<AlternatesStore> alternates,
                    int32_t default_low_stock_threshold = kDefaultLowStockThreshold);

  /// All members of every group containing the part number (matched against identifiers
  /// and against item sku / external id). Blank input returns an empty list without querying.
  Result<std::vector<AlternateResult>> get_alternates_for_part_number(const std::string & organization_id,
                                                                      const std::string & part_number,
                                                                      const CancellationToken * cancel = nullptr) const;

  /// All members of every group containing the item, directly or through a linked identifier
  Result<std::vector<AlternateResult>> get_alternates_for_inventory_item(
      const std::string & organization_id, const std::string & item_id,
      const CancellationToken * cancel = nullptr) const;

  /// Stocked parts whose rules cover the manufacturer and model.
  /// Without a model only Any and Exact rules apply.
  Result<std::vector<CompatiblePart>> get_compatible_parts_for_make_model(
      const std::string & organization_id, const std::string & manufacturer,
      const std::optional<std::string> & model = std::nullopt) const;

  /// Same as the make/model lookup, for stored equipment records of the organization
  Result<std::vector<CompatiblePart>> get_compatible_parts_for_equipment(
      const std::string & organization_id, const std::vector<std::string> & equipment_ids) const;

 private:
  /// Decides AlternateResult::is_match for a built row
  using MatchPredicate = std::function<bool(const AlternateResult &)>;

  /// Build one row per member of the given groups (groups of other organizations are skipped)
  std::vector<AlternateResult> collect_group_rows(const std::string & organization_id,
                                                  const std::vector<std::string> & group_ids,
                                                  const MatchPredicate & is_match,
                                                  const CancellationToken * cancel) const;

  /// Compatible parts for a list of (manufacturer, model) targets, one row per item
  std::vector<CompatiblePart> collect_compatible(const std::string & organization_id,
                                                 const std::vector<std::pair<std::string, std::string>> & targets) const;

  std::shared_ptr<CatalogStore> catalog_;
  std::shared_ptr<RuleStore> rules_;
  std::shared_ptr<AlternatesStore> alternates_;
  int32_t default_low_stock_threshold_;
  RuleMatcher matcher_;
};

}  // namespace parts_compat
