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

#include "parts_compat/part_lookup_service.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "parts_compat/normalizer.hpp"
#include "rcutils/logging_macros.h"

namespace parts_compat {

namespace {

/// Three-way compare of unit costs, unknown cost sorting last
int compare_cost(const std::optional<double> & a, const std::optional<double> & b) {
  if (a.has_value() != b.has_value()) {
    return a.has_value() ? -1 : 1;
  }
  if (!a || *a == *b) {
    return 0;
  }
  return *a < *b ? -1 : 1;
}

/// Three-way compare of display names, empty names sorting last
int compare_name(const std::string & a, const std::string & b) {
  if (a.empty() != b.empty()) {
    return a.empty() ? 1 : -1;
  }
  return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
}

/// Stock ordering shared by both alternate lookups: in stock, cheapest, name
bool stock_order_less(const AlternateResult & a, const AlternateResult & b) {
  if (a.is_in_stock != b.is_in_stock) {
    return a.is_in_stock;
  }
  if (int cost = compare_cost(a.default_unit_cost, b.default_unit_cost)) {
    return cost < 0;
  }
  return compare_name(a.inventory_name, b.inventory_name) < 0;
}

}  // namespace

PartLookupService::PartLookupService(std::shared_ptr<CatalogStore> catalog, std::shared_ptr<RuleStore> rules,
                                     std::shared_ptr<AlternatesStore> alternates,
                                     int32_t default_low_stock_threshold)
  : catalog_(std::move(catalog))
  , rules_(std::move(rules))
  , alternates_(std::move(alternates))
  , default_low_stock_threshold_(default_low_stock_threshold) {
}

std::vector<AlternateResult> PartLookupService::collect_group_rows(const std::string & organization_id,
                                                                   const std::vector<std::string> & group_ids,
                                                                   const MatchPredicate & is_match,
                                                                   const CancellationToken * cancel) const {
  std::vector<AlternateResult> rows;
  for (const auto & group_id : group_ids) {
    auto group = alternates_->get_group(group_id);
    if (!group || group->organization_id != organization_id) {
      continue;
    }

    for (const auto & member : alternates_->list_members(group_id, cancel)) {
      AlternateResult row;
      row.group_id = group->id;
      row.group_name = group->name;
      row.group_status = group->status;
      row.group_verified = group->status == VerificationStatus::Verified;
      row.group_notes = group->notes;
      row.is_primary = member.is_primary;

      std::optional<std::string> stock_item_id = member.inventory_item_id;
      if (member.part_identifier_id) {
        auto identifier = alternates_->get_identifier(*member.part_identifier_id);
        if (identifier) {
          row.identifier_id = identifier->id;
          row.identifier_type = identifier->identifier_type;
          row.identifier_value = identifier->raw_value;
          row.identifier_manufacturer = identifier->manufacturer;
          stock_item_id = identifier->inventory_item_id;
        }
      }

      if (stock_item_id) {
        auto item = catalog_->get_inventory_item(*stock_item_id);
        if (item && item->organization_id == organization_id) {
          row.inventory_item_id = item->id;
          row.inventory_name = item->name;
          row.inventory_sku = item->sku;
          row.quantity_on_hand = item->quantity_on_hand;
          row.low_stock_threshold = item->low_stock_threshold.value_or(default_low_stock_threshold_);
          row.default_unit_cost = item->default_unit_cost;
          row.location = item->location;
          row.image_url = item->image_url;
          row.is_in_stock = item->quantity_on_hand > 0;
          row.is_low_stock = item->quantity_on_hand <= row.low_stock_threshold;
        }
      }

      row.is_match = is_match(row);
      rows.push_back(std::move(row));
    }
  }
  return rows;
}

Result<std::vector<AlternateResult>> PartLookupService::get_alternates_for_part_number(
    const std::string & organization_id, const std::string & part_number, const CancellationToken * cancel) const {
  const std::string value_norm = normalize(part_number);
  if (value_norm.empty() || is_cancelled(cancel)) {
    return std::vector<AlternateResult>{};
  }

  try {
    std::set<std::string> identifier_ids;
    for (const auto & identifier : alternates_->find_identifiers_by_value(organization_id, value_norm, cancel)) {
      identifier_ids.insert(identifier.id);
    }
    std::set<std::string> item_ids;
    for (const auto & item : catalog_->find_inventory_items_by_code(organization_id, value_norm, cancel)) {
      item_ids.insert(item.id);
    }
    if (identifier_ids.empty() && item_ids.empty()) {
      return std::vector<AlternateResult>{};
    }

    auto group_ids = alternates_->find_group_ids_by_members({identifier_ids.begin(), identifier_ids.end()},
                                                            {item_ids.begin(), item_ids.end()}, cancel);
    auto rows = collect_group_rows(
        organization_id, group_ids,
        [&](const AlternateResult & row) {
          return (row.identifier_id && identifier_ids.count(*row.identifier_id) > 0) ||
                 (row.inventory_item_id && item_ids.count(*row.inventory_item_id) > 0);
        },
        cancel);

    if (is_cancelled(cancel)) {
      return std::vector<AlternateResult>{};
    }

    std::stable_sort(rows.begin(), rows.end(), [](const AlternateResult & a, const AlternateResult & b) {
      if (a.group_name != b.group_name) {
        return a.group_name < b.group_name;
      }
      if (a.is_primary != b.is_primary) {
        return a.is_primary;
      }
      return stock_order_less(a, b);
    });
    return rows;
  } catch (const QueryCancelledException & e) {
    // Interrupts this caller did not request are faults
    if (is_cancelled(cancel)) {
      return std::vector<AlternateResult>{};
    }
    RCUTILS_LOG_ERROR_NAMED("part_lookup_service", "Alternate lookup for '%s' failed: %s", part_number.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to look up alternates: ") + e.what());
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("part_lookup_service", "Alternate lookup for '%s' failed: %s", part_number.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to look up alternates: ") + e.what());
  }
}

Result<std::vector<AlternateResult>> PartLookupService::get_alternates_for_inventory_item(
    const std::string & organization_id, const std::string & item_id, const CancellationToken * cancel) const {
  if (is_cancelled(cancel)) {
    return std::vector<AlternateResult>{};
  }

  try {
    auto item = catalog_->get_inventory_item(item_id);
    if (!item || item->organization_id != organization_id) {
      RCUTILS_LOG_WARN_NAMED("part_lookup_service", "Denied alternate lookup for item '%s' in organization '%s'",
                             item_id.c_str(), organization_id.c_str());
      return make_error(ErrorCode::AccessDenied, "Inventory item not found or access denied");
    }

    std::vector<std::string> identifier_ids;
    for (const auto & identifier : alternates_->find_identifiers_by_item(item_id)) {
      if (identifier.organization_id == organization_id) {
        identifier_ids.push_back(identifier.id);
      }
    }

    auto group_ids = alternates_->find_group_ids_by_members(identifier_ids, {item_id}, cancel);
    auto rows = collect_group_rows(
        organization_id, group_ids,
        [&item_id](const AlternateResult & row) {
          return row.inventory_item_id && *row.inventory_item_id == item_id;
        },
        cancel);

    if (is_cancelled(cancel)) {
      return std::vector<AlternateResult>{};
    }

    std::stable_sort(rows.begin(), rows.end(), [](const AlternateResult & a, const AlternateResult & b) {
      if (a.group_name != b.group_name) {
        return a.group_name < b.group_name;
      }
      if (a.is_primary != b.is_primary) {
        return a.is_primary;
      }
      if (a.is_match != b.is_match) {
        return a.is_match;
      }
      return stock_order_less(a, b);
    });
    return rows;
  } catch (const QueryCancelledException & e) {
    if (is_cancelled(cancel)) {
      return std::vector<AlternateResult>{};
    }
    RCUTILS_LOG_ERROR_NAMED("part_lookup_service", "Alternate lookup for item '%s' failed: %s", item_id.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to look up alternates: ") + e.what());
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("part_lookup_service", "Alternate lookup for item '%s' failed: %s", item_id.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to look up alternates: ") + e.what());
  }
}

std::vector<CompatiblePart> PartLookupService::collect_compatible(
    const std::string & organization_id, const std::vector<std::pair<std::string, std::string>> & targets) const {
  std::map<std::string, std::vector<CompatibilityRule>> rules_by_manufacturer;
  // One rule per item, verified rules preferred
  std::map<std::string, CompatibilityRule> best_rule;

  for (const auto & [manufacturer, model] : targets) {
    const std::string manufacturer_norm = normalize(manufacturer);
    if (manufacturer_norm.empty()) {
      continue;
    }

    auto cached = rules_by_manufacturer.find(manufacturer_norm);
    if (cached == rules_by_manufacturer.end()) {
      cached = rules_by_manufacturer
                   .emplace(manufacturer_norm, rules_->find_rules_by_manufacturer(organization_id, manufacturer_norm))
                   .first;
    }

    const bool has_model = !is_blank(model);
    for (const auto & rule : cached->second) {
      bool matched = has_model
                         ? matcher_.matches(rule, manufacturer, model)
                         : rule.match_type == MatchType::Any || rule.match_type == MatchType::Exact;
      if (!matched) {
        continue;
      }
      auto it = best_rule.find(rule.inventory_item_id);
      if (it == best_rule.end()) {
        best_rule.emplace(rule.inventory_item_id, rule);
      } else if (rule.status == VerificationStatus::Verified && it->second.status != VerificationStatus::Verified) {
        it->second = rule;
      }
    }
  }

  std::vector<CompatiblePart> parts;
  for (const auto & [item_id, rule] : best_rule) {
    auto item = catalog_->get_inventory_item(item_id);
    if (!item || item->organization_id != organization_id) {
      continue;
    }
    CompatiblePart part;
    part.inventory_item_id = item->id;
    part.name = item->name;
    part.sku = item->sku;
    part.external_id = item->external_id;
    part.quantity_on_hand = item->quantity_on_hand;
    part.low_stock_threshold = item->low_stock_threshold.value_or(default_low_stock_threshold_);
    part.default_unit_cost = item->default_unit_cost;
    part.location = item->location;
    part.image_url = item->image_url;
    part.rule_match_type = rule.match_type;
    part.rule_status = rule.status;
    part.is_in_stock = item->quantity_on_hand > 0;
    part.is_verified = rule.status == VerificationStatus::Verified;
    parts.push_back(std::move(part));
  }

  std::stable_sort(parts.begin(), parts.end(), [](const CompatiblePart & a, const CompatiblePart & b) {
    if (a.is_verified != b.is_verified) {
      return a.is_verified;
    }
    if (a.is_in_stock != b.is_in_stock) {
      return a.is_in_stock;
    }
    if (int cost = compare_cost(a.default_unit_cost, b.default_unit_cost)) {
      return cost < 0;
    }
    return compare_name(a.name, b.name) < 0;
  });
  return parts;
}

Result<std::vector<CompatiblePart>> PartLookupService::get_compatible_parts_for_make_model(
    const std::string & organization_id, const std::string & manufacturer,
    const std::optional<std::string> & model) const {
  if (is_blank(manufacturer)) {
    return std::vector<CompatiblePart>{};
  }

  try {
    return collect_compatible(organization_id, {{manufacturer, model.value_or("")}});
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("part_lookup_service", "Compatible part lookup for '%s' failed: %s", manufacturer.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to look up compatible parts: ") + e.what());
  }
}

Result<std::vector<CompatiblePart>> PartLookupService::get_compatible_parts_for_equipment(
    const std::string & organization_id, const std::vector<std::string> & equipment_ids) const {
  if (equipment_ids.empty()) {
    return std::vector<CompatiblePart>{};
  }

  try {
    std::vector<std::pair<std::string, std::string>> targets;
    for (const auto & equipment : catalog_->get_equipment(organization_id, equipment_ids)) {
      targets.emplace_back(equipment.manufacturer, equipment.model);
    }
    return collect_compatible(organization_id, targets);
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("part_lookup_service", "Compatible part lookup for equipment failed: %s", e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to look up compatible parts: ") + e.what());
  }
}

}  // namespace parts_compat
