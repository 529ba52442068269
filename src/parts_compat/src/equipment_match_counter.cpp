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

#include "parts_compat/equipment_match_counter.hpp"

#include <utility>

#include "parts_compat/compatibility_rule_service.hpp"
#include "parts_compat/normalizer.hpp"
#include "rcutils/logging_macros.h"

namespace parts_compat {

EquipmentMatchCounter::EquipmentMatchCounter(std::shared_ptr<CatalogStore> catalog, PatternLimits limits)
  : catalog_(std::move(catalog)), limits_(limits) {
}

std::vector<CompatibilityRule> EquipmentMatchCounter::usable_rules(const std::vector<RuleInput> & rules) const {
  std::vector<CompatibilityRule> usable;
  for (const auto & input : rules) {
    if (is_blank(input.manufacturer)) {
      continue;
    }
    auto rule = resolve_rule(input, limits_);
    if (rule) {
      usable.push_back(std::move(*rule));
    }
  }
  return usable;
}

Result<size_t> EquipmentMatchCounter::count_matches(const std::string & organization_id,
                                                    const std::vector<RuleInput> & rules) const {
  auto matched = matching_equipment(organization_id, rules);
  if (!matched) {
    return tl::make_unexpected(matched.error());
  }
  return matched->size();
}

Result<std::vector<Equipment>> EquipmentMatchCounter::matching_equipment(const std::string & organization_id,
                                                                         const std::vector<RuleInput> & rules) const {
  auto usable = usable_rules(rules);
  if (usable.empty()) {
    return std::vector<Equipment>{};
  }

  try {
    std::vector<Equipment> matched;
    for (auto & equipment : catalog_->list_equipment(organization_id)) {
      if (matcher_.matches_any(usable, equipment.manufacturer, equipment.model)) {
        matched.push_back(std::move(equipment));
      }
    }
    return matched;
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("equipment_match_counter", "Failed to count matching equipment for organization '%s': %s",
                            organization_id.c_str(), e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to count matching equipment: ") + e.what());
  }
}

}  // namespace parts_compat
