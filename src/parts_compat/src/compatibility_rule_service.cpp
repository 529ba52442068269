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

#include "parts_compat/compatibility_rule_service.hpp"

#include <set>
#include <utility>

#include "parts_compat/normalizer.hpp"
#include "parts_compat/time_utils.hpp"
#include "rcutils/logging_macros.h"

namespace parts_compat {

namespace {

constexpr const char * kItemAccessDenied = "Inventory item not found or access denied";
constexpr const char * kDuplicateRule = "This manufacturer/model combination already exists for this item";

}  // namespace

Result<CompatibilityRule> resolve_rule(const RuleInput & input, const PatternLimits & limits) {
  CompatibilityRule rule;
  rule.manufacturer = trim(input.manufacturer);
  if (rule.manufacturer.empty()) {
    return make_validation_error(ValidationIssue::EmptyManufacturer, "Manufacturer is required");
  }

  if (input.model && !is_blank(*input.model)) {
    rule.model = trim(*input.model);
  }

  if (input.match_type) {
    rule.match_type = *input.match_type;
    if (rule.match_type == MatchType::Exact && !rule.model) {
      rule.match_type = MatchType::Any;
    }
  } else {
    rule.match_type = rule.model ? MatchType::Exact : MatchType::Any;
  }

  auto valid = validate_pattern(rule.match_type, rule.model, limits);
  if (!valid) {
    return tl::make_unexpected(valid.error());
  }

  rule.manufacturer_norm = normalize(rule.manufacturer);
  if (rule.model) {
    rule.model_norm = normalize(*rule.model);
  }
  rule.status = input.status.value_or(VerificationStatus::Unverified);
  rule.notes = input.notes;
  return rule;
}

CompatibilityRuleService::CompatibilityRuleService(std::shared_ptr<CatalogStore> catalog,
                                                   std::shared_ptr<RuleStore> rules, PatternLimits limits)
  : catalog_(std::move(catalog)), rules_(std::move(rules)), limits_(limits) {
}

Result<InventoryItem> CompatibilityRuleService::check_item_access(const std::string & organization_id,
                                                                  const std::string & item_id) const {
  auto item = catalog_->get_inventory_item(item_id);
  if (!item || item->organization_id != organization_id) {
    RCUTILS_LOG_WARN_NAMED("compatibility_rule_service", "Denied access to item '%s' for organization '%s'",
                           item_id.c_str(), organization_id.c_str());
    return make_error(ErrorCode::AccessDenied, kItemAccessDenied);
  }
  return *item;
}

Result<std::vector<CompatibilityRule>> CompatibilityRuleService::get_rules_for_item(const std::string & organization_id,
                                                                                  const std::string & item_id) const {
  try {
    auto item = check_item_access(organization_id, item_id);
    if (!item) {
      return tl::make_unexpected(item.error());
    }
    return rules_->list_rules(item_id);
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("compatibility_rule_service", "Failed to load rules for item '%s': %s", item_id.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to load compatibility rules: ") + e.what());
  }
}

Result<CompatibilityRule> CompatibilityRuleService::add_rule(const std::string & organization_id,
                                                             const std::string & item_id, const RuleInput & input) {
  try {
    auto item = check_item_access(organization_id, item_id);
    if (!item) {
      return tl::make_unexpected(item.error());
    }

    auto rule = resolve_rule(input, limits_);
    if (!rule) {
      RCUTILS_LOG_DEBUG_NAMED("compatibility_rule_service", "Rejected rule for item '%s': %s", item_id.c_str(),
                              rule.error().message.c_str());
      return rule;
    }

    rule->id = generate_uuid();
    rule->inventory_item_id = item_id;
    rule->created_at_ns = get_wall_clock_ns();
    rules_->insert_rule(*rule);
    return rule;
  } catch (const UniqueViolationException & e) {
    RCUTILS_LOG_DEBUG_NAMED("compatibility_rule_service", "Duplicate rule for item '%s': %s", item_id.c_str(),
                            e.what());
    return make_error(ErrorCode::Duplicate, kDuplicateRule);
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("compatibility_rule_service", "Failed to add rule for item '%s': %s", item_id.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to add compatibility rule: ") + e.what());
  }
}

Result<void> CompatibilityRuleService::remove_rule(const std::string & organization_id, const std::string & rule_id) {
  try {
    auto rule = rules_->get_rule(rule_id);
    if (!rule) {
      return make_error(ErrorCode::NotFound, "Compatibility rule not found: " + rule_id);
    }

    auto item = check_item_access(organization_id, rule->inventory_item_id);
    if (!item) {
      return tl::make_unexpected(item.error());
    }

    if (!rules_->delete_rule(rule_id)) {
      return make_error(ErrorCode::NotFound, "Compatibility rule not found: " + rule_id);
    }
    return {};
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("compatibility_rule_service", "Failed to remove rule '%s': %s", rule_id.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to remove compatibility rule: ") + e.what());
  }
}

Result<size_t> CompatibilityRuleService::bulk_set_rules(const std::string & organization_id,
                                                        const std::string & item_id,
                                                        const std::vector<RuleInput> & inputs) {
  try {
    auto item = check_item_access(organization_id, item_id);
    if (!item) {
      return tl::make_unexpected(item.error());
    }

    std::vector<CompatibilityRule> resolved;
    std::set<std::pair<std::string, std::string>> seen;
    const int64_t now = get_wall_clock_ns();

    for (const auto & input : inputs) {
      // Incomplete rows from the editor
      if (is_blank(input.manufacturer)) {
        continue;
      }

      // First occurrence wins; later duplicates are dropped before validation
      if (!seen.emplace(normalize(input.manufacturer), input.model ? normalize(*input.model) : std::string()).second) {
        continue;
      }

      auto rule = resolve_rule(input, limits_);
      if (!rule) {
        RCUTILS_LOG_DEBUG_NAMED("compatibility_rule_service", "Rejected rule set for item '%s': %s", item_id.c_str(),
                                rule.error().message.c_str());
        return tl::make_unexpected(rule.error());
      }

      rule->id = generate_uuid();
      rule->inventory_item_id = item_id;
      rule->created_at_ns = now;
      resolved.push_back(std::move(*rule));
    }

    return rules_->replace_rules(item_id, resolved);
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("compatibility_rule_service", "Failed to replace rules for item '%s', rolled back: %s",
                            item_id.c_str(), e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to save compatibility rules: ") + e.what());
  }
}

}  // namespace parts_compat
