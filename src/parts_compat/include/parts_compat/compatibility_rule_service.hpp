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
#include <string>
#include <vector>

#include "parts_compat/errors.hpp"
#include "parts_compat/pattern_validator.hpp"
#include "parts_compat/storage/parts_storage.hpp"
#include "parts_compat/types.hpp"

namespace parts_compat {

/// Normalize and validate a rule input into an unsaved rule.
///
/// Resolution:
/// - manufacturer and model are trimmed, a blank model counts as absent
/// - missing match type: Exact with a model, Any without one
/// - explicit Exact without a model becomes Any
/// - status defaults to Unverified
///
/// The returned rule has no id, item or creation time.
Result<CompatibilityRule> resolve_rule(const RuleInput & input, const PatternLimits & limits = {});

/// Owns the rule set of each inventory item: listing, single add/remove and the
/// atomic bulk replace. Every operation checks that the item belongs to the caller's
/// organization first.
class CompatibilityRuleService {
 public:
  CompatibilityRuleService(std::shared_ptr<CatalogStore> catalog, std::shared_ptr<RuleStore> rules,
                           PatternLimits limits = {});

  /// Rules of an item ordered by manufacturer, then model (rules without model last)
  Result<std::vector<CompatibilityRule>> get_rules_for_item(const std::string & organization_id,
                                                            const std::string & item_id) const;

  /// Validate and store a single rule
  /// @return The stored rule, or Duplicate if an equivalent rule exists for the item
  Result<CompatibilityRule> add_rule(const std::string & organization_id, const std::string & item_id,
                                     const RuleInput & input);

  Result<void> remove_rule(const std::string & organization_id, const std::string & rule_id);

  /// Replace the whole rule set of an item.
  ///
  /// Inputs with a blank manufacturer are dropped. The remaining inputs are validated
  /// (one invalid pattern rejects the call before anything is written) and
  /// deduplicated by normalized (manufacturer, model), keeping the first occurrence.
  /// The old set is swapped for the new one atomically.
  /// @return Number of rules stored
  Result<size_t> bulk_set_rules(const std::string & organization_id, const std::string & item_id,
                                const std::vector<RuleInput> & inputs);

  const PatternLimits & limits() const {
    return limits_;
  }

 private:
  /// AccessDenied unless the item exists and belongs to the organization
  Result<InventoryItem> check_item_access(const std::string & organization_id, const std::string & item_id) const;

  std::shared_ptr<CatalogStore> catalog_;
  std::shared_ptr<RuleStore> rules_;
  PatternLimits limits_;
};

}  // namespace parts_compat
