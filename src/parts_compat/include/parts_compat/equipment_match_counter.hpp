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
#include "parts_compat/rule_matcher.hpp"
#include "parts_compat/storage/parts_storage.hpp"

namespace parts_compat {

/// Previews how many fleet units a candidate rule set would cover before it is saved.
/// Inputs that could never be stored (blank manufacturer, invalid pattern) are ignored.
class EquipmentMatchCounter {
 public:
  explicit EquipmentMatchCounter(std::shared_ptr<CatalogStore> catalog, PatternLimits limits = {});

  /// Number of distinct equipment records of the organization matched by any rule.
  /// Returns 0 without reading equipment when no usable rule remains.
  Result<size_t> count_matches(const std::string & organization_id, const std::vector<RuleInput> & rules) const;

  /// Matched equipment records ordered by id
  Result<std::vector<Equipment>> matching_equipment(const std::string & organization_id,
                                                    const std::vector<RuleInput> & rules) const;

 private:
  std::vector<CompatibilityRule> usable_rules(const std::vector<RuleInput> & rules) const;

  std::shared_ptr<CatalogStore> catalog_;
  PatternLimits limits_;
  RuleMatcher matcher_;
};

}  // namespace parts_compat
