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

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "parts_compat/compatibility_rule_service.hpp"
#include "parts_compat/storage/in_memory_parts_storage.hpp"

using namespace parts_compat;

namespace {

/// Rule store that delegates reads and fails every bulk replacement
class FailingReplaceRuleStore : public RuleStore {
 public:
  explicit FailingReplaceRuleStore(std::shared_ptr<RuleStore> inner) : inner_(std::move(inner)) {
  }

  std::vector<CompatibilityRule> list_rules(const std::string & item_id) const override {
    return inner_->list_rules(item_id);
  }
  std::optional<CompatibilityRule> get_rule(const std::string & rule_id) const override {
    return inner_->get_rule(rule_id);
  }
  void insert_rule(const CompatibilityRule & rule) override {
    inner_->insert_rule(rule);
  }
  bool delete_rule(const std::string & rule_id) override {
    return inner_->delete_rule(rule_id);
  }
  size_t replace_rules(const std::string &, const std::vector<CompatibilityRule> &) override {
    ++replace_calls;
    throw StorageException("disk I/O error");
  }
  std::vector<CompatibilityRule> find_rules_by_manufacturer(const std::string & organization_id,
                                                            const std::string & manufacturer_norm) const override {
    return inner_->find_rules_by_manufacturer(organization_id, manufacturer_norm);
  }

  int replace_calls{0};

 private:
  std::shared_ptr<RuleStore> inner_;
};

RuleInput rule_input(const std::string & manufacturer, const std::optional<std::string> & model = std::nullopt,
                     std::optional<MatchType> type = std::nullopt) {
  RuleInput input;
  input.manufacturer = manufacturer;
  input.model = model;
  input.match_type = type;
  return input;
}

}  // namespace

class CompatibilityRuleServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    storage_ = std::make_shared<InMemoryPartsStorage>();
    InventoryItem item;
    item.id = "item-1";
    item.organization_id = "org-a";
    item.name = "Track Roller";
    storage_->upsert_inventory_item(item);
    item.id = "item-b";
    item.organization_id = "org-b";
    storage_->upsert_inventory_item(item);

    service_ = std::make_unique<CompatibilityRuleService>(storage_, storage_);
  }

  std::shared_ptr<InMemoryPartsStorage> storage_;
  std::unique_ptr<CompatibilityRuleService> service_;
};

// ============================================================================
// resolve_rule
// ============================================================================

TEST_F(CompatibilityRuleServiceTest, ResolveDefaultsMatchType) {
  auto with_model = resolve_rule(rule_input(" CAT ", std::string(" D6T ")));
  ASSERT_TRUE(with_model.has_value());
  EXPECT_EQ(with_model->match_type, MatchType::Exact);
  EXPECT_EQ(with_model->manufacturer, "CAT");
  EXPECT_EQ(with_model->model, "D6T");
  EXPECT_EQ(with_model->manufacturer_norm, "cat");
  EXPECT_EQ(with_model->model_norm, "d6t");
  EXPECT_EQ(with_model->status, VerificationStatus::Unverified);

  auto without_model = resolve_rule(rule_input("CAT", std::string("  ")));
  ASSERT_TRUE(without_model.has_value());
  EXPECT_EQ(without_model->match_type, MatchType::Any);
  EXPECT_FALSE(without_model->model.has_value());
  EXPECT_FALSE(without_model->model_norm.has_value());
}

TEST_F(CompatibilityRuleServiceTest, ResolveExactWithoutModelBecomesAny) {
  auto rule = resolve_rule(rule_input("CAT", std::nullopt, MatchType::Exact));
  ASSERT_TRUE(rule.has_value());
  EXPECT_EQ(rule->match_type, MatchType::Any);
}

TEST_F(CompatibilityRuleServiceTest, ResolveRejectsBlankManufacturer) {
  auto rule = resolve_rule(rule_input("   ", std::string("D6T")));
  ASSERT_FALSE(rule.has_value());
  EXPECT_EQ(rule.error().code, ErrorCode::Validation);
  EXPECT_EQ(rule.error().issue, ValidationIssue::EmptyManufacturer);
}

TEST_F(CompatibilityRuleServiceTest, ResolveRejectsInvalidPattern) {
  auto rule = resolve_rule(rule_input("CAT", std::string("*"), MatchType::Wildcard));
  ASSERT_FALSE(rule.has_value());
  EXPECT_EQ(rule.error().issue, ValidationIssue::TooFewLiteralCharacters);

  auto prefix = resolve_rule(rule_input("JLG", std::string("JL-*"), MatchType::Prefix));
  ASSERT_FALSE(prefix.has_value());
  EXPECT_EQ(prefix.error().issue, ValidationIssue::WildcardNotAllowedInPrefix);
}

// ============================================================================
// Single rule operations
// ============================================================================

TEST_F(CompatibilityRuleServiceTest, AddAndListRule) {
  auto added = service_->add_rule("org-a", "item-1", rule_input("CAT", std::string("D6T")));
  ASSERT_TRUE(added.has_value()) << added.error().message;
  EXPECT_FALSE(added->id.empty());
  EXPECT_EQ(added->inventory_item_id, "item-1");
  EXPECT_GT(added->created_at_ns, 0);

  auto rules = service_->get_rules_for_item("org-a", "item-1");
  ASSERT_TRUE(rules.has_value());
  ASSERT_EQ(rules->size(), 1u);
  EXPECT_EQ((*rules)[0].id, added->id);
}

TEST_F(CompatibilityRuleServiceTest, AddDuplicateRule) {
  ASSERT_TRUE(service_->add_rule("org-a", "item-1", rule_input("CAT", std::string("D6T"))).has_value());
  auto duplicate = service_->add_rule("org-a", "item-1", rule_input("cat", std::string(" d6t")));
  ASSERT_FALSE(duplicate.has_value());
  EXPECT_EQ(duplicate.error().code, ErrorCode::Duplicate);
  EXPECT_EQ(duplicate.error().message, "This manufacturer/model combination already exists for this item");
}

TEST_F(CompatibilityRuleServiceTest, AddInvalidRuleStoresNothing) {
  auto added = service_->add_rule("org-a", "item-1", rule_input("CAT", std::string("A*B*C*"), MatchType::Wildcard));
  ASSERT_FALSE(added.has_value());
  EXPECT_EQ(added.error().issue, ValidationIssue::TooManyWildcards);
  EXPECT_TRUE(storage_->list_rules("item-1").empty());
}

TEST_F(CompatibilityRuleServiceTest, CrossTenantAccessDenied) {
  auto listed = service_->get_rules_for_item("org-a", "item-b");
  ASSERT_FALSE(listed.has_value());
  EXPECT_EQ(listed.error().code, ErrorCode::AccessDenied);

  auto added = service_->add_rule("org-a", "item-b", rule_input("CAT"));
  ASSERT_FALSE(added.has_value());
  EXPECT_EQ(added.error().code, ErrorCode::AccessDenied);

  auto missing = service_->add_rule("org-a", "no-such-item", rule_input("CAT"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ErrorCode::AccessDenied);
  EXPECT_EQ(missing.error().message, added.error().message);
}

TEST_F(CompatibilityRuleServiceTest, RemoveRule) {
  auto added = service_->add_rule("org-a", "item-1", rule_input("CAT"));
  ASSERT_TRUE(added.has_value());

  auto foreign = service_->remove_rule("org-b", added->id);
  ASSERT_FALSE(foreign.has_value());
  EXPECT_EQ(foreign.error().code, ErrorCode::AccessDenied);

  EXPECT_TRUE(service_->remove_rule("org-a", added->id).has_value());
  auto again = service_->remove_rule("org-a", added->id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

// ============================================================================
// Bulk replace
// ============================================================================

TEST_F(CompatibilityRuleServiceTest, BulkSetSkipsBlankAndDeduplicates) {
  ASSERT_TRUE(service_->add_rule("org-a", "item-1", rule_input("Volvo")).has_value());

  std::vector<RuleInput> inputs = {rule_input("CAT", std::string("D6T")), rule_input("  "),
                                   rule_input("cat", std::string("d6t ")), rule_input("Komatsu", std::string("PC"),
                                                                                      MatchType::Prefix)};
  auto stored = service_->bulk_set_rules("org-a", "item-1", inputs);
  ASSERT_TRUE(stored.has_value()) << stored.error().message;
  EXPECT_EQ(*stored, 2u);

  auto rules = storage_->list_rules("item-1");
  ASSERT_EQ(rules.size(), 2u);
  EXPECT_EQ(rules[0].manufacturer_norm, "cat");
  EXPECT_EQ(rules[0].model, "D6T");
  EXPECT_EQ(rules[1].manufacturer_norm, "komatsu");
  EXPECT_EQ(rules[1].match_type, MatchType::Prefix);
}

TEST_F(CompatibilityRuleServiceTest, BulkSetDropsDuplicateBeforeValidating) {
  // The later entry would fail as an Exact pattern, but it duplicates the first one
  std::vector<RuleInput> inputs = {rule_input("CAT", std::string("D*T"), MatchType::Wildcard),
                                   rule_input("cat", std::string("d*t"), MatchType::Exact)};
  auto stored = service_->bulk_set_rules("org-a", "item-1", inputs);
  ASSERT_TRUE(stored.has_value()) << stored.error().message;
  EXPECT_EQ(*stored, 1u);

  auto rules = storage_->list_rules("item-1");
  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].match_type, MatchType::Wildcard);
  EXPECT_EQ(rules[0].model, "D*T");
}

TEST_F(CompatibilityRuleServiceTest, BulkSetRejectsWholeSetOnInvalidEntry) {
  ASSERT_TRUE(service_->add_rule("org-a", "item-1", rule_input("Volvo")).has_value());

  std::vector<RuleInput> inputs = {rule_input("CAT", std::string("D6T")),
                                   rule_input("CAT", std::string("*-*"), MatchType::Wildcard)};
  auto stored = service_->bulk_set_rules("org-a", "item-1", inputs);
  ASSERT_FALSE(stored.has_value());
  EXPECT_EQ(stored.error().code, ErrorCode::Validation);
  EXPECT_EQ(stored.error().issue, ValidationIssue::TooFewLiteralCharacters);

  auto rules = storage_->list_rules("item-1");
  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].manufacturer, "Volvo");
}

TEST_F(CompatibilityRuleServiceTest, BulkSetEmptyClearsRules) {
  ASSERT_TRUE(service_->add_rule("org-a", "item-1", rule_input("Volvo")).has_value());
  auto stored = service_->bulk_set_rules("org-a", "item-1", {rule_input(""), rule_input(" ")});
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, 0u);
  EXPECT_TRUE(storage_->list_rules("item-1").empty());
}

TEST_F(CompatibilityRuleServiceTest, BulkSetStoreFailureKeepsOldRules) {
  auto failing = std::make_shared<FailingReplaceRuleStore>(storage_);
  CompatibilityRuleService service(storage_, failing);
  ASSERT_TRUE(service.add_rule("org-a", "item-1", rule_input("Volvo")).has_value());

  auto stored = service.bulk_set_rules("org-a", "item-1", {rule_input("CAT", std::string("D6T"))});
  ASSERT_FALSE(stored.has_value());
  EXPECT_EQ(stored.error().code, ErrorCode::TransientStore);
  EXPECT_EQ(failing->replace_calls, 1);

  auto rules = storage_->list_rules("item-1");
  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].manufacturer, "Volvo");
}

TEST_F(CompatibilityRuleServiceTest, BulkSetCrossTenantDenied) {
  auto stored = service_->bulk_set_rules("org-a", "item-b", {rule_input("CAT")});
  ASSERT_FALSE(stored.has_value());
  EXPECT_EQ(stored.error().code, ErrorCode::AccessDenied);
}

TEST_F(CompatibilityRuleServiceTest, ConfiguredLimitsApply) {
  CompatibilityRuleService strict(storage_, storage_, PatternLimits{4, 1});
  auto added = strict.add_rule("org-a", "item-1", rule_input("CAT", std::string("D*T"), MatchType::Wildcard));
  ASSERT_FALSE(added.has_value());
  EXPECT_EQ(added.error().issue, ValidationIssue::TooFewLiteralCharacters);
  EXPECT_EQ(strict.limits().min_literal_chars, 4u);
}

int main(int argc, char ** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
