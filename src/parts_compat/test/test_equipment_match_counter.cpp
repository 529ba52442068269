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

#include <atomic>
#include <memory>
#include <utility>
#include <vector>

#include "parts_compat/equipment_match_counter.hpp"
#include "parts_compat/storage/in_memory_parts_storage.hpp"

using namespace parts_compat;

namespace {

/// Catalog that counts equipment reads and can be told to fail
class CountingCatalog : public CatalogStore {
 public:
  explicit CountingCatalog(std::shared_ptr<CatalogStore> inner) : inner_(std::move(inner)) {
  }

  std::optional<InventoryItem> get_inventory_item(const std::string & item_id) const override {
    return inner_->get_inventory_item(item_id);
  }
  std::vector<InventoryItem> find_inventory_items_by_code(const std::string & organization_id,
                                                          const std::string & code_norm,
                                                          const CancellationToken * cancel) const override {
    return inner_->find_inventory_items_by_code(organization_id, code_norm, cancel);
  }
  std::vector<Equipment> list_equipment(const std::string & organization_id) const override {
    ++list_calls;
    if (fail) {
      throw StorageException("connection lost");
    }
    return inner_->list_equipment(organization_id);
  }
  std::vector<Equipment> get_equipment(const std::string & organization_id,
                                       const std::vector<std::string> & equipment_ids) const override {
    return inner_->get_equipment(organization_id, equipment_ids);
  }

  mutable std::atomic<int> list_calls{0};
  bool fail{false};

 private:
  std::shared_ptr<CatalogStore> inner_;
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

class EquipmentMatchCounterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    storage_ = std::make_shared<InMemoryPartsStorage>();
    storage_->upsert_equipment({"eq-1", "org-a", "Caterpillar", "D6T"});
    storage_->upsert_equipment({"eq-2", "org-a", "CATERPILLAR ", "D10T"});
    storage_->upsert_equipment({"eq-3", "org-a", "Caterpillar", "D6R"});
    storage_->upsert_equipment({"eq-4", "org-a", "Komatsu", "PC200-8"});
    storage_->upsert_equipment({"eq-5", "org-a", "Komatsu", "pc210"});
    storage_->upsert_equipment({"eq-6", "org-b", "Caterpillar", "D6T"});

    catalog_ = std::make_shared<CountingCatalog>(storage_);
    counter_ = std::make_unique<EquipmentMatchCounter>(catalog_);
  }

  std::shared_ptr<InMemoryPartsStorage> storage_;
  std::shared_ptr<CountingCatalog> catalog_;
  std::unique_ptr<EquipmentMatchCounter> counter_;
};

TEST_F(EquipmentMatchCounterTest, CountsDistinctEquipmentAcrossRules) {
  std::vector<RuleInput> rules = {rule_input("Caterpillar", std::string("D*T"), MatchType::Wildcard),
                                  rule_input("caterpillar", std::string("D6T")),
                                  rule_input("Komatsu", std::string("PC2"), MatchType::Prefix)};
  auto count = counter_->count_matches("org-a", rules);
  ASSERT_TRUE(count.has_value());
  // eq-1 matched twice but counted once
  EXPECT_EQ(*count, 4u);
}

TEST_F(EquipmentMatchCounterTest, AnyRuleCoversManufacturer) {
  auto count = counter_->count_matches("org-a", {rule_input("KOMATSU")});
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 2u);
}

TEST_F(EquipmentMatchCounterTest, ScopedToOrganization) {
  auto count = counter_->count_matches("org-b", {rule_input("Caterpillar")});
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 1u);
}

TEST_F(EquipmentMatchCounterTest, MatchingEquipmentList) {
  auto matched = counter_->matching_equipment("org-a", {rule_input("Caterpillar", std::string("D6"),
                                                                   MatchType::Prefix)});
  ASSERT_TRUE(matched.has_value());
  ASSERT_EQ(matched->size(), 2u);
  EXPECT_EQ((*matched)[0].id, "eq-1");
  EXPECT_EQ((*matched)[1].id, "eq-3");
}

TEST_F(EquipmentMatchCounterTest, EmptyInputSkipsQuery) {
  auto count = counter_->count_matches("org-a", {});
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 0u);
  EXPECT_EQ(catalog_->list_calls.load(), 0);
}

TEST_F(EquipmentMatchCounterTest, UnusableRulesIgnored) {
  std::vector<RuleInput> rules = {rule_input("  ", std::string("D6T")),
                                  rule_input("Caterpillar", std::string("*"), MatchType::Wildcard)};
  auto count = counter_->count_matches("org-a", rules);
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 0u);
  EXPECT_EQ(catalog_->list_calls.load(), 0);

  rules.push_back(rule_input("Komatsu", std::string("PC200-8")));
  count = counter_->count_matches("org-a", rules);
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 1u);
  EXPECT_EQ(catalog_->list_calls.load(), 1);
}

TEST_F(EquipmentMatchCounterTest, StoreFailureReported) {
  catalog_->fail = true;
  auto count = counter_->count_matches("org-a", {rule_input("Komatsu")});
  ASSERT_FALSE(count.has_value());
  EXPECT_EQ(count.error().code, ErrorCode::TransientStore);
}

int main(int argc, char ** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
