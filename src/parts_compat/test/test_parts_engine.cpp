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

#include <filesystem>
#include <random>
#include <stdexcept>

#include "parts_compat/json_serialization.hpp"
#include "parts_compat/parts_engine.hpp"
#include "parts_compat/storage/in_memory_parts_storage.hpp"

using namespace parts_compat;

class PartsEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;
    temp_dir_ = std::filesystem::temp_directory_path() / ("test_parts_engine_" + std::to_string(dist(gen)));
  }

  void TearDown() override {
    std::filesystem::remove_all(temp_dir_);
  }

  static void seed_catalog(PartsEngine & engine) {
    InventoryItem item;
    item.id = "item-1";
    item.organization_id = "org-a";
    item.name = "Track Roller";
    item.sku = "TR-100";
    item.quantity_on_hand = 2;
    engine.catalog_writer().upsert_inventory_item(item);
    engine.catalog_writer().upsert_equipment({"eq-1", "org-a", "CAT", "D6T"});
    engine.catalog_writer().upsert_equipment({"eq-2", "org-a", "CAT", "D8T"});
  }

  std::filesystem::path temp_dir_;
};

TEST_F(PartsEngineTest, InvalidConfigRejected) {
  EngineConfig config;
  config.storage.type = "redis";
  EXPECT_THROW(PartsEngine::create(config), std::invalid_argument);
}

TEST_F(PartsEngineTest, MemoryEngineEndToEnd) {
  auto config = parse_config_string("parts_compat:\n  storage:\n    type: memory\n");
  auto engine = PartsEngine::create(config);
  ASSERT_NE(engine, nullptr);
  seed_catalog(*engine);

  auto payload = parse_rule_payload(R"([{"manufacturer": "CAT", "model": "D*T", "match_type": "wildcard"}])");
  ASSERT_TRUE(payload.has_value());

  auto preview = engine->match_counter().count_matches("org-a", *payload);
  ASSERT_TRUE(preview.has_value());
  EXPECT_EQ(*preview, 2u);

  auto stored = engine->rules().bulk_set_rules("org-a", "item-1", *payload);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, 1u);

  auto parts = engine->lookup().get_compatible_parts_for_equipment("org-a", {"eq-2"});
  ASSERT_TRUE(parts.has_value());
  ASSERT_EQ(parts->size(), 1u);
  EXPECT_EQ((*parts)[0].inventory_item_id, "item-1");

  PartIdentifierInput pn;
  pn.raw_value = "1R-0750";
  pn.inventory_item_id = "item-1";
  auto identifier = engine->identifiers().create("org-a", "user-1", pn);
  ASSERT_TRUE(identifier.has_value());

  AlternateGroupInput group_input;
  group_input.name = "Rollers";
  auto group = engine->groups().create_group("org-a", "user-1", group_input);
  ASSERT_TRUE(group.has_value());
  ASSERT_TRUE(engine->groups().add_identifier_to_group("org-a", group->id, identifier->id).has_value());

  auto alternates = engine->lookup().get_alternates_for_part_number("org-a", "1r-0750");
  ASSERT_TRUE(alternates.has_value());
  ASSERT_EQ(alternates->size(), 1u);
  EXPECT_TRUE((*alternates)[0].is_match);
  EXPECT_EQ((*alternates)[0].inventory_name, "Track Roller");
}

TEST_F(PartsEngineTest, SqliteEngineCreatesDirectoryAndPersists) {
  EngineConfig config;
  config.storage.type = "sqlite";
  config.storage.database_path = (temp_dir_ / "nested" / "parts.db").string();
  config.lookup.search_result_limit = 1;

  {
    auto engine = PartsEngine::create(config);
    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "nested"));
    seed_catalog(*engine);
    RuleInput input;
    input.manufacturer = "CAT";
    ASSERT_TRUE(engine->rules().add_rule("org-a", "item-1", input).has_value());

    for (const char * value : {"TR-1", "TR-2"}) {
      PartIdentifierInput pn;
      pn.raw_value = value;
      ASSERT_TRUE(engine->identifiers().create("org-a", "user-1", pn).has_value());
    }
  }

  auto reopened = PartsEngine::create(config);
  auto rules = reopened->rules().get_rules_for_item("org-a", "item-1");
  ASSERT_TRUE(rules.has_value());
  ASSERT_EQ(rules->size(), 1u);
  EXPECT_EQ((*rules)[0].match_type, MatchType::Any);

  // Configured search limit reaches the registry
  auto found = reopened->identifiers().search("org-a", "tr-");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->size(), 1u);
}

TEST_F(PartsEngineTest, ConfiguredPatternLimitsApply) {
  EngineConfig config;
  config.storage.type = "memory";
  config.matching.wildcard_min_literal_chars = 4;
  auto engine = PartsEngine::create(config);
  seed_catalog(*engine);

  RuleInput input;
  input.manufacturer = "CAT";
  input.model = "D*T";
  input.match_type = MatchType::Wildcard;
  auto added = engine->rules().add_rule("org-a", "item-1", input);
  ASSERT_FALSE(added.has_value());
  EXPECT_EQ(added.error().issue, ValidationIssue::TooFewLiteralCharacters);

  // Preview ignores the rule that could never be stored
  auto preview = engine->match_counter().count_matches("org-a", {input});
  ASSERT_TRUE(preview.has_value());
  EXPECT_EQ(*preview, 0u);
}

TEST_F(PartsEngineTest, WithCallerStorage) {
  auto storage = std::make_shared<InMemoryPartsStorage>();
  auto engine = PartsEngine::with_storage(storage);
  seed_catalog(*engine);
  EXPECT_TRUE(storage->get_inventory_item("item-1").has_value());
  EXPECT_EQ(engine->config().lookup.default_low_stock_threshold, 5);
}

int main(int argc, char ** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
