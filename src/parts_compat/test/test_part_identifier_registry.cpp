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
#include <cstdarg>
#include <memory>
#include <utility>

#include "parts_compat/part_identifier_registry.hpp"
#include "parts_compat/storage/in_memory_parts_storage.hpp"
#include "rcutils/logging.h"

using namespace parts_compat;

namespace {

std::atomic<int> g_error_logs{0};

void counting_output_handler(const rcutils_log_location_t *, int severity, const char *,
                             rcutils_time_point_value_t, const char *, va_list *) {
  if (severity >= RCUTILS_LOG_SEVERITY_ERROR) {
    ++g_error_logs;
  }
}

/// Alternates store whose search always reports an interrupted query.
/// When `fires` is set, the source is cancelled first, as the caller would before interrupting.
class InterruptedSearchStore : public InMemoryPartsStorage {
 public:
  std::vector<PartIdentifier> search_identifiers(const std::string &, const std::string &, size_t,
                                                 const CancellationToken *) const override {
    ++search_calls;
    if (fires != nullptr) {
      fires->cancel();
    }
    throw QueryCancelledException();
  }

  CancellationSource * fires{nullptr};
  mutable std::atomic<int> search_calls{0};
};

PartIdentifierInput identifier_input(const std::string & value, IdentifierType type = IdentifierType::Oem) {
  PartIdentifierInput input;
  input.identifier_type = type;
  input.raw_value = value;
  return input;
}

}  // namespace

class PartIdentifierRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(rcutils_logging_initialize(), RCUTILS_RET_OK);
    previous_handler_ = rcutils_logging_get_output_handler();
    rcutils_logging_set_output_handler(counting_output_handler);
    g_error_logs = 0;

    storage_ = std::make_shared<InMemoryPartsStorage>();
    InventoryItem item;
    item.id = "item-1";
    item.organization_id = "org-a";
    storage_->upsert_inventory_item(item);
    item.id = "item-b";
    item.organization_id = "org-b";
    storage_->upsert_inventory_item(item);

    registry_ = std::make_unique<PartIdentifierRegistry>(storage_, storage_, 3);
  }

  void TearDown() override {
    rcutils_logging_set_output_handler(previous_handler_);
  }

  rcutils_logging_output_handler_t previous_handler_{nullptr};
  std::shared_ptr<InMemoryPartsStorage> storage_;
  std::unique_ptr<PartIdentifierRegistry> registry_;
};

// ============================================================================
// create
// ============================================================================

TEST_F(PartIdentifierRegistryTest, CreateKeepsRawAndNormalizedValue) {
  PartIdentifierInput input = identifier_input("  1R-0750 ");
  input.manufacturer = " Caterpillar ";
  input.inventory_item_id = "item-1";
  auto identifier = registry_->create("org-a", "user-1", input);
  ASSERT_TRUE(identifier.has_value());
  EXPECT_EQ(identifier->raw_value, "1R-0750");
  EXPECT_EQ(identifier->norm_value, "1r-0750");
  EXPECT_EQ(identifier->manufacturer, "Caterpillar");
  EXPECT_EQ(identifier->inventory_item_id, "item-1");
  EXPECT_EQ(identifier->created_by, "user-1");
  EXPECT_TRUE(storage_->get_identifier(identifier->id).has_value());
}

TEST_F(PartIdentifierRegistryTest, CreateRejectsBlank) {
  auto identifier = registry_->create("org-a", "user-1", identifier_input("   "));
  ASSERT_FALSE(identifier.has_value());
  EXPECT_EQ(identifier.error().issue, ValidationIssue::EmptyIdentifier);
}

TEST_F(PartIdentifierRegistryTest, DuplicateWithinOrganization) {
  ASSERT_TRUE(registry_->create("org-a", "user-1", identifier_input("1R-0750")).has_value());
  auto duplicate = registry_->create("org-a", "user-1", identifier_input("1r-0750", IdentifierType::Aftermarket));
  ASSERT_FALSE(duplicate.has_value());
  EXPECT_EQ(duplicate.error().code, ErrorCode::Duplicate);
  EXPECT_EQ(duplicate.error().message, "This part number already exists");

  EXPECT_TRUE(registry_->create("org-b", "user-2", identifier_input("1R-0750")).has_value());
}

TEST_F(PartIdentifierRegistryTest, ForeignItemLinkDenied) {
  PartIdentifierInput input = identifier_input("1R-0750");
  input.inventory_item_id = "item-b";
  auto identifier = registry_->create("org-a", "user-1", input);
  ASSERT_FALSE(identifier.has_value());
  EXPECT_EQ(identifier.error().code, ErrorCode::AccessDenied);
}

// ============================================================================
// search
// ============================================================================

TEST_F(PartIdentifierRegistryTest, SearchSubstringCapped) {
  for (const char * value : {"RE-1001", "RE-1002", "AR-1003", "RE-1004", "XX-2000"}) {
    ASSERT_TRUE(registry_->create("org-a", "user-1", identifier_input(value)).has_value());
  }
  auto found = registry_->search("org-a", " 100");
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(found->size(), 3u);
  EXPECT_EQ((*found)[0].raw_value, "AR-1003");
  EXPECT_EQ((*found)[1].raw_value, "RE-1001");
  EXPECT_EQ((*found)[2].raw_value, "RE-1002");
}

TEST_F(PartIdentifierRegistryTest, BlankSearchReturnsEmpty) {
  ASSERT_TRUE(registry_->create("org-a", "user-1", identifier_input("RE-1001")).has_value());
  auto found = registry_->search("org-a", "  ");
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(found->empty());
}

TEST_F(PartIdentifierRegistryTest, CancelledSearchIsSilent) {
  auto store = std::make_shared<InterruptedSearchStore>();
  PartIdentifierRegistry registry(store, store);

  CancellationSource source;
  store->fires = &source;
  auto token = source.token();
  auto found = registry.search("org-a", "re-", &token);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(found->empty());
  EXPECT_EQ(store->search_calls.load(), 1);
  EXPECT_EQ(g_error_logs.load(), 0);

  // Already fired: no query at all
  found = registry.search("org-a", "re-", &token);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(found->empty());
  EXPECT_EQ(store->search_calls.load(), 1);
  EXPECT_EQ(g_error_logs.load(), 0);
}

TEST_F(PartIdentifierRegistryTest, InterruptWithUnfiredTokenIsAnError) {
  auto store = std::make_shared<InterruptedSearchStore>();
  PartIdentifierRegistry registry(store, store);

  CancellationSource source;
  auto token = source.token();
  auto found = registry.search("org-a", "re-", &token);
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::TransientStore);
  EXPECT_EQ(g_error_logs.load(), 1);
}

TEST_F(PartIdentifierRegistryTest, InterruptWithoutTokenIsAnError) {
  auto store = std::make_shared<InterruptedSearchStore>();
  PartIdentifierRegistry registry(store, store);

  auto found = registry.search("org-a", "re-");
  ASSERT_FALSE(found.has_value());
  EXPECT_EQ(found.error().code, ErrorCode::TransientStore);
  EXPECT_EQ(g_error_logs.load(), 1);
}

int main(int argc, char ** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
