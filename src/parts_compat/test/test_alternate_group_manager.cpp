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

#include "parts_compat/alternate_group_manager.hpp"
#include "parts_compat/part_identifier_registry.hpp"
#include "parts_compat/storage/in_memory_parts_storage.hpp"

using namespace parts_compat;

class AlternateGroupManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    storage_ = std::make_shared<InMemoryPartsStorage>();
    add_item("item-1", "org-a", "Seal Kit", "SK-1", 4);
    add_item("item-2", "org-a", "Seal Kit HD", "SK-2", 0);
    add_item("item-b", "org-b", "Foreign Kit", "SK-9", 1);

    manager_ = std::make_unique<AlternateGroupManager>(storage_, storage_);
    registry_ = std::make_unique<PartIdentifierRegistry>(storage_, storage_);
  }

  void add_item(const std::string & id, const std::string & org, const std::string & name, const std::string & sku,
                int32_t quantity) {
    InventoryItem item;
    item.id = id;
    item.organization_id = org;
    item.name = name;
    item.sku = sku;
    item.quantity_on_hand = quantity;
    storage_->upsert_inventory_item(item);
  }

  AlternateGroup create(const std::string & name, std::optional<VerificationStatus> status = std::nullopt) {
    AlternateGroupInput input;
    input.name = name;
    input.status = status;
    auto group = manager_->create_group("org-a", "user-1", input);
    EXPECT_TRUE(group.has_value());
    return group ? *group : AlternateGroup{};
  }

  AlternateGroupPatch status_patch(VerificationStatus status) {
    AlternateGroupPatch patch;
    patch.status = status;
    return patch;
  }

  std::shared_ptr<InMemoryPartsStorage> storage_;
  std::unique_ptr<AlternateGroupManager> manager_;
  std::unique_ptr<PartIdentifierRegistry> registry_;
};

// ============================================================================
// Group lifecycle
// ============================================================================

TEST_F(AlternateGroupManagerTest, CreateGroupDefaults) {
  AlternateGroupInput input;
  input.name = "  Hydraulic seals ";
  input.description = "Interchangeable seal kits";
  auto group = manager_->create_group("org-a", "user-1", input);
  ASSERT_TRUE(group.has_value());
  EXPECT_EQ(group->name, "Hydraulic seals");
  EXPECT_EQ(group->status, VerificationStatus::Unverified);
  EXPECT_EQ(group->created_by, "user-1");
  EXPECT_FALSE(group->verified_by.has_value());
  EXPECT_EQ(group->organization_id, "org-a");
}

TEST_F(AlternateGroupManagerTest, CreateVerifiedStampsVerifier) {
  auto group = create("Seals", VerificationStatus::Verified);
  EXPECT_EQ(group.verified_by, "user-1");
  EXPECT_TRUE(group.verified_at_ns.has_value());
}

TEST_F(AlternateGroupManagerTest, CreateRequiresName) {
  AlternateGroupInput input;
  input.name = "   ";
  auto group = manager_->create_group("org-a", "user-1", input);
  ASSERT_FALSE(group.has_value());
  EXPECT_EQ(group.error().issue, ValidationIssue::EmptyName);
}

TEST_F(AlternateGroupManagerTest, VerifyStampsActor) {
  auto group = create("Seals");
  auto verified = manager_->update_group("org-a", "user-2", group.id, status_patch(VerificationStatus::Verified));
  ASSERT_TRUE(verified.has_value());
  EXPECT_EQ(verified->status, VerificationStatus::Verified);
  EXPECT_EQ(verified->verified_by, "user-2");
  ASSERT_TRUE(verified->verified_at_ns.has_value());

  auto reverified = manager_->update_group("org-a", "user-3", group.id, status_patch(VerificationStatus::Verified));
  ASSERT_TRUE(reverified.has_value());
  EXPECT_EQ(reverified->verified_by, "user-3");
  EXPECT_GE(*reverified->verified_at_ns, *verified->verified_at_ns);
}

TEST_F(AlternateGroupManagerTest, DeprecatedIsTerminal) {
  auto group = create("Seals", VerificationStatus::Verified);
  ASSERT_TRUE(
      manager_->update_group("org-a", "user-1", group.id, status_patch(VerificationStatus::Deprecated)).has_value());

  auto back = manager_->update_group("org-a", "user-1", group.id, status_patch(VerificationStatus::Verified));
  ASSERT_FALSE(back.has_value());
  EXPECT_EQ(back.error().issue, ValidationIssue::InvalidStatusTransition);

  // Same-status patches and non-status edits still work
  AlternateGroupPatch patch;
  patch.status = VerificationStatus::Deprecated;
  patch.notes = "Superseded by kit 2";
  auto edited = manager_->update_group("org-a", "user-1", group.id, patch);
  ASSERT_TRUE(edited.has_value());
  EXPECT_EQ(edited->notes, "Superseded by kit 2");
}

TEST_F(AlternateGroupManagerTest, VerifiedCannotReturnToUnverified) {
  auto group = create("Seals", VerificationStatus::Verified);
  auto result = manager_->update_group("org-a", "user-1", group.id, status_patch(VerificationStatus::Unverified));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().issue, ValidationIssue::InvalidStatusTransition);
}

TEST_F(AlternateGroupManagerTest, PatchKeepsUnsetFields) {
  AlternateGroupInput input;
  input.name = "Seals";
  input.description = "desc";
  input.evidence_url = "https://example.com/bulletin";
  auto group = manager_->create_group("org-a", "user-1", input);
  ASSERT_TRUE(group.has_value());

  AlternateGroupPatch patch;
  patch.name = "Seal kits";
  auto updated = manager_->update_group("org-a", "user-1", group->id, patch);
  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->name, "Seal kits");
  EXPECT_EQ(updated->description, "desc");
  EXPECT_EQ(updated->evidence_url, "https://example.com/bulletin");
  EXPECT_EQ(updated->status, VerificationStatus::Unverified);

  patch.name = " ";
  auto blank = manager_->update_group("org-a", "user-1", group->id, patch);
  ASSERT_FALSE(blank.has_value());
  EXPECT_EQ(blank.error().issue, ValidationIssue::EmptyName);
}

TEST_F(AlternateGroupManagerTest, CrossTenantGroupHidden) {
  auto group = create("Seals");

  auto read = manager_->get_group("org-b", group.id);
  ASSERT_FALSE(read.has_value());
  EXPECT_EQ(read.error().code, ErrorCode::NotFound);

  auto missing = manager_->get_group("org-a", "no-such-group");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

  auto update = manager_->update_group("org-b", "user-9", group.id, status_patch(VerificationStatus::Verified));
  ASSERT_FALSE(update.has_value());
  EXPECT_EQ(update.error().code, ErrorCode::AccessDenied);

  auto removal = manager_->delete_group("org-b", group.id);
  ASSERT_FALSE(removal.has_value());
  EXPECT_EQ(removal.error().code, ErrorCode::AccessDenied);
}

TEST_F(AlternateGroupManagerTest, ListGroupsByName) {
  create("Seals");
  create("Filters");
  auto groups = manager_->list_groups("org-a");
  ASSERT_TRUE(groups.has_value());
  ASSERT_EQ(groups->size(), 2u);
  EXPECT_EQ((*groups)[0].name, "Filters");
  EXPECT_TRUE(manager_->list_groups("org-b")->empty());
}

TEST_F(AlternateGroupManagerTest, DeleteGroupRemovesMembers) {
  auto group = create("Seals");
  ASSERT_TRUE(manager_->add_inventory_item_to_group("org-a", group.id, "item-1").has_value());
  ASSERT_TRUE(manager_->delete_group("org-a", group.id).has_value());
  EXPECT_TRUE(storage_->find_group_ids_by_members({}, {"item-1"}).empty());

  auto again = manager_->delete_group("org-a", group.id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

// ============================================================================
// Members
// ============================================================================

TEST_F(AlternateGroupManagerTest, MembersEnrichedAndOrdered) {
  PartIdentifierInput pn;
  pn.identifier_type = IdentifierType::Aftermarket;
  pn.raw_value = "AM-4410";
  pn.manufacturer = "Acme";
  pn.inventory_item_id = "item-2";
  auto identifier = registry_->create("org-a", "user-1", pn);
  ASSERT_TRUE(identifier.has_value());

  auto group = create("Seals");
  ASSERT_TRUE(manager_->add_identifier_to_group("org-a", group.id, identifier->id, "cross ref").has_value());
  ASSERT_TRUE(manager_->add_inventory_item_to_group("org-a", group.id, "item-1", true).has_value());

  auto loaded = manager_->get_group("org-a", group.id);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->members.size(), 2u);

  const auto & primary = loaded->members[0];
  EXPECT_TRUE(primary.is_primary);
  EXPECT_EQ(primary.inventory_item_id, "item-1");
  EXPECT_EQ(primary.inventory_name, "Seal Kit");
  EXPECT_EQ(primary.quantity_on_hand, 4);
  EXPECT_FALSE(primary.identifier_type.has_value());

  const auto & via_identifier = loaded->members[1];
  EXPECT_EQ(via_identifier.part_identifier_id, identifier->id);
  EXPECT_EQ(via_identifier.identifier_type, IdentifierType::Aftermarket);
  EXPECT_EQ(via_identifier.identifier_value, "AM-4410");
  EXPECT_EQ(via_identifier.identifier_manufacturer, "Acme");
  EXPECT_EQ(via_identifier.notes, "cross ref");
  // Stock fields come from the item the identifier is linked to
  EXPECT_EQ(via_identifier.inventory_name, "Seal Kit HD");
  EXPECT_EQ(via_identifier.inventory_sku, "SK-2");
}

TEST_F(AlternateGroupManagerTest, DuplicateMemberIsNoOp) {
  auto group = create("Seals");
  ASSERT_TRUE(manager_->add_inventory_item_to_group("org-a", group.id, "item-1").has_value());
  EXPECT_TRUE(manager_->add_inventory_item_to_group("org-a", group.id, "item-1", true).has_value());

  auto loaded = manager_->get_group("org-a", group.id);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->members.size(), 1u);
  EXPECT_FALSE(loaded->members[0].is_primary);
}

TEST_F(AlternateGroupManagerTest, MemberNeedsExactlyOneReference) {
  auto group = create("Seals");

  GroupMemberInput neither;
  auto result = manager_->add_member("org-a", group.id, neither);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().issue, ValidationIssue::InvalidMemberReference);

  GroupMemberInput both;
  both.inventory_item_id = "item-1";
  both.part_identifier_id = "id-1";
  result = manager_->add_member("org-a", group.id, both);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().issue, ValidationIssue::InvalidMemberReference);
}

TEST_F(AlternateGroupManagerTest, ForeignMemberReferencesDenied) {
  auto group = create("Seals");
  auto item = manager_->add_inventory_item_to_group("org-a", group.id, "item-b");
  ASSERT_FALSE(item.has_value());
  EXPECT_EQ(item.error().code, ErrorCode::AccessDenied);

  auto identifier = manager_->add_identifier_to_group("org-a", group.id, "no-such-identifier");
  ASSERT_FALSE(identifier.has_value());
  EXPECT_EQ(identifier.error().code, ErrorCode::AccessDenied);

  auto foreign_group = manager_->add_inventory_item_to_group("org-b", group.id, "item-b");
  ASSERT_FALSE(foreign_group.has_value());
  EXPECT_EQ(foreign_group.error().code, ErrorCode::AccessDenied);
}

TEST_F(AlternateGroupManagerTest, RemoveMember) {
  auto group = create("Seals");
  ASSERT_TRUE(manager_->add_inventory_item_to_group("org-a", group.id, "item-1").has_value());
  auto loaded = manager_->get_group("org-a", group.id);
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->members.size(), 1u);
  const std::string member_id = loaded->members[0].id;

  auto foreign = manager_->remove_member("org-b", member_id);
  ASSERT_FALSE(foreign.has_value());
  EXPECT_EQ(foreign.error().code, ErrorCode::AccessDenied);

  EXPECT_TRUE(manager_->remove_member("org-a", member_id).has_value());
  auto again = manager_->remove_member("org-a", member_id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

int main(int argc, char ** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
