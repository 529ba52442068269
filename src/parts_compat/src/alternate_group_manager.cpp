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

#include "parts_compat/alternate_group_manager.hpp"

#include <utility>

#include "parts_compat/normalizer.hpp"
#include "parts_compat/time_utils.hpp"
#include "rcutils/logging_macros.h"

namespace parts_compat {

namespace {

/// Check a status change. Same-status patches are allowed and handled by the caller.
Result<void> check_transition(VerificationStatus from, VerificationStatus to) {
  if (from == to) {
    return {};
  }
  if (from == VerificationStatus::Deprecated) {
    return make_validation_error(ValidationIssue::InvalidStatusTransition,
                                 "Deprecated groups cannot change status");
  }
  if (to == VerificationStatus::Unverified) {
    return make_validation_error(ValidationIssue::InvalidStatusTransition,
                                 "Cannot change status from " + verification_status_to_string(from) + " to " +
                                     verification_status_to_string(to));
  }
  return {};
}

}  // namespace

AlternateGroupManager::AlternateGroupManager(std::shared_ptr<CatalogStore> catalog,
                                             std::shared_ptr<AlternatesStore> store)
  : catalog_(std::move(catalog)), store_(std::move(store)) {
}

Result<AlternateGroup> AlternateGroupManager::load_owned_group(const std::string & organization_id,
                                                               const std::string & group_id) const {
  auto group = store_->get_group(group_id);
  if (!group) {
    return make_error(ErrorCode::NotFound, "Alternate group not found: " + group_id);
  }
  if (group->organization_id != organization_id) {
    RCUTILS_LOG_WARN_NAMED("alternate_group_manager", "Denied access to group '%s' for organization '%s'",
                           group_id.c_str(), organization_id.c_str());
    return make_error(ErrorCode::AccessDenied, "Alternate group not found or access denied");
  }
  return *group;
}

Result<AlternateGroup> AlternateGroupManager::create_group(const std::string & organization_id,
                                                           const std::string & actor_id,
                                                           const AlternateGroupInput & input) {
  AlternateGroup group;
  group.name = trim(input.name);
  if (group.name.empty()) {
    RCUTILS_LOG_DEBUG_NAMED("alternate_group_manager", "Rejected group without name");
    return make_validation_error(ValidationIssue::EmptyName, "Group name is required");
  }

  const int64_t now = get_wall_clock_ns();
  group.id = generate_uuid();
  group.organization_id = organization_id;
  group.description = input.description;
  group.status = input.status.value_or(VerificationStatus::Unverified);
  group.notes = input.notes;
  group.evidence_url = input.evidence_url;
  group.created_by = actor_id;
  group.created_at_ns = now;
  group.updated_at_ns = now;
  if (group.status == VerificationStatus::Verified) {
    group.verified_by = actor_id;
    group.verified_at_ns = now;
  }

  try {
    store_->insert_group(group);
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("alternate_group_manager", "Failed to create group '%s': %s", group.name.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to create alternate group: ") + e.what());
  }
  return group;
}

Result<AlternateGroup> AlternateGroupManager::update_group(const std::string & organization_id,
                                                           const std::string & actor_id,
                                                           const std::string & group_id,
                                                           const AlternateGroupPatch & patch) {
  try {
    auto loaded = load_owned_group(organization_id, group_id);
    if (!loaded) {
      return loaded;
    }
    AlternateGroup group = std::move(*loaded);
    const int64_t now = get_wall_clock_ns();

    if (patch.name) {
      std::string name = trim(*patch.name);
      if (name.empty()) {
        RCUTILS_LOG_DEBUG_NAMED("alternate_group_manager", "Rejected blank name for group '%s'", group_id.c_str());
        return make_validation_error(ValidationIssue::EmptyName, "Group name is required");
      }
      group.name = std::move(name);
    }

    if (patch.status) {
      auto allowed = check_transition(group.status, *patch.status);
      if (!allowed) {
        RCUTILS_LOG_DEBUG_NAMED("alternate_group_manager", "Rejected status change for group '%s': %s",
                                group_id.c_str(), allowed.error().message.c_str());
        return tl::make_unexpected(allowed.error());
      }
      if (*patch.status == VerificationStatus::Verified) {
        group.verified_by = actor_id;
        group.verified_at_ns = now;
      }
      group.status = *patch.status;
    }

    if (patch.description) {
      group.description = *patch.description;
    }
    if (patch.notes) {
      group.notes = *patch.notes;
    }
    if (patch.evidence_url) {
      group.evidence_url = *patch.evidence_url;
    }
    group.updated_at_ns = now;

    if (!store_->update_group(group)) {
      return make_error(ErrorCode::NotFound, "Alternate group not found: " + group_id);
    }
    return group;
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("alternate_group_manager", "Failed to update group '%s': %s", group_id.c_str(), e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to update alternate group: ") + e.what());
  }
}

Result<void> AlternateGroupManager::delete_group(const std::string & organization_id, const std::string & group_id) {
  try {
    auto group = load_owned_group(organization_id, group_id);
    if (!group) {
      return tl::make_unexpected(group.error());
    }
    if (!store_->delete_group(group_id)) {
      return make_error(ErrorCode::NotFound, "Alternate group not found: " + group_id);
    }
    return {};
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("alternate_group_manager", "Failed to delete group '%s': %s", group_id.c_str(), e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to delete alternate group: ") + e.what());
  }
}

AlternateGroupMemberView AlternateGroupManager::to_view(const AlternateGroupMember & member) const {
  AlternateGroupMemberView view;
  view.id = member.id;
  view.group_id = member.group_id;
  view.part_identifier_id = member.part_identifier_id;
  view.inventory_item_id = member.inventory_item_id;
  view.is_primary = member.is_primary;
  view.notes = member.notes;
  view.created_at_ns = member.created_at_ns;

  std::optional<std::string> stock_item_id = member.inventory_item_id;
  if (member.part_identifier_id) {
    if (auto identifier = store_->get_identifier(*member.part_identifier_id)) {
      view.identifier_type = identifier->identifier_type;
      view.identifier_value = identifier->raw_value;
      view.identifier_manufacturer = identifier->manufacturer;
      stock_item_id = identifier->inventory_item_id;
    }
  }

  if (stock_item_id) {
    if (auto item = catalog_->get_inventory_item(*stock_item_id)) {
      view.inventory_name = item->name;
      view.inventory_sku = item->sku;
      view.quantity_on_hand = item->quantity_on_hand;
    }
  }
  return view;
}

Result<AlternateGroupWithMembers> AlternateGroupManager::get_group(const std::string & organization_id,
                                                                   const std::string & group_id) const {
  try {
    auto group = store_->get_group(group_id);
    // Same answer for missing and foreign groups so ids of other tenants do not leak
    if (!group || group->organization_id != organization_id) {
      return make_error(ErrorCode::NotFound, "Alternate group not found: " + group_id);
    }

    AlternateGroupWithMembers result;
    result.group = std::move(*group);
    for (const auto & member : store_->list_members(group_id)) {
      result.members.push_back(to_view(member));
    }
    return result;
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("alternate_group_manager", "Failed to load group '%s': %s", group_id.c_str(), e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to load alternate group: ") + e.what());
  }
}

Result<std::vector<AlternateGroup>> AlternateGroupManager::list_groups(const std::string & organization_id) const {
  try {
    return store_->list_groups(organization_id);
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("alternate_group_manager", "Failed to list groups for organization '%s': %s",
                            organization_id.c_str(), e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to list alternate groups: ") + e.what());
  }
}

Result<void> AlternateGroupManager::add_member(const std::string & organization_id, const std::string & group_id,
                                               const GroupMemberInput & input) {
  const bool has_identifier = input.part_identifier_id && !is_blank(*input.part_identifier_id);
  const bool has_item = input.inventory_item_id && !is_blank(*input.inventory_item_id);
  if (has_identifier == has_item) {
    RCUTILS_LOG_DEBUG_NAMED("alternate_group_manager", "Rejected member for group '%s' without a single reference",
                            group_id.c_str());
    return make_validation_error(ValidationIssue::InvalidMemberReference,
                                 "A group member references either a part identifier or an inventory item");
  }

  try {
    auto group = load_owned_group(organization_id, group_id);
    if (!group) {
      return tl::make_unexpected(group.error());
    }

    AlternateGroupMember member;
    if (has_identifier) {
      auto identifier = store_->get_identifier(*input.part_identifier_id);
      if (!identifier || identifier->organization_id != organization_id) {
        RCUTILS_LOG_WARN_NAMED("alternate_group_manager", "Denied identifier '%s' for organization '%s'",
                               input.part_identifier_id->c_str(), organization_id.c_str());
        return make_error(ErrorCode::AccessDenied, "Part identifier not found or access denied");
      }
      member.part_identifier_id = identifier->id;
    } else {
      auto item = catalog_->get_inventory_item(*input.inventory_item_id);
      if (!item || item->organization_id != organization_id) {
        RCUTILS_LOG_WARN_NAMED("alternate_group_manager", "Denied item '%s' for organization '%s'",
                               input.inventory_item_id->c_str(), organization_id.c_str());
        return make_error(ErrorCode::AccessDenied, "Inventory item not found or access denied");
      }
      member.inventory_item_id = item->id;
    }

    member.id = generate_uuid();
    member.group_id = group_id;
    member.is_primary = input.is_primary;
    member.notes = input.notes;
    member.created_at_ns = get_wall_clock_ns();
    store_->insert_member(member);
    return {};
  } catch (const UniqueViolationException &) {
    // Already a member
    return {};
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("alternate_group_manager", "Failed to add member to group '%s': %s", group_id.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to add group member: ") + e.what());
  }
}

Result<void> AlternateGroupManager::add_identifier_to_group(const std::string & organization_id,
                                                            const std::string & group_id,
                                                            const std::string & identifier_id,
                                                            const std::string & notes) {
  GroupMemberInput input;
  input.part_identifier_id = identifier_id;
  input.notes = notes;
  return add_member(organization_id, group_id, input);
}

Result<void> AlternateGroupManager::add_inventory_item_to_group(const std::string & organization_id,
                                                                const std::string & group_id,
                                                                const std::string & inventory_item_id,
                                                                bool is_primary, const std::string & notes) {
  GroupMemberInput input;
  input.inventory_item_id = inventory_item_id;
  input.is_primary = is_primary;
  input.notes = notes;
  return add_member(organization_id, group_id, input);
}

Result<void> AlternateGroupManager::remove_member(const std::string & organization_id, const std::string & member_id) {
  try {
    auto member = store_->get_member(member_id);
    if (!member) {
      return make_error(ErrorCode::NotFound, "Group member not found: " + member_id);
    }
    auto group = load_owned_group(organization_id, member->group_id);
    if (!group) {
      return tl::make_unexpected(group.error());
    }
    if (!store_->delete_member(member_id)) {
      return make_error(ErrorCode::NotFound, "Group member not found: " + member_id);
    }
    return {};
  } catch (const std::exception & e) {
    RCUTILS_LOG_ERROR_NAMED("alternate_group_manager", "Failed to remove member '%s': %s", member_id.c_str(),
                            e.what());
    return make_error(ErrorCode::TransientStore, std::string("Failed to remove group member: ") + e.what());
  }
}

}  // namespace parts_compat
