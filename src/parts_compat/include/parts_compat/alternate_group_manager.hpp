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
#include <optional>
#include <string>
#include <vector>

#include "parts_compat/errors.hpp"
#include "parts_compat/storage/parts_storage.hpp"
#include "parts_compat/types.hpp"

namespace parts_compat {

/// Member to add. Exactly one reference must be set.
struct GroupMemberInput {
  std::optional<std::string> part_identifier_id;
  std::optional<std::string> inventory_item_id;
  bool is_primary{false};
  std::string notes;
};

/// Manages groups of interchangeable parts and their verification lifecycle.
///
/// Status transitions:
///   Unverified -> Verified    (stamps verified_by / verified_at)
///   Unverified -> Deprecated
///   Verified   -> Deprecated
///   Verified   -> Verified    (re-stamps verified_by / verified_at)
/// Deprecated is terminal.
///
/// Reads by id return NotFound for groups of other organizations. Mutations of such
/// groups return AccessDenied.
class AlternateGroupManager {
 public:
  AlternateGroupManager(std::shared_ptr<CatalogStore> catalog, std::shared_ptr<AlternatesStore> store);

  Result<AlternateGroup> create_group(const std::string & organization_id, const std::string & actor_id,
                                      const AlternateGroupInput & input);

  /// Apply a partial patch. Unset fields keep their stored value.
  Result<AlternateGroup> update_group(const std::string & organization_id, const std::string & actor_id,
                                      const std::string & group_id, const AlternateGroupPatch & patch);

  /// Delete a group and all of its members
  Result<void> delete_group(const std::string & organization_id, const std::string & group_id);

  /// Group with members (primary first, then by creation time), each enriched with the
  /// display fields of the identifier or inventory item it references
  Result<AlternateGroupWithMembers> get_group(const std::string & organization_id,
                                              const std::string & group_id) const;

  /// Groups of an organization ordered by name
  Result<std::vector<AlternateGroup>> list_groups(const std::string & organization_id) const;

  /// Add a member. Adding a reference the group already holds is a successful no-op.
  Result<void> add_member(const std::string & organization_id, const std::string & group_id,
                          const GroupMemberInput & input);

  Result<void> add_identifier_to_group(const std::string & organization_id, const std::string & group_id,
                                       const std::string & identifier_id, const std::string & notes = "");

  Result<void> add_inventory_item_to_group(const std::string & organization_id, const std::string & group_id,
                                           const std::string & inventory_item_id, bool is_primary = false,
                                           const std::string & notes = "");

  Result<void> remove_member(const std::string & organization_id, const std::string & member_id);

 private:
  /// NotFound if the group is missing, AccessDenied if it belongs to another organization
  Result<AlternateGroup> load_owned_group(const std::string & organization_id, const std::string & group_id) const;

  AlternateGroupMemberView to_view(const AlternateGroupMember & member) const;

  std::shared_ptr<CatalogStore> catalog_;
  std::shared_ptr<AlternatesStore> store_;
};

}  // namespace parts_compat
