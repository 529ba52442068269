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

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "parts_compat/errors.hpp"
#include "parts_compat/types.hpp"

namespace parts_compat {

using json = nlohmann::json;

// JSON views of engine records for callers that expose them over an API.
// Timestamps are emitted as seconds since the epoch (double), absent optionals as null.

json rule_to_json(const CompatibilityRule & rule);
json identifier_to_json(const PartIdentifier & identifier);
json group_to_json(const AlternateGroup & group);
json member_view_to_json(const AlternateGroupMemberView & member);
json group_with_members_to_json(const AlternateGroupWithMembers & group);
json alternate_result_to_json(const AlternateResult & result);
json compatible_part_to_json(const CompatiblePart & part);

/// {"error": code, "message": ..., "issue": ...} ("issue" only for validation errors)
json error_to_json(const PartsError & error);

/// Parse a bulk rule payload: [{"manufacturer", "model"?, "match_type"?, "status"?, "notes"?}, ...]
/// @return Validation / MalformedPayload if the document is not such an array
Result<std::vector<RuleInput>> parse_rule_inputs(const json & payload);

/// Parse a bulk rule payload from JSON text
Result<std::vector<RuleInput>> parse_rule_payload(const std::string & payload_text);

}  // namespace parts_compat
