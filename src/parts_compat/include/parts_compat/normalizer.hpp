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

#include <string>

namespace parts_compat {

/// Identity key for manufacturer, model and part-number comparison: trimmed and lowercased.
/// Idempotent: normalize(normalize(x)) == normalize(x).
std::string normalize(const std::string & value);

/// Strip leading and trailing whitespace, preserving case
std::string trim(const std::string & value);

/// True if the value is empty or whitespace only
bool is_blank(const std::string & value);

}  // namespace parts_compat
