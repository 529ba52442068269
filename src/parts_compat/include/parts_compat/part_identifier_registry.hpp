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

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "parts_compat/cancellation.hpp"
#include "parts_compat/errors.hpp"
#include "parts_compat/storage/parts_storage.hpp"
#include "parts_compat/types.hpp"

namespace parts_compat {

/// Catalog of OEM, aftermarket, manufacturer, UPC and cross-reference part numbers
class PartIdentifierRegistry {
 public:
  static constexpr size_t kDefaultSearchLimit = 50;

  PartIdentifierRegistry(std::shared_ptr<CatalogStore> catalog, std::shared_ptr<AlternatesStore> store,
                         size_t search_limit = kDefaultSearchLimit);

  /// Store a part number. The value is kept trimmed as entered plus normalized.
  /// @return Duplicate if the organization already has the normalized value
  Result<PartIdentifier> create(const std::string & organization_id, const std::string & actor_id,
                                const PartIdentifierInput & input);

  /// Substring search on the normalized value, ordered by raw value and capped.
  /// A blank term returns an empty list without querying. A fired cancellation token
  /// yields an empty list and no log output.
  Result<std::vector<PartIdentifier>> search(const std::string & organization_id, const std::string & term,
                                             const CancellationToken * cancel = nullptr) const;

 private:
  std::shared_ptr<CatalogStore> catalog_;
  std::shared_ptr<AlternatesStore> store_;
  size_t search_limit_;
};

}  // namespace parts_compat
