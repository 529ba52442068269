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
#include <cstdint>
#include <string>
#include <vector>

#include "parts_compat/pattern_validator.hpp"

namespace parts_compat {

/// Storage backend selection
struct StorageConfig {
  /// "memory" or "sqlite"
  std::string type{"sqlite"};
  /// SQLite database file (":memory:" for a private in-memory database)
  std::string database_path{"/var/lib/parts_compat/parts.db"};
};

struct MatchingConfig {
  size_t wildcard_min_literal_chars{2};
  size_t wildcard_max_wildcards{2};
};

struct LookupConfig {
  size_t search_result_limit{50};
  /// Used when an inventory item has no low-stock threshold of its own
  int32_t default_low_stock_threshold{5};
};

/// Complete engine configuration (the `parts_compat:` YAML section)
struct EngineConfig {
  StorageConfig storage;
  MatchingConfig matching;
  LookupConfig lookup;

  PatternLimits pattern_limits() const {
    return PatternLimits{matching.wildcard_min_literal_chars, matching.wildcard_max_wildcards};
  }
};

/// Result of configuration validation
struct ValidationResult {
  bool valid{true};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  /// Add an error (makes result invalid)
  void add_error(const std::string & msg) {
    valid = false;
    errors.push_back(msg);
  }

  /// Add a warning (result stays valid)
  void add_warning(const std::string & msg) {
    warnings.push_back(msg);
  }
};

/// Parse engine configuration from YAML file
/// @param config_file Path to the YAML configuration file
/// @return Parsed configuration (defaults for missing sections)
/// @throws std::runtime_error if file cannot be read or YAML is malformed
EngineConfig parse_config_file(const std::string & config_file);

/// Parse engine configuration from YAML string
/// @param yaml_content YAML content as string
/// @return Parsed configuration
/// @throws std::runtime_error if YAML is malformed
EngineConfig parse_config_string(const std::string & yaml_content);

/// Validate a parsed engine configuration
/// Checks:
/// - storage type is known and sqlite has a database path
/// - wildcard limits are usable
/// - search limit is positive
/// @param config Configuration to validate
/// @return Validation result with errors and warnings
ValidationResult validate_config(const EngineConfig & config);

}  // namespace parts_compat
