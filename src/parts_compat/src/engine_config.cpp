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

#include "parts_compat/engine_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace parts_compat {

namespace {

/// Helper to get optional string from YAML node
std::string get_string(const YAML::Node & node, const std::string & key, const std::string & default_value = "") {
  if (node[key] && node[key].IsScalar()) {
    return node[key].as<std::string>();
  }
  return default_value;
}

/// Helper to get optional size from YAML node
size_t get_size(const YAML::Node & node, const std::string & key, size_t default_value) {
  if (node[key] && node[key].IsScalar()) {
    return node[key].as<size_t>();
  }
  return default_value;
}

/// Helper to get optional int32 from YAML node
int32_t get_int32(const YAML::Node & node, const std::string & key, int32_t default_value) {
  if (node[key] && node[key].IsScalar()) {
    return node[key].as<int32_t>();
  }
  return default_value;
}

}  // namespace

EngineConfig parse_config_file(const std::string & config_file) {
  std::ifstream file(config_file);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open parts_compat config file: " + config_file);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_config_string(buffer.str());
}

EngineConfig parse_config_string(const std::string & yaml_content) {
  EngineConfig config;

  YAML::Node root = YAML::Load(yaml_content);
  YAML::Node engine_node = root["parts_compat"];
  if (!engine_node || !engine_node.IsMap()) {
    return config;
  }

  YAML::Node storage_node = engine_node["storage"];
  if (storage_node && storage_node.IsMap()) {
    config.storage.type = get_string(storage_node, "type", config.storage.type);
    config.storage.database_path = get_string(storage_node, "database_path", config.storage.database_path);
  }

  YAML::Node matching_node = engine_node["matching"];
  if (matching_node && matching_node.IsMap()) {
    config.matching.wildcard_min_literal_chars =
        get_size(matching_node, "wildcard_min_literal_chars", config.matching.wildcard_min_literal_chars);
    config.matching.wildcard_max_wildcards =
        get_size(matching_node, "wildcard_max_wildcards", config.matching.wildcard_max_wildcards);
  }

  YAML::Node lookup_node = engine_node["lookup"];
  if (lookup_node && lookup_node.IsMap()) {
    config.lookup.search_result_limit =
        get_size(lookup_node, "search_result_limit", config.lookup.search_result_limit);
    config.lookup.default_low_stock_threshold =
        get_int32(lookup_node, "default_low_stock_threshold", config.lookup.default_low_stock_threshold);
  }

  return config;
}

ValidationResult validate_config(const EngineConfig & config) {
  ValidationResult result;

  if (config.storage.type != "memory" && config.storage.type != "sqlite") {
    result.add_error("Unknown storage type '" + config.storage.type + "', expected 'memory' or 'sqlite'");
  } else if (config.storage.type == "sqlite" && config.storage.database_path.empty()) {
    result.add_error("SQLite storage requires a database_path");
  }

  if (config.matching.wildcard_min_literal_chars < 1) {
    result.add_error("wildcard_min_literal_chars must be at least 1");
  } else if (config.matching.wildcard_min_literal_chars < 2) {
    result.add_warning("wildcard_min_literal_chars < 2 allows very broad wildcard patterns");
  }

  if (config.matching.wildcard_max_wildcards == 0) {
    result.add_warning("wildcard_max_wildcards is 0, no wildcard rule can be stored");
  }

  if (config.lookup.search_result_limit == 0) {
    result.add_error("search_result_limit must be at least 1");
  } else if (config.lookup.search_result_limit > 1000) {
    result.add_warning("search_result_limit > 1000 may make live search slow");
  }

  if (config.lookup.default_low_stock_threshold < 0) {
    result.add_error("default_low_stock_threshold must not be negative");
  }

  return result;
}

}  // namespace parts_compat
