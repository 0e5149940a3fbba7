// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace labelguard {

/**
 * @brief Service configuration loaded from JSON config file.
 *
 * Values can be overridden by environment variables with LABELGUARD_ prefix.
 */
struct ServiceConfig {
    std::string log_level = "info";
    std::string host = "0.0.0.0";
    int port = 8080;

    /// Extra classifier terms, resolved relative to the config file directory
    std::optional<std::filesystem::path> dictionary_path;

    /// JSON schema for the dictionary file (same directory as the config schema)
    std::filesystem::path dictionary_schema_path;
};

/// JSON Pointer paths (RFC6901) for extracting ServiceConfig values
namespace json {
constexpr char LOG_LEVEL[] = "/observability/logging/level";
constexpr char SERVER_HOST[] = "/infrastructure/server/host";
constexpr char SERVER_PORT[] = "/infrastructure/server/port";
constexpr char DICTIONARY_PATH[] = "/content_filter/dictionary_path";
} // namespace json

/// Dictionary schema file name, looked up next to the config schema
constexpr char DICTIONARY_SCHEMA_FILE[] = "dictionary.schema.json";

/**
 * @brief Load and validate service configuration from JSON file.
 *
 * Configuration layering (priority: high to low):
 * 1. Environment variables (LABELGUARD_LOG_LEVEL, LABELGUARD_PORT)
 * 2. JSON configuration file
 *
 * @param config_path Path to the JSON configuration file
 * @param schema_path Path to the JSON schema file
 * @return ServiceConfig Validated configuration
 *
 * @throws std::runtime_error if config file not found, invalid JSON, or schema validation fails
 */
ServiceConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path);

} // namespace labelguard
