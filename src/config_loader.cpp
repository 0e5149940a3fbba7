// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include "env_vars.hpp"
#include "json_schema.hpp"
#include "json_utils.hpp"

#include <cstdlib>
#include <stdexcept>

#include <rapidjson/document.h>
#include <rapidjson/pointer.h>

namespace labelguard {

namespace {

using detail::get_value;

/**
 * @brief Get optional environment variable value.
 */
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/**
 * @brief Parse and validate log level from string.
 * @throws std::runtime_error if invalid log level
 */
std::string parse_log_level(const std::string& level, const std::string& source) {
    if (level == "trace" || level == "debug" || level == "info" || level == "warn" ||
        level == "error") {
        return level;
    }
    throw std::runtime_error("Invalid " + source + ": " + level +
                             " (must be trace|debug|info|warn|error)");
}

/**
 * @brief Parse and validate port number from string.
 * @throws std::runtime_error if invalid or out of range
 */
int parse_port(const std::string& port_str, const std::string& source) {
    try {
        std::size_t consumed = 0;
        int port = std::stoi(port_str, &consumed);
        if (consumed != port_str.size()) {
            throw std::invalid_argument(port_str);
        }
        if (port < 1024 || port > 65535) {
            throw std::runtime_error(source + " out of range: " + port_str +
                                     " (must be 1024-65535)");
        }
        return port;
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid " + source + ": " + port_str);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(source + " out of range: " + port_str);
    }
}

} // namespace

ServiceConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path) {
    auto config_doc = load_json_file(config_path, "config");
    validate_against_schema(config_doc, schema_path, config_path);

    // Extract values from JSON with defaults using JSON Pointers (RFC6901)
    ServiceConfig config;
    config.log_level =
        GetValueByPointerWithDefault(config_doc, json::LOG_LEVEL, "info").GetString();
    config.host =
        GetValueByPointerWithDefault(config_doc, json::SERVER_HOST, "0.0.0.0").GetString();
    config.port = GetValueByPointerWithDefault(config_doc, json::SERVER_PORT, 8080).GetInt();

    if (auto path = get_value<std::string>(config_doc, json::DICTIONARY_PATH)) {
        std::filesystem::path dictionary_path(*path);
        if (dictionary_path.is_relative()) {
            dictionary_path = config_path.parent_path() / dictionary_path;
        }
        config.dictionary_path = dictionary_path;
    }
    config.dictionary_schema_path = schema_path.parent_path() / DICTIONARY_SCHEMA_FILE;

    // Apply environment variable overrides
    if (auto env_log_level = get_env(env::LOG_LEVEL); env_log_level.has_value()) {
        config.log_level = parse_log_level(env_log_level.value(), env::LOG_LEVEL);
    }

    if (auto env_port = get_env(env::PORT); env_port.has_value()) {
        config.port = parse_port(env_port.value(), env::PORT);
    }

    return config;
}

} // namespace labelguard
