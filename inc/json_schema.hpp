// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include <rapidjson/document.h>

namespace labelguard {

/**
 * @brief Load and parse a JSON file.
 *
 * @param path File to read
 * @param what Human-readable kind of file for error messages (e.g., "config")
 * @throws std::runtime_error if the file cannot be opened or is not valid JSON
 */
rapidjson::Document load_json_file(const std::filesystem::path& path, const char* what);

/**
 * @brief Validate a JSON document against a JSON schema file.
 *
 * @param doc Parsed document
 * @param schema_path JSON schema file
 * @param source_path Path the document came from (for error messages)
 * @throws std::runtime_error if the schema cannot be loaded or validation fails
 */
void validate_against_schema(const rapidjson::Document& doc,
                             const std::filesystem::path& schema_path,
                             const std::filesystem::path& source_path);

} // namespace labelguard
