// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "project_name.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace labelguard {

/**
 * @brief Write a project name as a plain JSON string (no wrapping object).
 */
void write_json(rapidjson::Writer<rapidjson::StringBuffer>& writer, const ProjectName& name);

/**
 * @brief Serialize a project name to a JSON string literal, e.g. "my-app".
 */
std::string to_json_string(const ProjectName& name);

/**
 * @brief Deserialize a project name from a JSON value.
 *
 * Runs full validation; there is no looser path for deserialized input.
 *
 * @throws InvalidProjectName if the value is not a string or fails validation
 */
ProjectName project_name_from_json(const rapidjson::Value& value);
ProjectName project_name_from_json(const rapidjson::Value& value,
                                   const IContentClassifier& classifier);

/**
 * @brief Parse a JSON document whose root is a project name string.
 *
 * @throws InvalidProjectName on malformed JSON, a non-string root or a failing name
 */
ProjectName parse_project_name_json(std::string_view json);

/**
 * @brief Get an optional project name field from JSON using pointer path.
 *
 * @param doc The JSON value to query
 * @param pointer JSON pointer path (e.g., "/project/name")
 * @return nullopt if the field is absent
 * @throws InvalidProjectName if the field is present but not a valid name
 */
std::optional<ProjectName> get_project_name(const rapidjson::Value& doc, const char* pointer,
                                            const IContentClassifier& classifier);

/**
 * @brief Get a required project name field from JSON using pointer path.
 *
 * @param context Context string for error messages (e.g., "request")
 * @throws std::runtime_error if the field is missing
 * @throws InvalidProjectName if the field is present but not a valid name
 */
ProjectName require_project_name(const rapidjson::Value& doc, const char* pointer,
                                 const char* context, const IContentClassifier& classifier);

} // namespace labelguard
