// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "word_list_classifier.hpp"

#include <filesystem>

#include <rapidjson/document.h>

namespace labelguard {

/// JSON Pointer paths (RFC6901) for dictionary fields
namespace dictionary_json {
constexpr char TERMS[] = "/terms";
constexpr char ALLOW[] = "/allow";

// Term fields (relative pointers within a term object)
constexpr char TERM[] = "/term";
constexpr char CATEGORY[] = "/category";
constexpr char SEVERITY[] = "/severity";
constexpr char MATCH[] = "/match";
} // namespace dictionary_json

/**
 * @brief Build a dictionary from an already parsed JSON document.
 *
 * @throws std::runtime_error on missing fields or unknown category/severity/match names
 */
Dictionary parse_dictionary(const rapidjson::Value& doc);

/**
 * @brief Load a dictionary file and validate it against its schema.
 *
 * @param path Dictionary JSON file
 * @param schema_path Dictionary JSON schema file
 * @throws std::runtime_error if the file is missing, malformed or fails validation
 */
Dictionary load_dictionary(const std::filesystem::path& path,
                           const std::filesystem::path& schema_path);

} // namespace labelguard
