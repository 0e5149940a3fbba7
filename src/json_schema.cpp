// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "json_schema.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <rapidjson/istreamwrapper.h>
#include <rapidjson/pointer.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

namespace labelguard {

rapidjson::Document load_json_file(const std::filesystem::path& path, const char* what) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error(std::string("Failed to open ") + what + " file: " + path.string());
    }

    rapidjson::IStreamWrapper isw(ifs);
    rapidjson::Document doc;
    doc.ParseStream(isw);

    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("Failed to parse ") + what + " JSON: " +
                                 path.string() + " at offset " +
                                 std::to_string(doc.GetErrorOffset()));
    }

    return doc;
}

void validate_against_schema(const rapidjson::Document& doc,
                             const std::filesystem::path& schema_path,
                             const std::filesystem::path& source_path) {
    auto schema_doc = load_json_file(schema_path, "schema");
    rapidjson::SchemaDocument schema(schema_doc);

    rapidjson::SchemaValidator validator(schema);
    if (!doc.Accept(validator)) {
        rapidjson::StringBuffer sb;
        validator.GetInvalidSchemaPointer().StringifyUriFragment(sb);
        throw std::runtime_error("Validation failed for " + source_path.string() +
                                 " at: " + sb.GetString() +
                                 ", keyword: " + validator.GetInvalidSchemaKeyword());
    }
}

} // namespace labelguard
