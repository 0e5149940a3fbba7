// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "project_name_json.hpp"

#include "word_list_classifier.hpp"

#include <stdexcept>

#include <rapidjson/pointer.h>

namespace labelguard {

void write_json(rapidjson::Writer<rapidjson::StringBuffer>& writer, const ProjectName& name) {
    writer.String(name.str().c_str(), static_cast<rapidjson::SizeType>(name.size()));
}

std::string to_json_string(const ProjectName& name) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    write_json(writer, name);
    return buffer.GetString();
}

ProjectName project_name_from_json(const rapidjson::Value& value) {
    return project_name_from_json(value, default_classifier());
}

ProjectName project_name_from_json(const rapidjson::Value& value,
                                   const IContentClassifier& classifier) {
    if (!value.IsString()) {
        throw InvalidProjectName();
    }
    return ProjectName::create(std::string_view(value.GetString(), value.GetStringLength()),
                               classifier);
}

ProjectName parse_project_name_json(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw InvalidProjectName();
    }
    return project_name_from_json(doc);
}

std::optional<ProjectName> get_project_name(const rapidjson::Value& doc, const char* pointer,
                                            const IContentClassifier& classifier) {
    rapidjson::Pointer ptr(pointer);
    if (auto* val = ptr.Get(doc)) {
        return project_name_from_json(*val, classifier);
    }
    return std::nullopt;
}

ProjectName require_project_name(const rapidjson::Value& doc, const char* pointer,
                                 const char* context, const IContentClassifier& classifier) {
    auto result = get_project_name(doc, pointer, classifier);
    if (!result.has_value()) {
        throw std::runtime_error(std::string(context) + " missing required '" + (pointer + 1) +
                                 "' field");
    }
    return std::move(result).value();
}

} // namespace labelguard
