// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "check_command.hpp"

#include "logger.hpp"
#include "project_name.hpp"
#include "project_name_json.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace labelguard {

int run_check_command(const std::vector<std::string>& names, bool json_output,
                      const IContentClassifier& classifier, std::ostream& out) {
    rapidjson::StringBuffer json_buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(json_buffer);
    writer.StartArray();

    bool all_valid = true;
    for (const auto& candidate : names) {
        auto name = ProjectName::try_create(candidate, classifier);
        if (!name) {
            all_valid = false;
            LOG_DEBUG_ENTRY(LogEntry("Project name rejected")
                                .component("cli")
                                .operation("check")
                                .name(candidate));
        }

        if (!json_output) {
            out << candidate << '\t' << (name ? "valid" : "invalid") << '\n';
            continue;
        }

        writer.StartObject();
        writer.Key("name");
        if (name) {
            write_json(writer, *name);
        } else {
            writer.String(candidate.c_str(), static_cast<rapidjson::SizeType>(candidate.size()));
        }
        writer.Key("valid");
        writer.Bool(name.has_value());
        writer.EndObject();
    }

    writer.EndArray();
    if (json_output) {
        out << json_buffer.GetString() << '\n';
    }

    return all_valid ? 0 : EXIT_INVALID_NAME;
}

} // namespace labelguard
