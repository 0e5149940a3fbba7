// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "dictionary_loader.hpp"

#include "json_schema.hpp"
#include "json_utils.hpp"

#include <format>
#include <stdexcept>
#include <string>

#include <rapidjson/pointer.h>

namespace labelguard {

namespace {

using Pointer = rapidjson::Pointer;
using detail::get_value;
using detail::require_value;

/**
 * @brief Look up a name with the given parser or fail with context.
 */
template <typename Parser>
auto require_enum(const rapidjson::Value& doc, const char* pointer, Parser parse) {
    auto name = require_value<std::string>(doc, pointer, "dictionary term");
    auto parsed = parse(name);
    if (!parsed.has_value()) {
        throw std::runtime_error("dictionary term has unknown " + std::string(pointer + 1) +
                                 ": " + name);
    }
    return *parsed;
}

DictionaryEntry parse_entry(const rapidjson::Value& term) {
    DictionaryEntry entry;
    entry.term = require_value<std::string>(term, dictionary_json::TERM, "dictionary term");
    entry.category = require_enum(term, dictionary_json::CATEGORY, parse_category);
    entry.severity = require_enum(term, dictionary_json::SEVERITY, parse_severity);

    if (auto match = get_value<std::string>(term, dictionary_json::MATCH)) {
        auto mode = parse_match_mode(*match);
        if (!mode.has_value()) {
            throw std::runtime_error(
                std::format("dictionary term has unknown match: {} (expected {} or {})", *match,
                            to_string(MatchMode::Substring), to_string(MatchMode::WholeWord)));
        }
        entry.match = *mode;
    }
    return entry;
}

} // namespace

Dictionary parse_dictionary(const rapidjson::Value& doc) {
    if (!doc.IsObject()) {
        throw std::runtime_error("dictionary must be a JSON object");
    }

    Dictionary dictionary;

    if (auto* terms = Pointer(dictionary_json::TERMS).Get(doc)) {
        if (!terms->IsArray()) {
            throw std::runtime_error("dictionary 'terms' must be an array");
        }
        for (const auto& term : terms->GetArray()) {
            dictionary.terms.push_back(parse_entry(term));
        }
    }

    if (auto* allow = Pointer(dictionary_json::ALLOW).Get(doc)) {
        if (!allow->IsArray()) {
            throw std::runtime_error("dictionary 'allow' must be an array");
        }
        for (const auto& word : allow->GetArray()) {
            if (!word.IsString()) {
                throw std::runtime_error("dictionary 'allow' entries must be strings");
            }
            dictionary.allow.emplace_back(word.GetString(), word.GetStringLength());
        }
    }

    return dictionary;
}

Dictionary load_dictionary(const std::filesystem::path& path,
                           const std::filesystem::path& schema_path) {
    auto doc = load_json_file(path, "dictionary");
    validate_against_schema(doc, schema_path, path);
    return parse_dictionary(doc);
}

} // namespace labelguard
