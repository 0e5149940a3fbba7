// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "project_name.hpp"

#include "label_rules.hpp"
#include "reserved_words.hpp"
#include "word_list_classifier.hpp"

namespace labelguard {

namespace {

constexpr char RULES_MESSAGE[] = "Invalid project name. Project names must:\n"
                                 "    1. only contain lowercase alphanumeric characters or "
                                 "dashes `-`.\n"
                                 "    2. not start or end with a dash.\n"
                                 "    3. not be empty.\n"
                                 "    4. be shorter than 64 characters.\n"
                                 "    5. not contain any profanities.\n"
                                 "    6. not be a reserved word.";

bool is_profanity_free(std::string_view candidate, const IContentClassifier& classifier) {
    return !classifier.classify(candidate).is_at_least(REJECT_SEVERITY);
}

} // namespace

InvalidProjectName::InvalidProjectName() : std::invalid_argument(RULES_MESSAGE) {}

const char* InvalidProjectName::rules() {
    return RULES_MESSAGE;
}

bool ProjectName::is_valid(std::string_view candidate) {
    return is_valid(candidate, default_classifier());
}

bool ProjectName::is_valid(std::string_view candidate, const IContentClassifier& classifier) {
    return isWellFormedLabel(candidate) && !isReservedWord(candidate) &&
           is_profanity_free(candidate, classifier);
}

ProjectName ProjectName::create(std::string_view candidate) {
    return create(candidate, default_classifier());
}

ProjectName ProjectName::create(std::string_view candidate, const IContentClassifier& classifier) {
    if (!is_valid(candidate, classifier)) {
        throw InvalidProjectName();
    }
    return ProjectName(std::string(candidate));
}

std::optional<ProjectName> ProjectName::try_create(std::string_view candidate) {
    return try_create(candidate, default_classifier());
}

std::optional<ProjectName> ProjectName::try_create(std::string_view candidate,
                                                   const IContentClassifier& classifier) {
    if (!is_valid(candidate, classifier)) {
        return std::nullopt;
    }
    return ProjectName(std::string(candidate));
}

std::ostream& operator<<(std::ostream& os, const ProjectName& name) {
    return os << name.str();
}

} // namespace labelguard
