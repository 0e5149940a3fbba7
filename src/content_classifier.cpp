// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "content_classifier.hpp"

#include <algorithm>

namespace labelguard {

std::string_view to_string(Severity severity) {
    switch (severity) {
    case Severity::None:
        return "none";
    case Severity::Mild:
        return "mild";
    case Severity::Moderate:
        return "moderate";
    case Severity::Severe:
        return "severe";
    }
    return "none";
}

std::string_view to_string(Category category) {
    switch (category) {
    case Category::Profane:
        return "profane";
    case Category::Offensive:
        return "offensive";
    case Category::Sexual:
        return "sexual";
    case Category::Mean:
        return "mean";
    }
    return "profane";
}

std::optional<Severity> parse_severity(std::string_view name) {
    for (auto severity : {Severity::None, Severity::Mild, Severity::Moderate, Severity::Severe}) {
        if (to_string(severity) == name) {
            return severity;
        }
    }
    return std::nullopt;
}

std::optional<Category> parse_category(std::string_view name) {
    for (auto category :
         {Category::Profane, Category::Offensive, Category::Sexual, Category::Mean}) {
        if (to_string(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

void ContentAnalysis::record(Category category, Severity severity) {
    auto& slot = severities_[static_cast<std::size_t>(category)];
    slot = std::max(slot, severity);
    ++match_count_;
}

Severity ContentAnalysis::max_severity() const {
    return *std::max_element(severities_.begin(), severities_.end());
}

} // namespace labelguard
