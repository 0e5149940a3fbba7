// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "content_classifier.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace labelguard {

/// Any classifier category at or above this severity rejects a name
constexpr Severity REJECT_SEVERITY = Severity::Moderate;

/**
 * @brief Exception thrown when a candidate project name fails validation.
 *
 * Deliberately carries no detail about which rule failed; the message always
 * lists every rule.
 */
class InvalidProjectName : public std::invalid_argument {
public:
    InvalidProjectName();

    /// Fixed, user-facing description of all project name rules
    static const char* rules();
};

/**
 * @brief A validated project name.
 *
 * Project names must be valid host labels (a strict subset of RFC 1123), written
 * in lowercase, free of profanity and not reserved. Every ProjectName satisfies
 * is_valid() for its entire lifetime: there is no unchecked constructor and no
 * mutating operation.
 */
class ProjectName {
public:
    /**
     * @brief Validate a candidate and wrap it.
     *
     * The stored value is an exact copy of the candidate; nothing is trimmed,
     * case-folded or substituted.
     *
     * @param candidate Untrusted input
     * @param classifier Profanity scorer (default_classifier() if omitted)
     * @throws InvalidProjectName if any rule fails
     */
    static ProjectName create(std::string_view candidate);
    static ProjectName create(std::string_view candidate, const IContentClassifier& classifier);

    /**
     * @brief Non-throwing variant of create().
     *
     * @return The validated name, or nullopt if any rule fails
     */
    static std::optional<ProjectName> try_create(std::string_view candidate);
    static std::optional<ProjectName> try_create(std::string_view candidate,
                                                 const IContentClassifier& classifier);

    /**
     * @brief Check a candidate without constructing a value.
     *
     * Rules, all of which must hold:
     * 1. not empty
     * 2. shorter than 64 characters
     * 3. does not start with '-'
     * 4. does not end with '-'
     * 5. not a reserved word
     * 6. only a-z, 0-9 and '-'
     * 7. the classifier reports nothing at REJECT_SEVERITY or above
     *
     * Cheap checks run first; the classifier only sees syntactically valid input.
     */
    static bool is_valid(std::string_view candidate);
    static bool is_valid(std::string_view candidate, const IContentClassifier& classifier);

    [[nodiscard]] const std::string& str() const { return value_; }
    [[nodiscard]] std::size_t size() const { return value_.size(); }

    operator std::string_view() const { return value_; }

    friend bool operator==(const ProjectName&, const ProjectName&) = default;
    friend std::strong_ordering operator<=>(const ProjectName&, const ProjectName&) = default;

private:
    explicit ProjectName(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

/// Writes the raw name
std::ostream& operator<<(std::ostream& os, const ProjectName& name);

} // namespace labelguard

template <>
struct std::hash<labelguard::ProjectName> {
    std::size_t operator()(const labelguard::ProjectName& name) const noexcept {
        return std::hash<std::string>{}(name.str());
    }
};
