// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace labelguard {

/**
 * @brief Strength of a content-moderation signal.
 *
 * Ordered: comparisons between severities are meaningful.
 */
enum class Severity {
    None,     ///< Nothing detected
    Mild,     ///< Mildly inappropriate (e.g. "crap")
    Moderate, ///< Clearly inappropriate
    Severe    ///< Slurs and strongly explicit content
};

/**
 * @brief Kinds of inappropriate content the classifier reports on.
 */
enum class Category {
    Profane,   ///< Swearing
    Offensive, ///< Slurs, hate speech
    Sexual,    ///< Sexual or explicit content
    Mean       ///< Insults directed at someone
};

constexpr std::size_t CATEGORY_COUNT = 4;

/// Lowercase names used in dictionary files and logs
std::string_view to_string(Severity severity);
std::string_view to_string(Category category);

/// Parse lowercase names; nullopt if the name is unknown
std::optional<Severity> parse_severity(std::string_view name);
std::optional<Category> parse_category(std::string_view name);

/**
 * @brief Result of classifying a piece of text.
 *
 * Holds the highest severity observed per category.
 */
class ContentAnalysis {
public:
    /**
     * @brief Record a detection, keeping the highest severity per category.
     */
    void record(Category category, Severity severity);

    [[nodiscard]] Severity severity(Category category) const {
        return severities_[static_cast<std::size_t>(category)];
    }

    /// Highest severity across all categories
    [[nodiscard]] Severity max_severity() const;

    /**
     * @brief Check whether any category reached the given severity.
     *
     * @param threshold Minimum severity (inclusive)
     */
    [[nodiscard]] bool is_at_least(Severity threshold) const { return max_severity() >= threshold; }

    /// Number of dictionary hits that contributed to this analysis
    [[nodiscard]] std::size_t match_count() const { return match_count_; }

    [[nodiscard]] bool clean() const { return match_count_ == 0; }

private:
    std::array<Severity, CATEGORY_COUNT> severities_{};
    std::size_t match_count_ = 0;
};

/**
 * @brief Abstract interface for scoring text for profanity and offensiveness.
 *
 * Implementations only score; the accept/reject threshold is owned by the caller
 * (see ProjectName). classify() must be safe to call concurrently.
 */
class IContentClassifier {
public:
    virtual ~IContentClassifier() = default;

    /**
     * @brief Score the given text.
     *
     * @param text Raw text, exactly as supplied by the user
     * @return Severity per category
     */
    virtual ContentAnalysis classify(std::string_view text) const = 0;
};

} // namespace labelguard
