// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "content_classifier.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labelguard {

/**
 * @brief How a dictionary term is located in the text.
 */
enum class MatchMode {
    Substring, ///< Anywhere inside a token (or a run of one-letter tokens)
    WholeWord  ///< Must be an entire separator-delimited token
};

std::string_view to_string(MatchMode mode);
std::optional<MatchMode> parse_match_mode(std::string_view name);

/**
 * @brief A single flagged term.
 */
struct DictionaryEntry {
    std::string term;
    Category category = Category::Profane;
    Severity severity = Severity::Moderate;
    MatchMode match = MatchMode::Substring;
};

/**
 * @brief Flagged terms plus benign words that contain them.
 *
 * A substring hit lying entirely inside an allowlisted word is ignored
 * (e.g. "cock" inside "peacock").
 */
struct Dictionary {
    std::vector<DictionaryEntry> terms;
    std::vector<std::string> allow;
};

/**
 * @brief Built-in dictionary used by the default classifier.
 */
const Dictionary& default_dictionary();

/**
 * @brief Dictionary-backed profanity classifier.
 *
 * Text is folded before matching:
 * - ASCII letters are lowercased
 * - common leetspeak is mapped back to letters (0->o, 1->i, 3->e, 4->a, 5->s, 7->t, @->a, $->s)
 * - any other non-alphanumeric byte is a separator
 *
 * Each term letter also absorbs repeats of itself, so "fuuuck" matches "fuck".
 * Substring terms are searched inside each token, never across a separator
 * ("push-it" is clean). Consecutive one-letter tokens are joined first, which
 * catches spacing evasions such as "f-u-c-k". Allowlisted words are matched
 * with separators removed, so "dick-tracy" can be allowed as "dicktracy".
 *
 * Immutable after construction; classify() is safe to call from many threads.
 */
class WordListClassifier : public IContentClassifier {
public:
    /// Classifier over default_dictionary()
    WordListClassifier();

    /// Classifier over exactly the given dictionary
    explicit WordListClassifier(const Dictionary& dictionary);

    ContentAnalysis classify(std::string_view text) const override;

    /**
     * @brief Build a classifier over the default dictionary plus extra entries.
     */
    static WordListClassifier with_extensions(const Dictionary& extra);

    [[nodiscard]] std::size_t term_count() const { return terms_.size(); }
    [[nodiscard]] std::size_t allow_count() const { return allow_.size(); }

private:
    void add(const Dictionary& dictionary);

    std::vector<DictionaryEntry> terms_; // folded terms
    std::vector<std::string> allow_;     // folded allowlist words
};

/**
 * @brief Process-wide classifier over default_dictionary().
 *
 * Built once on first use (thread-safe), read-only afterwards.
 */
const IContentClassifier& default_classifier();

} // namespace labelguard
