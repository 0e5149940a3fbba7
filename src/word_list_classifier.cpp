// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "word_list_classifier.hpp"

#include <utility>

namespace labelguard {

namespace {

constexpr char SEPARATOR = ' ';

/// Half-open byte range in the separator-stripped text
struct Span {
    std::size_t begin;
    std::size_t end;
};

struct BuiltinTerm {
    const char* term;
    Category category;
    Severity severity;
    MatchMode match;
};

// clang-format off
constexpr BuiltinTerm BUILTIN_TERMS[] = {
    {"fuck",     Category::Profane,   Severity::Severe,   MatchMode::Substring},
    {"shit",     Category::Profane,   Severity::Moderate, MatchMode::Substring},
    {"cunt",     Category::Profane,   Severity::Severe,   MatchMode::Substring},
    {"asshole",  Category::Profane,   Severity::Moderate, MatchMode::Substring},
    {"ass",      Category::Profane,   Severity::Moderate, MatchMode::WholeWord},
    {"arse",     Category::Profane,   Severity::Moderate, MatchMode::WholeWord},
    {"piss",     Category::Profane,   Severity::Mild,     MatchMode::Substring},
    {"damn",     Category::Profane,   Severity::Mild,     MatchMode::Substring},
    {"crap",     Category::Profane,   Severity::Mild,     MatchMode::WholeWord},
    {"hell",     Category::Profane,   Severity::Mild,     MatchMode::WholeWord},
    {"bitch",    Category::Mean,      Severity::Moderate, MatchMode::Substring},
    {"bastard",  Category::Mean,      Severity::Moderate, MatchMode::Substring},
    {"retard",   Category::Mean,      Severity::Moderate, MatchMode::Substring},
    {"idiot",    Category::Mean,      Severity::Mild,     MatchMode::Substring},
    {"stupid",   Category::Mean,      Severity::Mild,     MatchMode::Substring},
    {"loser",    Category::Mean,      Severity::Mild,     MatchMode::WholeWord},
    {"dick",     Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"cock",     Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"pussy",    Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"penis",    Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"vagina",   Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"condom",   Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"dildo",    Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"porn",     Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"slut",     Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"whore",    Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"horny",    Category::Sexual,    Severity::Moderate, MatchMode::Substring},
    {"boob",     Category::Sexual,    Severity::Mild,     MatchMode::WholeWord},
    {"sex",      Category::Sexual,    Severity::Mild,     MatchMode::WholeWord},
    {"tits",     Category::Sexual,    Severity::Moderate, MatchMode::WholeWord},
    {"cum",      Category::Sexual,    Severity::Moderate, MatchMode::WholeWord},
    {"nigger",   Category::Offensive, Severity::Severe,   MatchMode::Substring},
    {"nigga",    Category::Offensive, Severity::Severe,   MatchMode::Substring},
    {"faggot",   Category::Offensive, Severity::Severe,   MatchMode::Substring},
    {"fag",      Category::Offensive, Severity::Severe,   MatchMode::WholeWord},
    {"kike",     Category::Offensive, Severity::Severe,   MatchMode::WholeWord},
    {"spic",     Category::Offensive, Severity::Severe,   MatchMode::WholeWord},
    {"nazi",     Category::Offensive, Severity::Severe,   MatchMode::Substring},
    {"rape",     Category::Offensive, Severity::Severe,   MatchMode::WholeWord},
};
// clang-format on

// clang-format off
constexpr const char* BUILTIN_ALLOW[] = {
    "scunthorpe", "cockpit",   "cocktail",  "peacock",    "hancock",   "woodcock",  "shuttlecock",
    "babcock",    "hitchcock", "cockroach", "cocker",     "cockerel",  "cockatoo",  "cockatiel",
    "cockney",    "dickens",   "dickinson", "dickson",    "dicktracy", "penistone", "retardant",
    "shitake",    "mishit",    "matsushita", "nazir",     "condominium", "thorny",
};
// clang-format on

/**
 * @brief Fold a byte for matching: lowercase, undo leetspeak, separators -> SEPARATOR.
 */
char fold(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    switch (c) {
    case '0':
        return 'o';
    case '1':
        return 'i';
    case '3':
        return 'e';
    case '4':
    case '@':
        return 'a';
    case '5':
    case '$':
        return 's';
    case '7':
        return 't';
    default:
        break;
    }
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
        return c;
    }
    return SEPARATOR;
}

/// Folded text with separators removed
std::string fold_stripped(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (char f = fold(c); f != SEPARATOR) {
            out.push_back(f);
        }
    }
    return out;
}

/// Folded tokens between separators
std::vector<std::string> fold_tokens(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        char f = fold(c);
        if (f == SEPARATOR) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(f);
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

/**
 * @brief Locate each token in the stripped text, joining runs of one-letter tokens.
 *
 * "push-it" yields two segments, so no term straddles the dash. "f-u-c-k" yields
 * a single segment "fuck".
 */
std::vector<Span> segments_of(const std::vector<std::string>& tokens) {
    std::vector<Span> segments;
    std::size_t offset = 0;
    bool in_letter_run = false;
    for (const auto& token : tokens) {
        const bool single = token.size() == 1;
        if (single && in_letter_run) {
            segments.back().end += 1;
        } else {
            segments.push_back({offset, offset + token.size()});
        }
        in_letter_run = single;
        offset += token.size();
    }
    return segments;
}

/**
 * @brief Match term at text[pos], letting each term letter absorb repeats.
 *
 * A letter followed by the same letter in the term (the "ss" in "ass") consumes
 * exactly one byte so the next letter still has something to match.
 *
 * @return One past the last matched byte, or nullopt if the term does not match here
 */
std::optional<std::size_t> match_at(std::string_view text, std::size_t pos,
                                    std::string_view term) {
    std::size_t i = pos;
    for (std::size_t j = 0; j < term.size(); ++j) {
        if (i >= text.size() || text[i] != term[j]) {
            return std::nullopt;
        }
        ++i;
        const bool doubled = j + 1 < term.size() && term[j + 1] == term[j];
        if (!doubled) {
            while (i < text.size() && text[i] == term[j]) {
                ++i;
            }
        }
    }
    return i;
}

bool covered(const std::vector<Span>& allowed, Span hit) {
    for (const auto& span : allowed) {
        if (span.begin <= hit.begin && hit.end <= span.end) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string_view to_string(MatchMode mode) {
    return mode == MatchMode::WholeWord ? "whole_word" : "substring";
}

std::optional<MatchMode> parse_match_mode(std::string_view name) {
    if (name == "substring") {
        return MatchMode::Substring;
    }
    if (name == "whole_word") {
        return MatchMode::WholeWord;
    }
    return std::nullopt;
}

const Dictionary& default_dictionary() {
    static const Dictionary instance = [] {
        Dictionary dictionary;
        for (const auto& builtin : BUILTIN_TERMS) {
            dictionary.terms.push_back(
                {builtin.term, builtin.category, builtin.severity, builtin.match});
        }
        for (const auto* word : BUILTIN_ALLOW) {
            dictionary.allow.emplace_back(word);
        }
        return dictionary;
    }();
    return instance;
}

WordListClassifier::WordListClassifier() : WordListClassifier(default_dictionary()) {}

WordListClassifier::WordListClassifier(const Dictionary& dictionary) {
    add(dictionary);
}

WordListClassifier WordListClassifier::with_extensions(const Dictionary& extra) {
    WordListClassifier classifier;
    classifier.add(extra);
    return classifier;
}

void WordListClassifier::add(const Dictionary& dictionary) {
    for (const auto& entry : dictionary.terms) {
        auto folded = fold_stripped(entry.term);
        if (folded.empty()) {
            continue;
        }
        terms_.push_back({std::move(folded), entry.category, entry.severity, entry.match});
    }
    for (const auto& word : dictionary.allow) {
        auto folded = fold_stripped(word);
        if (!folded.empty()) {
            allow_.push_back(std::move(folded));
        }
    }
}

ContentAnalysis WordListClassifier::classify(std::string_view text) const {
    ContentAnalysis analysis;
    if (terms_.empty()) {
        return analysis;
    }

    const auto stripped = fold_stripped(text);
    const auto tokens = fold_tokens(text);
    const auto segments = segments_of(tokens);

    std::vector<Span> allowed;
    for (const auto& word : allow_) {
        for (std::size_t pos = 0; pos < stripped.size(); ++pos) {
            if (auto end = match_at(stripped, pos, word)) {
                allowed.push_back({pos, *end});
            }
        }
    }

    for (const auto& entry : terms_) {
        if (entry.match == MatchMode::WholeWord) {
            for (const auto& token : tokens) {
                if (match_at(token, 0, entry.term) == token.size()) {
                    analysis.record(entry.category, entry.severity);
                }
            }
            continue;
        }

        for (const auto& segment : segments) {
            const auto bounded = std::string_view(stripped).substr(0, segment.end);
            for (std::size_t pos = segment.begin; pos < segment.end; ++pos) {
                auto end = match_at(bounded, pos, entry.term);
                if (end && !covered(allowed, {pos, *end})) {
                    analysis.record(entry.category, entry.severity);
                }
            }
        }
    }

    return analysis;
}

const IContentClassifier& default_classifier() {
    static const WordListClassifier instance;
    return instance;
}

} // namespace labelguard
