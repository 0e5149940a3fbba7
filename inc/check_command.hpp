// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "content_classifier.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace labelguard {

/// Exit code when at least one name is invalid
constexpr int EXIT_INVALID_NAME = 2;

/**
 * @brief Validate names and print one result per name.
 *
 * Text output: "<name>\tvalid" or "<name>\tinvalid" per line.
 * JSON output: [{"name":"...","valid":true}, ...]
 *
 * @param names Candidates, in output order
 * @param json_output Print a JSON array instead of text lines
 * @param classifier Profanity scorer
 * @param out Output stream
 * @return 0 if every name is valid, EXIT_INVALID_NAME otherwise
 */
int run_check_command(const std::vector<std::string>& names, bool json_output,
                      const IContentClassifier& classifier, std::ostream& out);

} // namespace labelguard
