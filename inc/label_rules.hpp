// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string_view>

namespace labelguard {

/// Longest label accepted (hostname label limit, RFC 1123).
constexpr std::size_t MAX_LABEL_LENGTH = 63;

/**
 * @brief Check whether a byte is allowed inside a project name label.
 *
 * Allowed: ASCII lowercase letters (a-z), digits (0-9) and hyphen (-).
 */
constexpr bool isLabelChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
}

/**
 * @brief Validate the syntactic shape of a project name label.
 *
 * A strict subset of an RFC 1123 host label:
 * - non-empty and at most MAX_LABEL_LENGTH bytes
 * - does not start or end with a hyphen
 * - only lowercase ASCII alphanumerics and hyphens
 *
 * Host labels are case-insensitive, but filesystems are not, so uppercase
 * letters are rejected rather than folded.
 *
 * @param label Candidate label
 * @return true if the label is well formed
 */
bool isWellFormedLabel(std::string_view label);

} // namespace labelguard
