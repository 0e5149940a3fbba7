// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>
#include <unordered_set>

namespace labelguard {

/**
 * @brief Names that can never be claimed as project names.
 *
 * Platform and product names, plus subdomains used by the platform itself.
 * The set is built once on first use (thread-safe) and is immutable afterwards.
 *
 * @return Reference to the process-wide reserved word set
 */
const std::unordered_set<std::string_view>& reserved_words();

/**
 * @brief Exact, case-sensitive membership test against reserved_words().
 */
bool isReservedWord(std::string_view name);

} // namespace labelguard
