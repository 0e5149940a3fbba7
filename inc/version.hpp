// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <format>
#include <string>

// Build metadata. CMakeLists.txt passes the real values as compile definitions;
// the fallbacks below only apply to builds outside CMake.
#ifndef LABELGUARD_SERVICE_NAME
    #define LABELGUARD_SERVICE_NAME "labelguard"
#endif

#ifndef LABELGUARD_SERVICE_VERSION
    #define LABELGUARD_SERVICE_VERSION "dev"
#endif

#ifndef LABELGUARD_GIT_COMMIT
    #define LABELGUARD_GIT_COMMIT "unknown"
#endif

namespace labelguard {

/// Name reported as "service" in every log line
constexpr const char* SERVICE_NAME = LABELGUARD_SERVICE_NAME;
constexpr const char* SERVICE_VERSION = LABELGUARD_SERVICE_VERSION;
constexpr const char* GIT_COMMIT = LABELGUARD_GIT_COMMIT;

/**
 * @brief Text printed by `labelguard --version`, e.g. "labelguard 0.1.0 (3f2a9c1)".
 */
inline std::string version_string() {
    return std::format("{} {} ({})", SERVICE_NAME, SERVICE_VERSION, GIT_COMMIT);
}

} // namespace labelguard
