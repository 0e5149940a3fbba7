// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Environment variable names for runtime configuration overrides.
//
// These constants provide a single source of truth for environment variable
// names used to override configuration file values at runtime.
// -----------------------------------------------------------------------------

namespace labelguard::env {

/// Environment variable for overriding log level (trace/debug/info/warn/error)
constexpr const char* LOG_LEVEL = "LABELGUARD_LOG_LEVEL";

/// Environment variable for overriding validation server port (1024-65535)
constexpr const char* PORT = "LABELGUARD_PORT";

} // namespace labelguard::env
