// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

namespace labelguard {

/**
 * @brief Query a running validation server's health endpoint.
 *
 * Intended as a container healthcheck: prints nothing on success.
 *
 * @param endpoint Path to query (e.g., "/readyz")
 * @param port Port of the server on localhost
 * @return 0 if the endpoint answered 200, 1 otherwise
 */
int run_healthcheck_command(const std::string& endpoint, int port);

} // namespace labelguard
