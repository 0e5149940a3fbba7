// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "healthcheck_command.hpp"

#include <iostream>

#include <httplib.h>

namespace labelguard {

namespace {
constexpr int HEALTHCHECK_TIMEOUT_SECONDS = 2;
}

int run_healthcheck_command(const std::string& endpoint, int port) {
    httplib::Client client("localhost", port);
    client.set_connection_timeout(HEALTHCHECK_TIMEOUT_SECONDS);
    client.set_read_timeout(HEALTHCHECK_TIMEOUT_SECONDS);

    auto res = client.Get(endpoint);
    if (!res) {
        std::cerr << "Healthcheck failed: " << httplib::to_string(res.error()) << "\n";
        return 1;
    }
    if (res->status != 200) {
        std::cerr << "Healthcheck failed: HTTP " << res->status << " " << res->body << "\n";
        return 1;
    }
    return 0;
}

} // namespace labelguard
