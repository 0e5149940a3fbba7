// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "content_classifier.hpp"

#include <atomic>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace httplib {
class Server;
}

namespace labelguard {

/**
 * @brief HTTP server answering project name validity queries.
 *
 * Endpoints:
 * - GET  /healthz                  liveness probe
 * - GET  /readyz                   readiness probe
 * - GET  /v1/project-names/<name>  validity of a single name
 * - POST /v1/project-names         body {"name": "..."}; 422 if invalid
 *
 * Runs on a background thread. The classifier must outlive the server.
 */
class ValidationServer {
public:
    ValidationServer(std::string host, int port, const IContentClassifier& classifier,
                     std::atomic<bool>& liveness, std::atomic<bool>& readiness);
    ~ValidationServer();

    ValidationServer(const ValidationServer&) = delete;
    ValidationServer& operator=(const ValidationServer&) = delete;

    void start();
    void stop();

    // Response builders, exposed for unit tests: {status code, JSON body}
    static std::pair<int, std::string> handle_healthz(bool is_healthy);
    static std::pair<int, std::string> handle_readyz(bool is_ready);
    static std::pair<int, std::string> handle_name_query(std::string_view name,
                                                         const IContentClassifier& classifier);
    static std::pair<int, std::string> handle_name_request(std::string_view body,
                                                           const IContentClassifier& classifier);

private:
    void server_thread();

    std::string host_;
    int port_;
    const IContentClassifier& classifier_;
    std::atomic<bool>& liveness_;
    std::atomic<bool>& readiness_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<httplib::Server*> server_{nullptr};
    std::thread thread_;
};

} // namespace labelguard
