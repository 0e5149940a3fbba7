// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "healthcheck_command.hpp"

#include "test_utils.hpp"
#include "validation_server.hpp"
#include "word_list_classifier.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

namespace labelguard {
namespace {

constexpr char LOOPBACK[] = "127.0.0.1";

/**
 * @brief Runs a ValidationServer on a free loopback port for the test's lifetime.
 */
class ValidationServerLiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        port_ = test::free_tcp_port();
        server_ = std::make_unique<ValidationServer>(LOOPBACK, port_, default_classifier(),
                                                     liveness_, readiness_);
        liveness_ = true;
        server_->start();
    }

    void TearDown() override { server_->stop(); }

    /// Poll the healthcheck until it reports expected_rc or about two seconds pass
    int wait_for_healthcheck(const std::string& endpoint, int expected_rc) {
        int rc = run_healthcheck_command(endpoint, port_);
        for (int attempt = 0; rc != expected_rc && attempt < 40; ++attempt) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            rc = run_healthcheck_command(endpoint, port_);
        }
        return rc;
    }

    int port_ = 0;
    std::atomic<bool> liveness_{false};
    std::atomic<bool> readiness_{false};
    std::unique_ptr<ValidationServer> server_;
};

TEST_F(ValidationServerLiveTest, HealthcheckPassesWhenReady) {
    readiness_ = true;
    EXPECT_EQ(wait_for_healthcheck("/readyz", 0), 0);
    EXPECT_EQ(run_healthcheck_command("/healthz", port_), 0);
}

TEST_F(ValidationServerLiveTest, HealthcheckFailsWhenNotReady) {
    ASSERT_EQ(wait_for_healthcheck("/healthz", 0), 0);
    EXPECT_EQ(run_healthcheck_command("/readyz", port_), 1);

    readiness_ = true;
    EXPECT_EQ(run_healthcheck_command("/readyz", port_), 0);
}

TEST_F(ValidationServerLiveTest, HealthcheckFailsAfterStop) {
    ASSERT_EQ(wait_for_healthcheck("/healthz", 0), 0);
    server_->stop();
    EXPECT_EQ(run_healthcheck_command("/healthz", port_), 1);
}

TEST_F(ValidationServerLiveTest, ServesNameRoutes) {
    ASSERT_EQ(wait_for_healthcheck("/healthz", 0), 0);
    httplib::Client client(LOOPBACK, port_);

    auto query = client.Get("/v1/project-names/kebab-case");
    ASSERT_TRUE(query);
    EXPECT_EQ(query->status, 200);
    EXPECT_EQ(query->body, R"({"name":"kebab-case","valid":true})");

    auto create = client.Post("/v1/project-names", R"({"name":"shuttle"})", "application/json");
    ASSERT_TRUE(create);
    EXPECT_EQ(create->status, 422);
}

TEST(HealthcheckCommandTest, NothingListeningFails) {
    EXPECT_EQ(run_healthcheck_command("/readyz", test::free_tcp_port()), 1);
}

} // namespace
} // namespace labelguard
