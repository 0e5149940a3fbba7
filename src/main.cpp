// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "check_command.hpp"
#include "cli.hpp"
#include "config_loader.hpp"
#include "dictionary_loader.hpp"
#include "healthcheck_command.hpp"
#include "logger.hpp"
#include "validation_server.hpp"
#include "word_list_classifier.hpp"

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;
std::atomic<bool> g_liveness{false};
std::atomic<bool> g_readiness{false};

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

/**
 * @brief Build the classifier: built-in dictionary, extended by the configured one.
 * @throws std::runtime_error if the configured dictionary cannot be loaded
 */
std::unique_ptr<labelguard::WordListClassifier>
make_classifier(const labelguard::ServiceConfig& config) {
    if (!config.dictionary_path) {
        return std::make_unique<labelguard::WordListClassifier>();
    }
    auto extra =
        labelguard::load_dictionary(*config.dictionary_path, config.dictionary_schema_path);
    return std::make_unique<labelguard::WordListClassifier>(
        labelguard::WordListClassifier::with_extensions(extra));
}
} // namespace

int main(int argc, char* argv[]) {
    // Parse command-line arguments (bootstrap only)
    auto cli_config = labelguard::parse_cli_args(argc, argv);

    // Handle healthcheck subcommand (skip config loading for speed)
    if (cli_config.mode == labelguard::CliConfig::Mode::Healthcheck) {
        return labelguard::run_healthcheck_command(cli_config.healthcheck_endpoint,
                                                   cli_config.healthcheck_port);
    }

    // Load and validate service configuration from JSON file (optional for check)
    labelguard::ServiceConfig config;
    std::unique_ptr<labelguard::WordListClassifier> classifier;
    try {
        if (!cli_config.config_path.empty()) {
            config = labelguard::load_config(cli_config.config_path, cli_config.schema_path);
        }
        classifier = make_classifier(config);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    labelguard::Logger::init(config.log_level);
    LOG_DEBUG("Classifier ready: {} terms, {} allowlisted words", classifier->term_count(),
              classifier->allow_count());

    if (cli_config.mode == labelguard::CliConfig::Mode::Check) {
        int rc = labelguard::run_check_command(cli_config.names, cli_config.json_output,
                                               *classifier, std::cout);
        labelguard::Logger::shutdown();
        return rc;
    }

    // Setup signal handlers for graceful shutdown
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    LOG_INFO("Validation service starting");

    labelguard::ValidationServer server(config.host, config.port, *classifier, g_liveness,
                                        g_readiness);
    server.start();

    g_liveness = true;
    g_readiness = true;

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Validation service shutting down gracefully");

    // Mark as not ready, stop server
    g_readiness = false;
    g_liveness = false;
    server.stop();

    labelguard::Logger::shutdown();
    return 0;
}
