// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include "version.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <iostream>

namespace labelguard {

CliConfig parse_cli_args(int argc, char* argv[]) {
    CliConfig config;

    CLI::App app{"Project name validator " + version_string()};
    app.set_version_flag("--version", version_string());
    // Let -c/-s also follow a subcommand
    app.fallthrough();

    // Bootstrap options for Service mode
    app.add_option("-c,--config", config.config_path, "Path to JSON configuration file")
        ->check(CLI::ExistingFile);

    app.add_option("-s,--schema", config.schema_path, "Path to JSON schema for configuration")
        ->check(CLI::ExistingFile);

    // Check subcommand: names starting with '-' must follow "--"
    auto check_cmd = app.add_subcommand("check", "Validate project names and exit");
    check_cmd->add_option("names", config.names, "Candidate project names")->required();
    check_cmd->add_flag("--json", config.json_output, "Print results as a JSON array");

    // Healthcheck subcommand (CLI-only for simplicity)
    auto healthcheck_cmd = app.add_subcommand("healthcheck", "Query service health endpoint");
    healthcheck_cmd
        ->add_option("--port", config.healthcheck_port, "Port of validation server to query")
        ->check(CLI::Range(1024, 65535))
        ->default_val(8080);
    healthcheck_cmd
        ->add_option("--endpoint", config.healthcheck_endpoint, "Health endpoint to query")
        ->default_str("/readyz");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Determine mode
    if (healthcheck_cmd->parsed()) {
        config.mode = CliConfig::Mode::Healthcheck;
        return config;
    }

    if (check_cmd->parsed()) {
        config.mode = CliConfig::Mode::Check;
        // Config is optional here, but only meaningful together with its schema
        if (config.config_path.empty() != config.schema_path.empty()) {
            std::cerr << "Error: --config and --schema must be given together\n";
            std::exit(1);
        }
        return config;
    }

    config.mode = CliConfig::Mode::Service;
    // Require config and schema files in Service mode
    if (config.config_path.empty()) {
        std::cerr << "Error: --config is required in service mode\n";
        std::exit(1);
    }
    if (config.schema_path.empty()) {
        std::cerr << "Error: --schema is required in service mode\n";
        std::exit(1);
    }

    return config;
}

} // namespace labelguard
