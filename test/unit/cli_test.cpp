// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include "test_utils.hpp"
#include "version.hpp"

#include <cstdlib>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iostream>
#include <vector>

namespace labelguard {
namespace {

using test::TempFile;

/**
 * @brief Helper to convert string vector to argc/argv format.
 */
class ArgvHelper {
public:
    ArgvHelper(const std::vector<std::string>& args) {
        for (const auto& arg : args) {
            args_.push_back(arg);
        }
        argv_.reserve(args_.size());
        for (auto& arg : args_) {
            argv_.push_back(&arg[0]);
        }
    }

    int argc() const { return static_cast<int>(argv_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char*> argv_;
};

//
// Service mode tests
//

/**
 * @brief Test service mode with valid config and schema files.
 */
TEST(CliTest, ServiceModeWithConfigAndSchema) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper(
        {"labelguard", "--config", config_file.path_str(), "--schema", schema_file.path_str()});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Service);
    EXPECT_EQ(config.config_path, config_file.path_str());
    EXPECT_EQ(config.schema_path, schema_file.path_str());
}

TEST(CliTest, ServiceModeWithShortOptions) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper({"labelguard", "-c", config_file.path_str(), "-s", schema_file.path_str()});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Service);
    EXPECT_EQ(config.config_path, config_file.path_str());
}

TEST(CliTest, ServiceModeWithoutConfigExits) {
    TempFile schema_file;
    ArgvHelper helper({"labelguard", "--schema", schema_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1), "");
}

TEST(CliTest, ServiceModeWithoutSchemaExits) {
    TempFile config_file;
    ArgvHelper helper({"labelguard", "--config", config_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1), "");
}

TEST(CliTest, ServiceModeWithoutArgsExits) {
    ArgvHelper helper({"labelguard"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1), "");
}

TEST(CliTest, ServiceModeWithNonExistentConfigExits) {
    TempFile schema_file;
    ArgvHelper helper({"labelguard", "--config", "/nonexistent/config.json", "--schema",
                       schema_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(105), "");
}

//
// Check subcommand tests
//

TEST(CliTest, CheckSubcommandCollectsNames) {
    ArgvHelper helper({"labelguard", "check", "kebab-case", "Bad_Name", "x"});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Check);
    EXPECT_EQ(config.names, (std::vector<std::string>{"kebab-case", "Bad_Name", "x"}));
    EXPECT_FALSE(config.json_output);
    EXPECT_TRUE(config.config_path.empty());
}

TEST(CliTest, CheckSubcommandJsonFlag) {
    ArgvHelper helper({"labelguard", "check", "--json", "kebab-case"});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Check);
    EXPECT_TRUE(config.json_output);
    EXPECT_EQ(config.names, (std::vector<std::string>{"kebab-case"}));
}

TEST(CliTest, CheckSubcommandAcceptsDashNamesAfterSeparator) {
    ArgvHelper helper({"labelguard", "check", "--", "-invalid-name"});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.names, (std::vector<std::string>{"-invalid-name"}));
}

TEST(CliTest, CheckSubcommandWithConfig) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper({"labelguard", "check", "-c", config_file.path_str(), "-s",
                       schema_file.path_str(), "my-app"});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Check);
    EXPECT_EQ(config.config_path, config_file.path_str());
    EXPECT_EQ(config.schema_path, schema_file.path_str());
    EXPECT_EQ(config.names, (std::vector<std::string>{"my-app"}));
}

TEST(CliTest, CheckSubcommandConfigWithoutSchemaExits) {
    TempFile config_file;
    ArgvHelper helper({"labelguard", "check", "-c", config_file.path_str(), "my-app"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1), "");
}

TEST(CliTest, CheckSubcommandRequiresNames) {
    ArgvHelper helper({"labelguard", "check"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(106), "");
}

//
// Healthcheck subcommand tests
//

TEST(CliTest, HealthcheckSubcommandDefaults) {
    ArgvHelper helper({"labelguard", "healthcheck"});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Healthcheck);
    EXPECT_EQ(config.healthcheck_endpoint, "/readyz");
    EXPECT_EQ(config.healthcheck_port, 8080);
    EXPECT_TRUE(config.config_path.empty());
    EXPECT_TRUE(config.schema_path.empty());
}

TEST(CliTest, HealthcheckSubcommandWithAllOptions) {
    ArgvHelper helper({"labelguard", "healthcheck", "--port", "7777", "--endpoint", "/healthz"});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Healthcheck);
    EXPECT_EQ(config.healthcheck_port, 7777);
    EXPECT_EQ(config.healthcheck_endpoint, "/healthz");
}

TEST(CliTest, HealthcheckPortBoundaries) {
    {
        ArgvHelper helper({"labelguard", "healthcheck", "--port", "1024"});
        EXPECT_EQ(parse_cli_args(helper.argc(), helper.argv()).healthcheck_port, 1024);
    }
    {
        ArgvHelper helper({"labelguard", "healthcheck", "--port", "65535"});
        EXPECT_EQ(parse_cli_args(helper.argc(), helper.argv()).healthcheck_port, 65535);
    }
}

TEST(CliTest, HealthcheckPortOutOfRange) {
    {
        ArgvHelper helper({"labelguard", "healthcheck", "--port", "1023"});
        EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(105),
                    "");
    }
    {
        ArgvHelper helper({"labelguard", "healthcheck", "--port", "abc"});
        EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(105),
                    "");
    }
}

//
// General CLI tests
//

TEST(CliTest, HelpFlag) {
    ArgvHelper helper({"labelguard", "--help"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(0), "");
}

TEST(CliTest, VersionFlagPrintsBuildMetadata) {
    ArgvHelper helper({"labelguard", "--version"});
    EXPECT_EXIT(
        {
            // CLI11 prints the version on stdout; mirror it to stderr for the matcher
            std::cout.rdbuf(std::cerr.rdbuf());
            parse_cli_args(helper.argc(), helper.argv());
        },
        ::testing::ExitedWithCode(0), ::testing::HasSubstr(version_string()));
}

TEST(CliTest, InvalidOption) {
    ArgvHelper helper({"labelguard", "--invalid-option"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(109), "");
}

} // namespace
} // namespace labelguard
