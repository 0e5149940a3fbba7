// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <format>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/common.h>

namespace labelguard {

/**
 * @brief Structured log record with optional context fields.
 *
 * Rendered as additional keys of the JSON log line:
 *   {"timestamp":...,"level":...,"msg":...,"component":...,"operation":...}
 */
class LogEntry {
public:
    struct ErrorContext {
        std::string type;
        std::string message;
    };

    explicit LogEntry(std::string msg) : msg_(std::move(msg)) {}

    LogEntry& component(std::string value) {
        component_ = std::move(value);
        return *this;
    }

    LogEntry& operation(std::string value) {
        operation_ = std::move(value);
        return *this;
    }

    /// Project name (or rejected candidate) the record refers to
    LogEntry& name(std::string value) {
        name_ = std::move(value);
        return *this;
    }

    LogEntry& error(ErrorContext value) {
        error_ = std::move(value);
        return *this;
    }

    /**
     * @brief Render the JSON members of this record, without enclosing braces.
     */
    [[nodiscard]] std::string render() const;

private:
    std::string msg_;
    std::optional<std::string> component_;
    std::optional<std::string> operation_;
    std::optional<std::string> name_;
    std::optional<ErrorContext> error_;
};

/**
 * @brief Process-wide JSON logger writing to stderr.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with a level name (trace|debug|info|warn|warning|error).
     *
     * @throws std::runtime_error on unknown level
     */
    static void init(const std::string& level);

    /// Flush and drop the logger
    static void shutdown();

    static bool should_log(spdlog::level::level_enum level);

    static void log(spdlog::level::level_enum level, const std::string& msg);
    static void log(spdlog::level::level_enum level, const LogEntry& entry);
};

} // namespace labelguard

#define LABELGUARD_LOG_IMPL(lvl, ...)                                                          \
    do {                                                                                       \
        if (::labelguard::Logger::should_log(lvl)) {                                           \
            ::labelguard::Logger::log(lvl, std::format(__VA_ARGS__));                          \
        }                                                                                      \
    } while (0)

#define LABELGUARD_LOG_ENTRY_IMPL(lvl, entry)                                                  \
    do {                                                                                       \
        if (::labelguard::Logger::should_log(lvl)) {                                           \
            ::labelguard::Logger::log(lvl, entry);                                             \
        }                                                                                      \
    } while (0)

#define LOG_TRACE(...) LABELGUARD_LOG_IMPL(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) LABELGUARD_LOG_IMPL(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) LABELGUARD_LOG_IMPL(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) LABELGUARD_LOG_IMPL(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) LABELGUARD_LOG_IMPL(spdlog::level::err, __VA_ARGS__)

#define LOG_TRACE_ENTRY(entry) LABELGUARD_LOG_ENTRY_IMPL(spdlog::level::trace, entry)
#define LOG_DEBUG_ENTRY(entry) LABELGUARD_LOG_ENTRY_IMPL(spdlog::level::debug, entry)
#define LOG_INFO_ENTRY(entry) LABELGUARD_LOG_ENTRY_IMPL(spdlog::level::info, entry)
#define LOG_WARN_ENTRY(entry) LABELGUARD_LOG_ENTRY_IMPL(spdlog::level::warn, entry)
#define LOG_ERROR_ENTRY(entry) LABELGUARD_LOG_ENTRY_IMPL(spdlog::level::err, entry)
