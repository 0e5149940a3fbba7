// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "logger.hpp"

#include "version.hpp"

#include <memory>
#include <stdexcept>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace labelguard {

namespace {

constexpr char LOGGER_NAME[] = "labelguard";

// JSON line; the message part (%v) is pre-rendered JSON members
constexpr char LOG_PATTERN[] = R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%^%l%$",%v})";

std::shared_ptr<spdlog::logger> get_logger() {
    return spdlog::get(LOGGER_NAME);
}

spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "error") {
        return spdlog::level::err;
    }
    throw std::runtime_error("Invalid log level: " + level);
}

void write_member(rapidjson::Writer<rapidjson::StringBuffer>& writer, const char* key,
                  const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

/// Strip the enclosing braces of a rendered JSON object
std::string members_of(const rapidjson::StringBuffer& buffer) {
    std::string json(buffer.GetString(), buffer.GetSize());
    return json.substr(1, json.size() - 2);
}

} // namespace

std::string LogEntry::render() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    write_member(writer, "msg", msg_);
    write_member(writer, "service", SERVICE_NAME);
    if (component_) {
        write_member(writer, "component", *component_);
    }
    if (operation_) {
        write_member(writer, "operation", *operation_);
    }
    if (name_) {
        write_member(writer, "project_name", *name_);
    }
    if (error_) {
        writer.Key("error");
        writer.StartObject();
        write_member(writer, "type", error_->type);
        write_member(writer, "message", error_->message);
        writer.EndObject();
    }
    writer.EndObject();
    return members_of(buffer);
}

void Logger::init(const std::string& level) {
    auto parsed = parse_level(level);

    spdlog::drop(LOGGER_NAME);
    auto logger = spdlog::stderr_logger_mt(LOGGER_NAME);
    logger->set_pattern(LOG_PATTERN, spdlog::pattern_time_type::utc);
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::warn);
}

void Logger::shutdown() {
    if (auto logger = get_logger()) {
        logger->flush();
    }
    spdlog::drop(LOGGER_NAME);
}

bool Logger::should_log(spdlog::level::level_enum level) {
    auto logger = get_logger();
    return logger && logger->should_log(level);
}

void Logger::log(spdlog::level::level_enum level, const std::string& msg) {
    log(level, LogEntry(msg));
}

void Logger::log(spdlog::level::level_enum level, const LogEntry& entry) {
    if (auto logger = get_logger()) {
        logger->log(level, entry.render());
    }
}

} // namespace labelguard
