// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "validation_server.hpp"

#include "logger.hpp"
#include "project_name.hpp"
#include "project_name_json.hpp"

#include <optional>
#include <stdexcept>

#include <httplib.h>
#include <rapidjson/document.h>
#include <rapidjson/pointer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace labelguard {

namespace {

constexpr char NAME_FIELD[] = "/name";

std::pair<int, std::string> status_response(int status_code, const char* status) {
    rapidjson::StringBuffer json_buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(json_buffer);
    writer.StartObject();
    writer.Key("status");
    writer.String(status);
    writer.EndObject();
    return {status_code, json_buffer.GetString()};
}

/**
 * @brief Build a validity body: {"name":..,"valid":..[,"message":..]}.
 *
 * @param name Candidate echoed back; omitted when not a string
 */
std::string validity_body(std::optional<std::string_view> name, bool valid) {
    rapidjson::StringBuffer json_buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(json_buffer);
    writer.StartObject();
    if (name) {
        writer.Key("name");
        writer.String(name->data(), static_cast<rapidjson::SizeType>(name->size()));
    }
    writer.Key("valid");
    writer.Bool(valid);
    if (!valid) {
        writer.Key("message");
        writer.String(InvalidProjectName::rules());
    }
    writer.EndObject();
    return json_buffer.GetString();
}

std::pair<int, std::string> error_response(int status_code, const std::string& message) {
    rapidjson::StringBuffer json_buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(json_buffer);
    writer.StartObject();
    writer.Key("error");
    writer.String(message.c_str(), static_cast<rapidjson::SizeType>(message.size()));
    writer.EndObject();
    return {status_code, json_buffer.GetString()};
}

void log_rejected(std::string_view name, const char* operation) {
    LOG_DEBUG_ENTRY(LogEntry("Project name rejected")
                        .component("validation")
                        .operation(operation)
                        .name(std::string(name)));
}

} // namespace

std::pair<int, std::string> ValidationServer::handle_healthz(bool is_healthy) {
    return is_healthy ? status_response(200, "healthy") : status_response(503, "unhealthy");
}

std::pair<int, std::string> ValidationServer::handle_readyz(bool is_ready) {
    return is_ready ? status_response(200, "ready") : status_response(503, "notready");
}

std::pair<int, std::string>
ValidationServer::handle_name_query(std::string_view name, const IContentClassifier& classifier) {
    const bool valid = ProjectName::is_valid(name, classifier);
    if (!valid) {
        log_rejected(name, "query");
    }
    return {200, validity_body(name, valid)};
}

std::pair<int, std::string>
ValidationServer::handle_name_request(std::string_view body, const IContentClassifier& classifier) {
    rapidjson::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return error_response(400, "request body must be a JSON object");
    }

    try {
        auto name = require_project_name(doc, NAME_FIELD, "request", classifier);
        return {200, validity_body(name.str(), true)};
    } catch (const InvalidProjectName&) {
        const auto* value = rapidjson::Pointer(NAME_FIELD).Get(doc);
        std::optional<std::string_view> candidate;
        if (value != nullptr && value->IsString()) {
            candidate = std::string_view(value->GetString(), value->GetStringLength());
            log_rejected(*candidate, "create");
        }
        return {422, validity_body(candidate, false)};
    } catch (const std::runtime_error& e) {
        return error_response(400, e.what());
    }
}

ValidationServer::ValidationServer(std::string host, int port,
                                   const IContentClassifier& classifier,
                                   std::atomic<bool>& liveness, std::atomic<bool>& readiness)
    : host_(std::move(host)), port_(port), classifier_(classifier), liveness_(liveness),
      readiness_(readiness) {}

void ValidationServer::start() {
    if (thread_.joinable()) {
        LOG_WARN("ValidationServer already running");
        return;
    }
    shutdown_requested_ = false;
    thread_ = std::thread(&ValidationServer::server_thread, this);
}

void ValidationServer::stop() {
    shutdown_requested_ = true;
    if (auto* server = server_.load()) {
        server->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

ValidationServer::~ValidationServer() {
    stop();
}

void ValidationServer::server_thread() {
    httplib::Server server;

    // Store server pointer for stop() to access
    server_ = &server;

    // Handler for /healthz (liveness probe)
    server.Get("/healthz", [this](const httplib::Request&, httplib::Response& res) {
        auto [status_code, json_response] = handle_healthz(liveness_.load());
        res.set_content(json_response, "application/json");
        res.status = status_code;
    });

    // Handler for /readyz (readiness probe)
    server.Get("/readyz", [this](const httplib::Request&, httplib::Response& res) {
        auto [status_code, json_response] = handle_readyz(readiness_.load());
        res.set_content(json_response, "application/json");
        res.status = status_code;
    });

    server.Get(R"(/v1/project-names/([^/]+))",
               [this](const httplib::Request& req, httplib::Response& res) {
                   auto [status_code, json_response] =
                       handle_name_query(req.matches[1].str(), classifier_);
                   res.set_content(json_response, "application/json");
                   res.status = status_code;
               });

    server.Post("/v1/project-names", [this](const httplib::Request& req, httplib::Response& res) {
        auto [status_code, json_response] = handle_name_request(req.body, classifier_);
        res.set_content(json_response, "application/json");
        res.status = status_code;
    });

    // stop() may have run before server_ was published
    if (shutdown_requested_) {
        server_ = nullptr;
        return;
    }

    LOG_INFO_ENTRY(LogEntry("Validation server listening")
                       .component("server")
                       .operation(std::format("{}:{}", host_, port_)));

    // Start server and listen (blocks until stopped)
    if (!server.listen(host_, port_)) {
        LOG_ERROR_ENTRY(LogEntry("Failed to start validation server")
                            .component("server")
                            .error({.type = "listen_error",
                                    .message = std::format("{}:{}", host_, port_)}));
    }

    server_ = nullptr;
    LOG_INFO_ENTRY(LogEntry("Validation server stopped").component("server"));
}

} // namespace labelguard
