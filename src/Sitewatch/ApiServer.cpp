// =================================================================
// src/Sitewatch/ApiServer.cpp
// =================================================================
// Implementation of the HTTP API routes.

#include "Sitewatch/ApiServer.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/JsonCodec.hpp"
#include "Sitewatch/Logger.hpp"
#include <httplib.h>

namespace Sitewatch {

namespace {

void writeReply(httplib::Response& res, const ApiReply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(), "application/json");
}

} // namespace

ApiServer::ApiServer(DetectionOrchestrator& orchestrator, const ServerConfig& config)
    : m_orchestrator(orchestrator), m_config(config), m_server(std::make_unique<httplib::Server>()) {
    setupRoutes();
}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::listen() {
    Logger::getInstance().info("ApiServer", "Listening on " + m_config.host + ":" +
                               std::to_string(m_config.port));
    bool ok = m_server->listen(m_config.host.c_str(), m_config.port);
    if (!ok) {
        Logger::getInstance().error("ApiServer", "Failed to bind " + m_config.host + ":" +
                                    std::to_string(m_config.port));
    }
    return ok;
}

void ApiServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
        Logger::getInstance().info("ApiServer", "Server stopped");
    }
}

void ApiServer::setupRoutes() {
    const std::string base = kBasePath;

    m_server->Post(base + "/detect", [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<std::string> correlation_id;
        if (req.has_header("X-Correlation-ID")) {
            correlation_id = req.get_header_value("X-Correlation-ID");
        }
        ApiReply reply = handleDetect(req.body, correlation_id);
        if (reply.body.contains("correlation_id") && reply.body["correlation_id"].is_string()) {
            res.set_header("X-Correlation-ID", reply.body["correlation_id"].get<std::string>());
        }
        writeReply(res, reply);
    });

    m_server->Get(base + "/health", [this](const httplib::Request&, httplib::Response& res) {
        writeReply(res, handleHealth());
    });

    m_server->Get(base + "/metrics", [this](const httplib::Request&, httplib::Response& res) {
        writeReply(res, handleMetrics());
    });

    m_server->Get(base + R"(/status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        writeReply(res, handleStatus(req.matches[1]));
    });

    m_server->Get(base + "/models", [this](const httplib::Request&, httplib::Response& res) {
        writeReply(res, handleModels());
    });
}

ApiReply ApiServer::handleDetect(const std::string& body, const std::optional<std::string>& correlation_id) {
    nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        return errorReply(400, "Request body is not valid JSON");
    }

    try {
        DetectionRequest request = JsonCodec::requestFromJson(json);
        DetectionResponse response = m_orchestrator.submit(request, correlation_id);
        return {200, JsonCodec::toJson(response)};
    } catch (const OrchestratorError& e) {
        Logger::getInstance().warning("ApiServer", "Rejected detection request", e.describe());
        return errorReply(400, e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error("ApiServer", "Detection request failed: " + std::string(e.what()));
        return errorReply(500, e.what());
    }
}

ApiReply ApiServer::handleHealth() {
    try {
        return {200, JsonCodec::toJson(m_orchestrator.getHealthSummary())};
    } catch (const std::exception& e) {
        Logger::getInstance().error("ApiServer", "Error getting health status: " + std::string(e.what()));
        return {503, {{"status", "unhealthy"}, {"error", e.what()}}};
    }
}

ApiReply ApiServer::handleMetrics() {
    try {
        return {200, JsonCodec::toJson(m_orchestrator.getMetrics())};
    } catch (const std::exception& e) {
        Logger::getInstance().error("ApiServer", "Error getting metrics: " + std::string(e.what()));
        return errorReply(500, "Failed to get metrics: " + std::string(e.what()));
    }
}

ApiReply ApiServer::handleStatus(const std::string& request_id) {
    try {
        return {200, JsonCodec::toJson(m_orchestrator.getStatus(request_id))};
    } catch (const RequestNotFoundError& e) {
        return errorReply(404, e.what());
    }
}

ApiReply ApiServer::handleModels() {
    nlohmann::json ab_tests = nlohmann::json::array();
    for (const auto& test : m_orchestrator.listABTests()) {
        ab_tests.push_back(JsonCodec::toJson(test));
    }
    return {200, {{"models", JsonCodec::toJson(m_orchestrator.listModels())}, {"ab_tests", ab_tests}}};
}

ApiReply ApiServer::errorReply(int status, const std::string& message) {
    return {status, {{"detail", message}}};
}

} // namespace Sitewatch
