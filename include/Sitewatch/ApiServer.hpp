// =================================================================
// include/Sitewatch/ApiServer.hpp
// =================================================================
// HTTP front end for the detection orchestrator.

#pragma once

#include "Sitewatch/ConfigParser.hpp"
#include "Sitewatch/DetectionOrchestrator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace httplib {
class Server;
}

namespace Sitewatch {

/**
 * @brief Status code and JSON body produced by a route handler
 */
struct ApiReply {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief Serves the orchestrator under /api/v1/orchestrator
 *
 * Route handlers are plain methods so they can be exercised without a socket.
 */
class ApiServer {
public:
    ApiServer(DetectionOrchestrator& orchestrator, const ServerConfig& config);
    virtual ~ApiServer();

    /**
     * @brief Bind and serve until stop() is called
     * @return False if the address could not be bound
     */
    virtual bool listen();

    virtual void stop();

    /// POST /detect; 400 on a malformed request.
    virtual ApiReply handleDetect(const std::string& body, const std::optional<std::string>& correlation_id);
    virtual ApiReply handleHealth();
    virtual ApiReply handleMetrics();
    /// GET /status/{id}; 404 for unknown ids.
    virtual ApiReply handleStatus(const std::string& request_id);
    virtual ApiReply handleModels();

    static constexpr const char* kBasePath = "/api/v1/orchestrator";

private:
    DetectionOrchestrator& m_orchestrator;
    ServerConfig m_config;
    std::unique_ptr<httplib::Server> m_server;

    void setupRoutes();
    static ApiReply errorReply(int status, const std::string& message);
};

} // namespace Sitewatch
