// =================================================================
// src/Sitewatch/Core.cpp
// =================================================================
// Implementation of the sitewatch command handlers.

#include "Sitewatch/Core.hpp"
#include "Sitewatch/ApiServer.hpp"
#include "Sitewatch/DetectionOrchestrator.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/JsonCodec.hpp"
#include "Sitewatch/Logger.hpp"
#include <iostream>

namespace Sitewatch {

Core::Core(const Commands& commands) : m_commands(commands) {
    if (m_commands.config_path.empty()) {
        m_config.models = ConfigParser::defaultModels();
    } else {
        m_config = ConfigParser::loadFile(m_commands.config_path);
    }

    configureLogging();
    m_orchestrator = std::make_unique<DetectionOrchestrator>(m_config);
}

Core::~Core() = default;

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();
    if (m_config.logging.file) {
        logger.initialize(m_config.logging.directory);
    }
    logger.setConsoleLogging(m_config.logging.console);
    logger.setConsoleLogLevel(Logger::parseLevel(m_config.logging.level));
}

int Core::run() {
    if (m_commands.active_command == "serve") {
        return handleServe();
    } else if (m_commands.active_command == "models") {
        return handleModels();
    } else if (m_commands.active_command == "health") {
        return handleHealth();
    } else if (m_commands.active_command == "detect") {
        return handleDetect();
    } else if (m_commands.active_command.empty()) {
        return 0;
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return 1;
}

int Core::handleServe() {
    ServerConfig server_config = m_config.server;
    if (!m_commands.host.empty()) {
        server_config.host = m_commands.host;
    }
    if (m_commands.port > 0) {
        server_config.port = m_commands.port;
    }

    if (!m_commands.no_health_monitor) {
        m_orchestrator->startHealthMonitor();
    }

    ApiServer server(*m_orchestrator, server_config);
    bool ok = server.listen();
    m_orchestrator->stopHealthMonitor();
    return ok ? 0 : 1;
}

int Core::handleModels() {
    nlohmann::json ab_tests = nlohmann::json::array();
    for (const auto& test : m_orchestrator->listABTests()) {
        ab_tests.push_back(JsonCodec::toJson(test));
    }

    nlohmann::json output = {
        {"models", JsonCodec::toJson(m_orchestrator->listModels())},
        {"ab_tests", ab_tests}
    };
    std::cout << output.dump(2) << std::endl;

    const RegistryStatus& status = m_orchestrator->getRegistryStatus();
    for (const auto& result : status.load_results) {
        if (!result.success) {
            std::cerr << "✗ " << result.model_id << ": " << result.error_message << std::endl;
        }
    }
    return status.failed_to_load == 0 ? 0 : 1;
}

int Core::handleHealth() {
    if (m_commands.probe) {
        m_orchestrator->runHealthCheck();
    }

    HealthSummary summary = m_orchestrator->getHealthSummary();
    std::cout << JsonCodec::toJson(summary).dump(2) << std::endl;
    return summary.status == "healthy" ? 0 : 1;
}

int Core::handleDetect() {
    DetectionRequest request;
    request.photo_id = m_commands.photo_id;
    request.photo_url = m_commands.photo_url;
    request.priority = DetectionTypeUtils::stringToPriority(m_commands.priority);
    if (m_commands.capabilities.empty()) {
        request.capabilities = {Capability::DAMAGE, Capability::MATERIAL};
    } else {
        for (const auto& name : m_commands.capabilities) {
            request.capabilities.push_back(DetectionTypeUtils::stringToCapability(name));
        }
    }

    std::optional<std::string> correlation_id;
    if (!m_commands.correlation_id.empty()) {
        correlation_id = m_commands.correlation_id;
    }
    std::optional<std::chrono::milliseconds> request_timeout;
    if (m_commands.request_timeout_ms >= 0) {
        request_timeout = std::chrono::milliseconds(m_commands.request_timeout_ms);
    }

    try {
        DetectionResponse response = m_orchestrator->submit(request, correlation_id, request_timeout);
        std::cout << JsonCodec::toJson(response).dump(2) << std::endl;
        return response.status == DetectionStatus::FAILED ? 1 : 0;
    } catch (const OrchestratorError& e) {
        std::cerr << "Error: " << e.describe() << std::endl;
        return 1;
    }
}

} // namespace Sitewatch
