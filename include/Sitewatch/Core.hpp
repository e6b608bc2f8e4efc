// =================================================================
// include/Sitewatch/Core.hpp
// =================================================================
// Defines the command dispatcher behind the sitewatch executable.

#pragma once

#include "Sitewatch/CliParser.hpp"
#include "Sitewatch/ConfigParser.hpp"
#include <memory>
#include <string>

namespace Sitewatch {
    class DetectionOrchestrator;
}

namespace Sitewatch {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @throws ConfigError if the configuration file is invalid
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Defined in the .cpp file because of the forward-declared orchestrator.
     */
    ~Core();

    /**
     * @brief Runs the handler for the parsed command.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleServe();
    int handleModels();
    int handleHealth();
    int handleDetect();

    void configureLogging();

    const Commands& m_commands;
    ApplicationConfig m_config;
    std::unique_ptr<DetectionOrchestrator> m_orchestrator;
};

} // namespace Sitewatch
