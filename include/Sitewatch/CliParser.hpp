// =================================================================
// include/Sitewatch/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Sitewatch {

// Parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Shared by every command; empty means built-in defaults
    std::string config_path;

    // Options for 'serve'
    std::string host;
    int port = 0;               // 0 keeps the configured port
    bool no_health_monitor = false;

    // Options for 'detect'
    std::string photo_id;
    std::string photo_url;
    std::vector<std::string> capabilities;
    std::string priority = "normal";
    std::string correlation_id;
    long request_timeout_ms = -1; // -1 keeps the configured caller deadline

    // Options for 'health'
    bool probe = true;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     */
    const Commands& getCommands() const;

private:
    void setupServeCommand(CLI::App& app);
    void setupModelsCommand(CLI::App& app);
    void setupHealthCommand(CLI::App& app);
    void setupDetectCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Sitewatch
