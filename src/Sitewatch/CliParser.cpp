// =================================================================
// src/Sitewatch/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Sitewatch/CliParser.hpp"

namespace Sitewatch {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Sitewatch: detection orchestrator for job-site photo inference engines.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path,
                      "Path to the orchestrator YAML configuration.")->check(CLI::ExistingFile);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupServeCommand(*m_app);
    setupModelsCommand(*m_app);
    setupHealthCommand(*m_app);
    setupDetectCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupServeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("serve", "Runs the HTTP API and the background health monitor.");
    sub->add_option("--host", m_commands.host, "Address to bind (overrides server.host).");
    sub->add_option("--port", m_commands.port, "Port to bind (overrides server.port).")->check(CLI::Range(1, 65535));
    sub->add_flag("--no-health-monitor", m_commands.no_health_monitor, "Do not start background health probes.");
}

void CliParser::setupModelsCommand(CLI::App& app) {
    app.add_subcommand("models", "Lists configured model versions and A/B tests.");
}

void CliParser::setupHealthCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("health", "Probes every enabled engine once and prints the health summary.");
    sub->add_flag("!--no-probe", m_commands.probe, "Print records without probing.");
}

void CliParser::setupDetectCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("detect", "Submits one photo for detection and prints the response.");
    sub->add_option("--photo-id", m_commands.photo_id, "Identifier of the photo.")->required();
    sub->add_option("--photo-url", m_commands.photo_url, "Storage URL of the photo.")->required();
    sub->add_option("-k,--capability", m_commands.capabilities,
                    "Capability to run (damage, material, volume); repeatable. Defaults to damage and material.")
        ->check(CLI::IsMember({"damage", "material", "volume"}));
    sub->add_option("--priority", m_commands.priority, "Request priority.")
        ->check(CLI::IsMember({"high", "normal", "low"}));
    sub->add_option("--correlation-id", m_commands.correlation_id, "Correlation id forwarded to engines.");
    sub->add_option("--timeout-ms", m_commands.request_timeout_ms, "Deadline for the whole request (0 = none).");
}

} // namespace Sitewatch
