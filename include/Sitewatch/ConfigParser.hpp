// =================================================================
// include/Sitewatch/ConfigParser.hpp
// =================================================================
// Orchestrator configuration and its YAML loader.

#pragma once

#include "Sitewatch/DetectionTypes.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace Sitewatch {

/**
 * @brief Load balancing strategy type
 */
enum class LoadBalancingStrategy {
    ROUND_ROBIN,    ///< Shared per-capability cursor over healthy versions
    WEIGHTED,       ///< Random pick weighted by inverse probe latency
    LEAST_LATENCY   ///< Lowest last probe response time
};

/**
 * @brief Tunables for breakers, health probing, dispatch and retention
 */
struct OrchestratorConfig {
    LoadBalancingStrategy strategy = LoadBalancingStrategy::ROUND_ROBIN;
    std::chrono::seconds health_check_interval{30};   ///< 0 disables the background monitor
    std::chrono::milliseconds health_check_timeout{2000};
    size_t circuit_breaker_threshold = 5;             ///< Failures before opening circuit
    std::chrono::seconds circuit_breaker_timeout{60}; ///< OPEN dwell before a probe is allowed
    std::chrono::milliseconds engine_timeout{5000};   ///< Default per-capability deadline
    std::map<Capability, std::chrono::milliseconds> capability_timeouts; ///< Per-capability overrides
    std::chrono::milliseconds request_timeout{0};     ///< Caller deadline, 0 = none
    size_t history_capacity = 1000;
    size_t metrics_window = 1000;
    unsigned int random_seed = 0;                     ///< 0 = seed from std::random_device

    /**
     * @brief Deadline applied to one capability call
     */
    std::chrono::milliseconds timeoutFor(Capability capability) const;
};

struct LoggingConfig {
    std::string directory = ".sitewatch/logs";
    bool console = true;
    bool file = false;
    std::string level = "info";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
};

/**
 * @brief Reference from an A/B test to a registered model version
 */
struct ABTestSpec {
    std::string experiment_id;
    std::string model_a_name;
    std::string model_a_version;
    std::string model_b_name;
    std::string model_b_version;
    double traffic_split = 0.5;
    bool enabled = true;
};

/**
 * @brief Complete application configuration
 */
struct ApplicationConfig {
    OrchestratorConfig orchestrator;
    LoggingConfig logging;
    ServerConfig server;
    std::vector<ModelVersion> models;
    std::vector<ABTestSpec> ab_tests;
};

/**
 * @brief Parses the YAML configuration file
 */
class ConfigParser {
public:
    /**
     * @brief Load configuration from a YAML file
     * @param config_path Path to the file
     * @return Parsed and validated configuration
     * @throws ConfigError if the file is unreadable or a value is invalid
     */
    static ApplicationConfig loadFile(const std::string& config_path);

    /**
     * @brief Parse configuration from YAML text
     * @throws ConfigError on invalid content
     */
    static ApplicationConfig loadString(const std::string& yaml_text);

    /**
     * @brief Model versions deployed when the configuration lists none
     */
    static std::vector<ModelVersion> defaultModels();

    static LoadBalancingStrategy stringToStrategy(const std::string& str);
    static std::string strategyToString(LoadBalancingStrategy strategy);

private:
    static ApplicationConfig parse(const YAML::Node& root);
    static void validate(const ApplicationConfig& config);
};

} // namespace Sitewatch
