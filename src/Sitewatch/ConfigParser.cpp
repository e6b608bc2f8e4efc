// =================================================================
// src/Sitewatch/ConfigParser.cpp
// =================================================================
// Implementation for the YAML configuration loader.

#include "Sitewatch/ConfigParser.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/Logger.hpp"
#include <yaml-cpp/yaml.h>

namespace Sitewatch {

std::chrono::milliseconds OrchestratorConfig::timeoutFor(Capability capability) const {
    auto it = capability_timeouts.find(capability);
    if (it != capability_timeouts.end()) {
        return it->second;
    }
    return engine_timeout;
}

ApplicationConfig ConfigParser::loadFile(const std::string& config_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot read configuration file " + config_path + ": " + e.what());
    }

    ApplicationConfig config = parse(root);
    Logger::getInstance().info("ConfigParser", "Loaded configuration", config_path);
    return config;
}

ApplicationConfig ConfigParser::loadString(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed configuration: " + std::string(e.what()));
    }
    return parse(root);
}

std::vector<ModelVersion> ConfigParser::defaultModels() {
    return {
        {"damage-detector", "v1.2.0", Capability::DAMAGE, "http://damage-engine:8001", 0.75, true},
        {"material-detector", "v1.1.0", Capability::MATERIAL, "http://material-engine:8002", 0.75, true},
        {"volume-estimator", "v1.0.0", Capability::VOLUME, "http://volume-engine:8003", 0.70, true}
    };
}

LoadBalancingStrategy ConfigParser::stringToStrategy(const std::string& str) {
    if (str == "round_robin") return LoadBalancingStrategy::ROUND_ROBIN;
    if (str == "weighted") return LoadBalancingStrategy::WEIGHTED;
    if (str == "least_latency") return LoadBalancingStrategy::LEAST_LATENCY;
    throw ConfigError("Unknown load balancing strategy: " + str);
}

std::string ConfigParser::strategyToString(LoadBalancingStrategy strategy) {
    switch (strategy) {
        case LoadBalancingStrategy::ROUND_ROBIN: return "round_robin";
        case LoadBalancingStrategy::WEIGHTED: return "weighted";
        case LoadBalancingStrategy::LEAST_LATENCY: return "least_latency";
        default: return "unknown";
    }
}

static Capability parseCapability(const std::string& str) {
    try {
        return DetectionTypeUtils::stringToCapability(str);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

ApplicationConfig ConfigParser::parse(const YAML::Node& root) {
    ApplicationConfig config;

    try {
        if (YAML::Node orch = root["orchestrator"]) {
            OrchestratorConfig& oc = config.orchestrator;
            if (orch["strategy"]) {
                oc.strategy = stringToStrategy(orch["strategy"].as<std::string>());
            }
            if (orch["health_check_interval_seconds"]) {
                oc.health_check_interval = std::chrono::seconds(orch["health_check_interval_seconds"].as<long>());
            }
            if (orch["health_check_timeout_ms"]) {
                oc.health_check_timeout = std::chrono::milliseconds(orch["health_check_timeout_ms"].as<long>());
            }
            if (orch["circuit_breaker_threshold"]) {
                oc.circuit_breaker_threshold = orch["circuit_breaker_threshold"].as<size_t>();
            }
            if (orch["circuit_breaker_timeout_seconds"]) {
                oc.circuit_breaker_timeout = std::chrono::seconds(orch["circuit_breaker_timeout_seconds"].as<long>());
            }
            if (orch["engine_timeout_ms"]) {
                oc.engine_timeout = std::chrono::milliseconds(orch["engine_timeout_ms"].as<long>());
            }
            if (orch["capability_timeouts_ms"]) {
                for (YAML::const_iterator it = orch["capability_timeouts_ms"].begin();
                     it != orch["capability_timeouts_ms"].end(); ++it) {
                    Capability capability = parseCapability(it->first.as<std::string>());
                    oc.capability_timeouts[capability] = std::chrono::milliseconds(it->second.as<long>());
                }
            }
            if (orch["request_timeout_ms"]) {
                oc.request_timeout = std::chrono::milliseconds(orch["request_timeout_ms"].as<long>());
            }
            if (orch["history_capacity"]) {
                oc.history_capacity = orch["history_capacity"].as<size_t>();
            }
            if (orch["metrics_window"]) {
                oc.metrics_window = orch["metrics_window"].as<size_t>();
            }
            if (orch["random_seed"]) {
                oc.random_seed = orch["random_seed"].as<unsigned int>();
            }
        }

        if (YAML::Node logging = root["logging"]) {
            if (logging["directory"]) config.logging.directory = logging["directory"].as<std::string>();
            if (logging["console"]) config.logging.console = logging["console"].as<bool>();
            if (logging["file"]) config.logging.file = logging["file"].as<bool>();
            if (logging["level"]) config.logging.level = logging["level"].as<std::string>();
        }

        if (YAML::Node server = root["server"]) {
            if (server["host"]) config.server.host = server["host"].as<std::string>();
            if (server["port"]) config.server.port = server["port"].as<int>();
        }

        if (YAML::Node models = root["models"]) {
            for (const auto& model_node : models) {
                ModelVersion model;
                model.name = model_node["name"].as<std::string>("");
                model.version = model_node["version"].as<std::string>("");
                model.capability = parseCapability(model_node["capability"].as<std::string>(""));
                model.endpoint = model_node["endpoint"].as<std::string>("");
                if (model_node["confidence_threshold"]) {
                    model.confidence_threshold = model_node["confidence_threshold"].as<double>();
                }
                if (model_node["enabled"]) {
                    model.enabled = model_node["enabled"].as<bool>();
                }
                config.models.push_back(model);
            }
        } else {
            config.models = defaultModels();
        }

        if (YAML::Node tests = root["ab_tests"]) {
            for (const auto& test_node : tests) {
                ABTestSpec spec;
                spec.experiment_id = test_node["experiment_id"].as<std::string>("");
                spec.model_a_name = test_node["model_a"]["name"].as<std::string>("");
                spec.model_a_version = test_node["model_a"]["version"].as<std::string>("");
                spec.model_b_name = test_node["model_b"]["name"].as<std::string>("");
                spec.model_b_version = test_node["model_b"]["version"].as<std::string>("");
                if (test_node["traffic_split"]) {
                    spec.traffic_split = test_node["traffic_split"].as<double>();
                }
                if (test_node["enabled"]) {
                    spec.enabled = test_node["enabled"].as<bool>();
                }
                config.ab_tests.push_back(spec);
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid configuration value: " + std::string(e.what()));
    }

    validate(config);
    return config;
}

void ConfigParser::validate(const ApplicationConfig& config) {
    const OrchestratorConfig& oc = config.orchestrator;

    if (oc.circuit_breaker_threshold < 1) {
        throw ConfigError("circuit_breaker_threshold must be at least 1");
    }
    if (oc.circuit_breaker_timeout.count() < 0 || oc.health_check_interval.count() < 0) {
        throw ConfigError("Intervals must not be negative");
    }
    if (oc.engine_timeout.count() <= 0 || oc.health_check_timeout.count() <= 0) {
        throw ConfigError("Engine and health check timeouts must be positive");
    }
    for (const auto& [capability, timeout] : oc.capability_timeouts) {
        if (timeout.count() <= 0) {
            throw ConfigError("Timeout for " + DetectionTypeUtils::capabilityToString(capability) +
                              " must be positive");
        }
    }
    if (oc.history_capacity == 0 || oc.metrics_window == 0) {
        throw ConfigError("history_capacity and metrics_window must be positive");
    }

    try {
        Logger::parseLevel(config.logging.level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    for (const auto& model : config.models) {
        if (model.name.empty() || model.version.empty()) {
            throw ConfigError("Model entry missing name or version");
        }
        if (model.endpoint.empty()) {
            throw ConfigError("Model " + model.name + " " + model.version + " missing endpoint");
        }
        if (model.confidence_threshold < 0.0 || model.confidence_threshold > 1.0) {
            throw ConfigError("confidence_threshold out of range for model " + model.name);
        }
    }

    for (const auto& test : config.ab_tests) {
        if (test.experiment_id.empty()) {
            throw ConfigError("A/B test missing experiment_id");
        }
        if (test.traffic_split < 0.0 || test.traffic_split > 1.0) {
            throw ConfigError("traffic_split out of range for experiment " + test.experiment_id);
        }
    }
}

} // namespace Sitewatch
