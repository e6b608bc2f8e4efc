// =================================================================
// src/Sitewatch/ModelRegistry.cpp
// =================================================================
// Implementation of the model version registry.

#include "Sitewatch/ModelRegistry.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/Logger.hpp"
#include <algorithm>
#include <iterator>
#include <mutex>

namespace Sitewatch {

ModelRegistry::ModelRegistry() = default;

std::string ModelRegistry::modelId(const ModelVersion& model) {
    return model.name + "@" + model.version;
}

void ModelRegistry::registerModel(const ModelVersion& model) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    auto same_identity = [&model](const ModelVersion& existing) {
        return existing.name == model.name && existing.version == model.version;
    };

    auto& target = m_models[DetectionTypeUtils::capabilityIndex(model.capability)];
    auto it = std::find_if(target.begin(), target.end(), same_identity);
    if (it != target.end()) {
        *it = model;
        Logger::getInstance().info("ModelRegistry", "Updated model " + modelId(model) +
            " for " + DetectionTypeUtils::capabilityToString(model.capability));
        return;
    }

    // A version re-registered under another capability moves there.
    for (auto& versions : m_models) {
        versions.erase(std::remove_if(versions.begin(), versions.end(), same_identity), versions.end());
    }

    target.push_back(model);
    Logger::getInstance().info("ModelRegistry", "Registered model " + modelId(model) +
        " for " + DetectionTypeUtils::capabilityToString(model.capability), model.endpoint);
}

RegistryStatus ModelRegistry::loadFromConfig(const ApplicationConfig& config) {
    RegistryStatus status;
    status.total_configured = config.models.size() + config.ab_tests.size();

    Logger::getInstance().info("ModelRegistry", "Loading " + std::to_string(config.models.size()) +
        " model versions from configuration");

    for (const auto& model : config.models) {
        ModelLoadResult result;
        result.model_id = modelId(model);
        try {
            registerModel(model);
            result.success = true;
            status.successfully_loaded++;
        } catch (const std::exception& e) {
            result.error_message = e.what();
            status.failed_to_load++;
            Logger::getInstance().error("ModelRegistry", "Failed to register " + result.model_id +
                ": " + e.what());
        }
        status.load_results.push_back(result);
    }

    for (const auto& spec : config.ab_tests) {
        ModelLoadResult result;
        result.model_id = spec.experiment_id;

        auto model_a = find(spec.model_a_name, spec.model_a_version);
        auto model_b = find(spec.model_b_name, spec.model_b_version);
        if (!model_a || !model_b) {
            result.error_message = "A/B test references an unregistered model version";
            status.failed_to_load++;
            Logger::getInstance().error("ModelRegistry", result.error_message, spec.experiment_id);
            status.load_results.push_back(result);
            continue;
        }

        ABTestConfig test;
        test.experiment_id = spec.experiment_id;
        test.model_a = *model_a;
        test.model_b = *model_b;
        test.traffic_split = spec.traffic_split;
        test.enabled = spec.enabled;

        try {
            createABTest(test);
            result.success = true;
            status.successfully_loaded++;
        } catch (const OrchestratorError& e) {
            result.error_message = e.what();
            status.failed_to_load++;
        }
        status.load_results.push_back(result);
    }

    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& versions : m_models) {
            status.enabled_versions += std::count_if(versions.begin(), versions.end(),
                [](const ModelVersion& m) { return m.enabled; });
        }
    }
    status.last_update = std::chrono::system_clock::now();

    Logger::getInstance().info("ModelRegistry",
        "Configuration loaded. Registered: " + std::to_string(status.successfully_loaded) +
        "/" + std::to_string(status.total_configured));

    return status;
}

std::vector<ModelVersion> ModelRegistry::list(Capability capability) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    const auto& versions = m_models[DetectionTypeUtils::capabilityIndex(capability)];
    if (versions.empty()) {
        throw UnknownCapabilityError("No model versions registered for " +
                                     DetectionTypeUtils::capabilityToString(capability));
    }

    std::vector<ModelVersion> enabled;
    std::copy_if(versions.begin(), versions.end(), std::back_inserter(enabled),
                 [](const ModelVersion& m) { return m.enabled; });
    return enabled;
}

ModelVersion ModelRegistry::get(Capability capability, const std::string& name) const {
    auto enabled = list(capability);

    // Latest registration wins
    for (auto it = enabled.rbegin(); it != enabled.rend(); ++it) {
        if (name.empty() || it->name == name) {
            return *it;
        }
    }

    std::string target = name.empty() ? DetectionTypeUtils::capabilityToString(capability) : name;
    throw NoHealthyEngineError("No enabled model version for " + target);
}

std::optional<ModelVersion> ModelRegistry::find(const std::string& name, const std::string& version) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    for (const auto& versions : m_models) {
        for (const auto& model : versions) {
            if (model.name == name && model.version == version) {
                return model;
            }
        }
    }
    return std::nullopt;
}

std::map<Capability, std::vector<ModelVersion>> ModelRegistry::listModels() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::map<Capability, std::vector<ModelVersion>> result;
    for (Capability capability : DetectionTypeUtils::allCapabilities()) {
        const auto& versions = m_models[DetectionTypeUtils::capabilityIndex(capability)];
        if (!versions.empty()) {
            result[capability] = versions;
        }
    }
    return result;
}

bool ModelRegistry::hasCapability(Capability capability) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return !m_models[DetectionTypeUtils::capabilityIndex(capability)].empty();
}

void ModelRegistry::createABTest(const ABTestConfig& config) {
    if (config.model_a.capability != config.model_b.capability) {
        throw OrchestratorError("A/B test " + config.experiment_id +
                                " compares versions of different capabilities");
    }
    if (config.traffic_split < 0.0 || config.traffic_split > 1.0) {
        throw OrchestratorError("A/B test " + config.experiment_id + " has traffic_split outside [0, 1]");
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_ab_tests[config.experiment_id] = config;
    Logger::getInstance().info("ModelRegistry", "Created A/B test " + config.experiment_id,
        modelId(config.model_a) + " vs " + modelId(config.model_b) +
        ", split " + std::to_string(config.traffic_split));
}

bool ModelRegistry::removeABTest(const std::string& experiment_id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    bool removed = m_ab_tests.erase(experiment_id) > 0;
    if (removed) {
        Logger::getInstance().info("ModelRegistry", "Removed A/B test " + experiment_id);
    }
    return removed;
}

std::optional<ABTestConfig> ModelRegistry::activeABTest(Capability capability) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    for (const auto& [id, test] : m_ab_tests) {
        if (test.enabled && test.model_a.capability == capability) {
            return test;
        }
    }
    return std::nullopt;
}

std::vector<ABTestConfig> ModelRegistry::listABTests() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::vector<ABTestConfig> tests;
    tests.reserve(m_ab_tests.size());
    for (const auto& [id, test] : m_ab_tests) {
        tests.push_back(test);
    }
    return tests;
}

size_t ModelRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    size_t total = 0;
    for (const auto& versions : m_models) {
        total += versions.size();
    }
    return total;
}

} // namespace Sitewatch
