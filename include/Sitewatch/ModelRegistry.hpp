// =================================================================
// include/Sitewatch/ModelRegistry.hpp
// =================================================================
// Catalog of model versions per detection capability.

#pragma once

#include "Sitewatch/ConfigParser.hpp"
#include "Sitewatch/DetectionTypes.hpp"
#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Sitewatch {

/**
 * @brief Outcome of registering one configured entry
 */
struct ModelLoadResult {
    bool success = false;                  ///< Whether registration succeeded
    std::string model_id;                  ///< "name@version" or experiment id
    std::string error_message;             ///< Error message if failed
};

/**
 * @brief Registry status information
 */
struct RegistryStatus {
    size_t total_configured = 0;           ///< Entries in the configuration
    size_t successfully_loaded = 0;        ///< Entries registered
    size_t failed_to_load = 0;             ///< Entries rejected
    size_t enabled_versions = 0;           ///< Enabled versions across capabilities
    std::chrono::system_clock::time_point last_update;
    std::vector<ModelLoadResult> load_results;
};

/**
 * @brief Ordered catalog of model versions and A/B experiments
 *
 * Versions are kept per capability in insertion order, which is the default
 * round-robin order. Reads take a shared lock and may run concurrently;
 * writes (boot time or admin reload) are serialized.
 */
class ModelRegistry {
public:
    ModelRegistry();
    virtual ~ModelRegistry() = default;

    /**
     * @brief Add or replace a model version
     *
     * Idempotent by (name, version): a second registration replaces the
     * first in place and keeps its position in the round-robin order.
     */
    virtual void registerModel(const ModelVersion& model);

    /**
     * @brief Register every model and A/B test from configuration
     * @return Status with one result per configured entry
     */
    virtual RegistryStatus loadFromConfig(const ApplicationConfig& config);

    /**
     * @brief Enabled versions of a capability in insertion order
     * @throws UnknownCapabilityError if nothing was ever registered for it
     */
    virtual std::vector<ModelVersion> list(Capability capability) const;

    /**
     * @brief Resolve a model version
     * @param capability Capability to look in
     * @param name Model name, or empty for the default (most recently
     *        registered enabled version)
     * @throws UnknownCapabilityError if nothing was registered for the capability
     * @throws NoHealthyEngineError if no matching version is enabled
     */
    virtual ModelVersion get(Capability capability, const std::string& name = "") const;

    /**
     * @brief Find a version by exact identity, enabled or not
     */
    virtual std::optional<ModelVersion> find(const std::string& name, const std::string& version) const;

    /**
     * @brief All versions, enabled and disabled, grouped by capability
     */
    virtual std::map<Capability, std::vector<ModelVersion>> listModels() const;

    /**
     * @brief Whether any version was ever registered for the capability
     */
    virtual bool hasCapability(Capability capability) const;

    /**
     * @brief Create or replace an A/B experiment
     * @throws OrchestratorError if the two versions serve different capabilities
     *         or the split is outside [0, 1]
     */
    virtual void createABTest(const ABTestConfig& config);

    virtual bool removeABTest(const std::string& experiment_id);

    /**
     * @brief First enabled experiment whose model_a serves the capability
     */
    virtual std::optional<ABTestConfig> activeABTest(Capability capability) const;

    virtual std::vector<ABTestConfig> listABTests() const;

    virtual size_t size() const;

private:
    mutable std::shared_mutex m_mutex;
    std::array<std::vector<ModelVersion>, kCapabilityCount> m_models;
    std::map<std::string, ABTestConfig> m_ab_tests;

    static std::string modelId(const ModelVersion& model);
};

} // namespace Sitewatch
