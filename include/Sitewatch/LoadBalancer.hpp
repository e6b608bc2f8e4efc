// =================================================================
// include/Sitewatch/LoadBalancer.hpp
// =================================================================
// Selection of a model version for each capability call.

#pragma once

#include "Sitewatch/CircuitBreaker.hpp"
#include "Sitewatch/ConfigParser.hpp"
#include "Sitewatch/HealthMonitor.hpp"
#include "Sitewatch/ModelRegistry.hpp"
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace Sitewatch {

/**
 * @brief Load balancing result
 */
struct EngineSelection {
    ModelVersion model;                    ///< Selected version (carries the endpoint)
    std::string selection_reason;          ///< Reason for selection
    bool ab_test = false;                  ///< Whether an A/B experiment decided
    std::string experiment_id;             ///< Experiment that decided, if any
};

/**
 * @brief Load balancing strategy base class
 */
class BalancingStrategy {
public:
    virtual ~BalancingStrategy() = default;

    /**
     * @brief Pick one of the admitted candidates
     * @param capability Capability being served
     * @param request Request being dispatched
     * @param candidates Non-empty list in registry order
     * @return Index into candidates
     */
    virtual size_t selectIndex(Capability capability, const DetectionRequest& request,
                               const std::vector<ModelVersion>& candidates) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Chooses the engine that answers one capability call
 *
 * An enabled A/B experiment for the capability decides first. Otherwise the
 * registry's enabled versions are filtered by breaker admission and the
 * active strategy picks among the rest. The chosen version's breaker must
 * then admit the call; a rejection is final for this call.
 */
class LoadBalancer {
public:
    LoadBalancer(ModelRegistry& registry, CircuitBreakerRegistry& breakers,
                 const HealthMonitor& health, const OrchestratorConfig& config);

    virtual ~LoadBalancer() = default;

    /**
     * @brief Select an engine for a capability
     * @throws UnknownCapabilityError if nothing is registered for the capability
     * @throws NoHealthyEngineError if no candidate is admitted
     */
    virtual EngineSelection select(Capability capability, const DetectionRequest& request);

    /**
     * @brief Register load balancing strategy
     */
    virtual void registerStrategy(LoadBalancingStrategy strategy,
                                  std::shared_ptr<BalancingStrategy> implementation);

    virtual void setStrategy(LoadBalancingStrategy strategy);
    virtual LoadBalancingStrategy getStrategy() const;

private:
    ModelRegistry& m_registry;
    CircuitBreakerRegistry& m_breakers;
    const HealthMonitor& m_health;

    mutable std::mutex m_strategy_mutex;
    LoadBalancingStrategy m_current_strategy;
    std::unordered_map<LoadBalancingStrategy, std::shared_ptr<BalancingStrategy>> m_strategies;

    std::mutex m_rng_mutex;
    std::mt19937 m_rng;

    double drawUniform();
    EngineSelection selectFromABTest(const ABTestConfig& test);
    void admit(const EngineSelection& selection, Capability capability);

    // Built-in strategy classes
    class RoundRobinStrategy;
    class WeightedStrategy;
    class LeastLatencyStrategy;
};

} // namespace Sitewatch
