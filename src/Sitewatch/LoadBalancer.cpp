// =================================================================
// src/Sitewatch/LoadBalancer.cpp
// =================================================================
// Implementation of engine selection.

#include "Sitewatch/LoadBalancer.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/Logger.hpp"
#include <algorithm>

namespace Sitewatch {

namespace {

unsigned int resolveSeed(unsigned int configured) {
    if (configured != 0) {
        return configured;
    }
    std::random_device rd;
    return rd();
}

} // namespace

// =================================================================
// Built-in Load Balancing Strategies
// =================================================================

/**
 * @brief Round-robin over the admitted candidates
 *
 * One atomic cursor per capability, shared by all concurrent requests.
 */
class LoadBalancer::RoundRobinStrategy : public BalancingStrategy {
private:
    std::array<std::atomic<size_t>, kCapabilityCount> m_cursors{};

public:
    size_t selectIndex(Capability capability, const DetectionRequest& request,
                       const std::vector<ModelVersion>& candidates) override {
        size_t ticket = m_cursors[DetectionTypeUtils::capabilityIndex(capability)].fetch_add(1);
        return ticket % candidates.size();
    }

    std::string getName() const override {
        return "round_robin";
    }
};

/**
 * @brief Random pick weighted by inverse probe response time
 */
class LoadBalancer::WeightedStrategy : public BalancingStrategy {
private:
    const HealthMonitor& m_health;
    std::mutex m_mutex;
    std::mt19937 m_gen;

public:
    WeightedStrategy(const HealthMonitor& health, unsigned int seed)
        : m_health(health), m_gen(seed) {}

    size_t selectIndex(Capability capability, const DetectionRequest& request,
                       const std::vector<ModelVersion>& candidates) override {
        std::vector<double> weights;
        weights.reserve(candidates.size());
        for (const auto& candidate : candidates) {
            long response_time = m_health.responseTimeMs(capability, candidate.endpoint);
            weights.push_back(1.0 / (static_cast<double>(response_time) + 1.0));
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
        return dist(m_gen);
    }

    std::string getName() const override {
        return "weighted";
    }
};

/**
 * @brief Lowest last probe response time, ties broken by registry order
 */
class LoadBalancer::LeastLatencyStrategy : public BalancingStrategy {
private:
    const HealthMonitor& m_health;

public:
    explicit LeastLatencyStrategy(const HealthMonitor& health) : m_health(health) {}

    size_t selectIndex(Capability capability, const DetectionRequest& request,
                       const std::vector<ModelVersion>& candidates) override {
        size_t best = 0;
        long best_time = m_health.responseTimeMs(capability, candidates[0].endpoint);
        for (size_t i = 1; i < candidates.size(); ++i) {
            long time = m_health.responseTimeMs(capability, candidates[i].endpoint);
            if (time < best_time) {
                best = i;
                best_time = time;
            }
        }
        return best;
    }

    std::string getName() const override {
        return "least_latency";
    }
};

// =================================================================
// LoadBalancer Implementation
// =================================================================

LoadBalancer::LoadBalancer(ModelRegistry& registry, CircuitBreakerRegistry& breakers,
                           const HealthMonitor& health, const OrchestratorConfig& config)
    : m_registry(registry), m_breakers(breakers), m_health(health),
      m_current_strategy(config.strategy), m_rng(resolveSeed(config.random_seed)) {

    // Register built-in strategies
    registerStrategy(LoadBalancingStrategy::ROUND_ROBIN,
                     std::make_shared<RoundRobinStrategy>());
    registerStrategy(LoadBalancingStrategy::WEIGHTED,
                     std::make_shared<WeightedStrategy>(health, resolveSeed(config.random_seed)));
    registerStrategy(LoadBalancingStrategy::LEAST_LATENCY,
                     std::make_shared<LeastLatencyStrategy>(health));

    Logger::getInstance().info("LoadBalancer", "Initialized with strategy: " +
                               ConfigParser::strategyToString(m_current_strategy));
}

EngineSelection LoadBalancer::select(Capability capability, const DetectionRequest& request) {
    const std::string capability_name = DetectionTypeUtils::capabilityToString(capability);

    auto ab_test = m_registry.activeABTest(capability);
    if (ab_test) {
        EngineSelection selection = selectFromABTest(*ab_test);
        admit(selection, capability);
        return selection;
    }

    // Throws UnknownCapabilityError when nothing was registered.
    auto versions = m_registry.list(capability);

    std::vector<ModelVersion> candidates;
    for (const auto& version : versions) {
        if (m_breakers.forEndpoint(version.endpoint)->canAttempt()) {
            candidates.push_back(version);
        }
    }

    if (candidates.empty()) {
        throw NoHealthyEngineError("No healthy engine for " + capability_name + " (" +
                                   std::to_string(versions.size()) + " enabled, all circuits open)");
    }

    std::shared_ptr<BalancingStrategy> strategy;
    {
        std::lock_guard<std::mutex> lock(m_strategy_mutex);
        auto strategy_it = m_strategies.find(m_current_strategy);
        if (strategy_it == m_strategies.end()) {
            throw OrchestratorError("Load balancing strategy not registered: " +
                                    ConfigParser::strategyToString(m_current_strategy));
        }
        strategy = strategy_it->second;
    }

    size_t index = strategy->selectIndex(capability, request, candidates);

    EngineSelection selection;
    selection.model = candidates.at(index);
    selection.selection_reason = "Selected by " + strategy->getName() + " strategy";
    admit(selection, capability);

    Logger::getInstance().debug("LoadBalancer", "Selected " + selection.model.name + "@" +
        selection.model.version + " for " + capability_name, selection.model.endpoint);

    return selection;
}

EngineSelection LoadBalancer::selectFromABTest(const ABTestConfig& test) {
    bool use_a = drawUniform() < test.traffic_split;
    const ModelVersion& chosen = use_a ? test.model_a : test.model_b;

    EngineSelection selection;
    selection.model = m_registry.find(chosen.name, chosen.version).value_or(chosen);
    selection.ab_test = true;
    selection.experiment_id = test.experiment_id;
    selection.selection_reason = "A/B test " + test.experiment_id + " routed to " +
                                 (use_a ? "model_a" : "model_b");
    return selection;
}

void LoadBalancer::admit(const EngineSelection& selection, Capability capability) {
    if (!m_breakers.forEndpoint(selection.model.endpoint)->allowRequest()) {
        throw NoHealthyEngineError("Circuit breaker rejected " + selection.model.endpoint + " for " +
                                   DetectionTypeUtils::capabilityToString(capability));
    }
}

double LoadBalancer::drawUniform() {
    std::lock_guard<std::mutex> lock(m_rng_mutex);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(m_rng);
}

void LoadBalancer::registerStrategy(LoadBalancingStrategy strategy,
                                    std::shared_ptr<BalancingStrategy> implementation) {
    std::lock_guard<std::mutex> lock(m_strategy_mutex);
    m_strategies[strategy] = std::move(implementation);
}

void LoadBalancer::setStrategy(LoadBalancingStrategy strategy) {
    std::lock_guard<std::mutex> lock(m_strategy_mutex);
    m_current_strategy = strategy;
    Logger::getInstance().info("LoadBalancer", "Strategy changed to: " +
                               ConfigParser::strategyToString(strategy));
}

LoadBalancingStrategy LoadBalancer::getStrategy() const {
    std::lock_guard<std::mutex> lock(m_strategy_mutex);
    return m_current_strategy;
}

} // namespace Sitewatch
