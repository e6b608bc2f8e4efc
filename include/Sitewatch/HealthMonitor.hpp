// =================================================================
// include/Sitewatch/HealthMonitor.hpp
// =================================================================
// Background prober maintaining engine health and feeding breakers.

#pragma once

#include "Sitewatch/CircuitBreaker.hpp"
#include "Sitewatch/ConfigParser.hpp"
#include "Sitewatch/DetectionTypes.hpp"
#include "Sitewatch/EngineClient.hpp"
#include "Sitewatch/ModelRegistry.hpp"
#include <array>
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Sitewatch {

/**
 * @brief Health of an engine joined with its breaker state
 */
struct EngineStatus {
    EngineHealth health;
    CircuitBreakerState breaker_state = CircuitBreakerState::CLOSED;
};

/**
 * @brief Orchestrator-wide health roll-up
 */
struct HealthSummary {
    std::string status = "healthy";        ///< "healthy" when every engine is healthy, else "degraded"
    size_t total_engines = 0;
    size_t healthy_engines = 0;
    std::vector<EngineStatus> engines;
};

/**
 * @brief Periodically probes every enabled engine endpoint
 *
 * Keeps one EngineHealth record per (capability, endpoint), created on first
 * sight and updated in place afterwards. Each probe outcome is also reported
 * to the endpoint's circuit breaker, so probe failures and request failures
 * accumulate in the same counter.
 */
class HealthMonitor {
public:
    HealthMonitor(ModelRegistry& registry, CircuitBreakerRegistry& breakers,
                  EngineClientTable& clients, const OrchestratorConfig& config);

    virtual ~HealthMonitor();

    /**
     * @brief Start the background probe thread
     *
     * Does nothing when the configured interval is zero or the thread is
     * already running.
     */
    virtual void start();

    /**
     * @brief Stop and join the background thread
     */
    virtual void stop();

    virtual bool isRunning() const;

    /**
     * @brief Probe every enabled endpoint once
     * @return Number of endpoints that answered healthy
     */
    virtual size_t runOnce();

    /**
     * @brief Copy of all health records grouped by capability
     */
    virtual std::map<Capability, std::vector<EngineHealth>> getHealth() const;

    /**
     * @brief Health record for one endpoint, if it has been seen
     */
    virtual std::optional<EngineHealth> getHealth(Capability capability, const std::string& endpoint) const;

    /**
     * @brief Last probe response time, 0 when unknown
     */
    virtual long responseTimeMs(Capability capability, const std::string& endpoint) const;

    virtual HealthSummary summary() const;

private:
    /// Records of one capability, guarded by their own lock.
    struct CapabilityHealth {
        mutable std::mutex mutex;
        std::map<std::string, EngineHealth> records;
    };

    ModelRegistry& m_registry;
    CircuitBreakerRegistry& m_breakers;
    EngineClientTable& m_clients;
    OrchestratorConfig m_config;

    std::array<CapabilityHealth, kCapabilityCount> m_health;

    std::unique_ptr<std::thread> m_thread;
    std::atomic<bool> m_stop{false};
    std::mutex m_wait_mutex;
    std::condition_variable m_wait_cv;

    bool probeEndpoint(const ModelVersion& model);
    void ensureRecord(Capability capability, const std::string& endpoint);
    void monitorLoop();
};

} // namespace Sitewatch
