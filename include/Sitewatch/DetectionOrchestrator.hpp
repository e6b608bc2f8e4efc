// =================================================================
// include/Sitewatch/DetectionOrchestrator.hpp
// =================================================================
// Facade wiring registry, breakers, health, balancing, dispatch and metrics.

#pragma once

#include "Sitewatch/CircuitBreaker.hpp"
#include "Sitewatch/ConfigParser.hpp"
#include "Sitewatch/EngineClient.hpp"
#include "Sitewatch/HealthMonitor.hpp"
#include "Sitewatch/LoadBalancer.hpp"
#include "Sitewatch/MetricsCollector.hpp"
#include "Sitewatch/ModelRegistry.hpp"
#include "Sitewatch/RequestDispatcher.hpp"
#include "Sitewatch/RequestHistory.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Sitewatch {

/**
 * @brief Detection orchestrator owning all per-instance state
 *
 * Everything is built from the configuration at construction; nothing is
 * shared between instances. The background health monitor is not started
 * automatically.
 */
class DetectionOrchestrator {
public:
    /**
     * @brief Constructor
     * @param config Application configuration
     * @param default_client Engine client for every capability; an
     *        HttpEngineClient when null
     * @param clock Monotonic time source for circuit breakers
     */
    explicit DetectionOrchestrator(const ApplicationConfig& config,
                                   std::shared_ptr<EngineClient> default_client = nullptr,
                                   SteadyClock clock = SteadyClock());

    virtual ~DetectionOrchestrator();

    /**
     * @brief Process a detection request
     *
     * Per-capability failures degrade the status instead of throwing.
     * @throws OrchestratorError if the request is malformed
     */
    virtual DetectionResponse submit(const DetectionRequest& request,
                                     const std::optional<std::string>& correlation_id = std::nullopt,
                                     std::optional<std::chrono::milliseconds> request_timeout = std::nullopt);

    /**
     * @brief Stored response of an earlier request
     * @throws RequestNotFoundError for unknown or evicted ids
     */
    virtual DetectionResponse getStatus(const std::string& request_id);

    virtual std::map<Capability, std::vector<EngineHealth>> getHealth() const;
    virtual HealthSummary getHealthSummary() const;
    virtual OrchestratorMetrics getMetrics() const;
    virtual std::map<Capability, std::vector<ModelVersion>> listModels() const;
    virtual std::vector<CircuitBreakerSnapshot> getBreakerStates() const;

    virtual void registerModel(const ModelVersion& model);

    /**
     * @brief Create an A/B test between two registered versions
     * @throws OrchestratorError if either version is unknown or they
     *         serve different capabilities
     */
    virtual void createABTest(const ABTestSpec& spec);
    virtual bool removeABTest(const std::string& experiment_id);
    virtual std::vector<ABTestConfig> listABTests() const;

    /**
     * @brief Route one capability to a dedicated engine client
     */
    virtual void setEngineClient(Capability capability, std::shared_ptr<EngineClient> client);

    virtual void startHealthMonitor();
    virtual void stopHealthMonitor();

    /**
     * @brief Probe every endpoint once, outside the background schedule
     * @return Number of healthy endpoints
     */
    virtual size_t runHealthCheck();

    const ApplicationConfig& getConfig() const { return m_config; }
    const RegistryStatus& getRegistryStatus() const { return m_registry_status; }

    LoadBalancer& loadBalancer() { return *m_balancer; }

private:
    ApplicationConfig m_config;
    RegistryStatus m_registry_status;

    std::unique_ptr<ModelRegistry> m_registry;
    std::unique_ptr<CircuitBreakerRegistry> m_breakers;
    std::unique_ptr<EngineClientTable> m_clients;
    std::unique_ptr<HealthMonitor> m_health;
    std::unique_ptr<LoadBalancer> m_balancer;
    std::unique_ptr<MetricsCollector> m_metrics;
    std::unique_ptr<RequestHistory> m_history;
    std::unique_ptr<RequestDispatcher> m_dispatcher;
};

} // namespace Sitewatch
