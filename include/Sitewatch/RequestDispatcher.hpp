// =================================================================
// include/Sitewatch/RequestDispatcher.hpp
// =================================================================
// Concurrent fan-out of detection requests to inference engines.

#pragma once

#include "Sitewatch/CircuitBreaker.hpp"
#include "Sitewatch/ConfigParser.hpp"
#include "Sitewatch/DetectionTypes.hpp"
#include "Sitewatch/EngineClient.hpp"
#include "Sitewatch/LoadBalancer.hpp"
#include "Sitewatch/MetricsCollector.hpp"
#include "Sitewatch/RequestHistory.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Sitewatch {

/**
 * @brief Fans a request out to one engine per capability and aggregates
 *
 * Each deduplicated capability runs on its own thread with its own
 * deadline, so slow calls of one capability never hold up another. The
 * dispatcher joins all of them before assembling the response. Every call
 * outcome, timeouts included, is reported exactly once to the endpoint's
 * breaker and to the metrics collector. There are no retries within one
 * request.
 */
class RequestDispatcher {
public:
    RequestDispatcher(LoadBalancer& balancer, CircuitBreakerRegistry& breakers,
                      EngineClientTable& clients, MetricsCollector& metrics,
                      RequestHistory& history, const OrchestratorConfig& config);

    /// Waits for calls still in flight, abandoned ones included.
    virtual ~RequestDispatcher();

    /**
     * @brief Process one detection request
     * @param request Request to dispatch
     * @param correlation_id Caller correlation id; "orch-<request_id>" when absent
     * @param request_timeout Caller deadline for the whole request; the
     *        configured default applies when absent, zero means none
     * @return Aggregated response, also stored in the request history
     * @throws OrchestratorError if the request is malformed (no capabilities,
     *         empty photo_url); no engine is contacted in that case
     */
    virtual DetectionResponse process(const DetectionRequest& request,
                                      const std::optional<std::string>& correlation_id = std::nullopt,
                                      std::optional<std::chrono::milliseconds> request_timeout = std::nullopt);

    /**
     * @brief Validate and normalize a request
     *
     * Trims the photo_url and removes duplicate capabilities.
     * @throws OrchestratorError if the request cannot be dispatched
     */
    static DetectionRequest normalize(const DetectionRequest& request);

    /**
     * @brief Derive the aggregate status from per-capability results
     */
    static DetectionStatus aggregateStatus(const std::map<Capability, EngineResult>& results);

private:
    struct RequestState;

    LoadBalancer& m_balancer;
    CircuitBreakerRegistry& m_breakers;
    EngineClientTable& m_clients;
    MetricsCollector& m_metrics;
    RequestHistory& m_history;
    OrchestratorConfig m_config;

    std::mutex m_inflight_mutex;
    std::vector<std::future<void>> m_inflight;

    /// Drop finished calls; with wait set, block until every call is done.
    void collectFinishedLocked(bool wait);

    void runCall(const std::shared_ptr<RequestState>& state, Capability capability,
                 const DetectionRequest& request, std::chrono::steady_clock::time_point deadline);

    /// Record the single outcome of a capability call. Caller holds the state lock.
    void settleLocked(RequestState& state, Capability capability, EngineResult result, bool remote_call);
};

} // namespace Sitewatch
