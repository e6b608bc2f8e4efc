// =================================================================
// include/Sitewatch/CircuitBreaker.hpp
// =================================================================
// Per-endpoint failure isolation state machine.

#pragma once

#include "Sitewatch/DetectionTypes.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Sitewatch {

/**
 * @brief Monotonic time source, replaceable in tests
 */
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

/**
 * @brief Breaker tunables
 */
struct CircuitBreakerConfig {
    size_t failure_threshold = 5;                 ///< Failures before opening circuit
    std::chrono::seconds recovery_timeout{60};    ///< OPEN dwell before a probe is allowed
};

/**
 * @brief Point-in-time view of one breaker
 */
struct CircuitBreakerSnapshot {
    std::string endpoint;
    CircuitBreakerState state = CircuitBreakerState::CLOSED;
    size_t failure_count = 0;
    size_t success_count_in_half_open = 0;
    bool probe_in_flight = false;
    std::chrono::steady_clock::time_point opened_at;
};

/**
 * @brief Circuit breaker guarding one engine endpoint
 *
 * CLOSED counts failures and opens at the threshold. OPEN rejects until the
 * recovery timeout has elapsed, then becomes HALF_OPEN, where exactly one
 * probe call is admitted. The probe's success closes the circuit and clears
 * the failure count; its failure reopens it with a fresh opened_at.
 * Successes in CLOSED leave the failure count untouched.
 */
class CircuitBreaker {
public:
    CircuitBreaker(const std::string& endpoint, const CircuitBreakerConfig& config,
                   SteadyClock clock = SteadyClock());

    /**
     * @brief Admit a call, claiming the probe slot in HALF_OPEN
     * @return False when the caller must fail fast without a remote call
     */
    bool allowRequest();

    /**
     * @brief Whether allowRequest() would currently admit a call
     *
     * Side-effect free; used to filter candidates before one is chosen.
     */
    bool canAttempt() const;

    void recordSuccess();
    void recordFailure();

    /**
     * @brief Force the breaker back to CLOSED
     */
    void reset();

    /**
     * @brief Current state, reporting HALF_OPEN once an OPEN breaker is eligible
     */
    CircuitBreakerState getState() const;

    size_t getFailureCount() const;

    CircuitBreakerSnapshot snapshot() const;

    const std::string& endpoint() const { return m_endpoint; }

private:
    const std::string m_endpoint;
    const CircuitBreakerConfig m_config;
    SteadyClock m_clock;

    mutable std::mutex m_mutex;
    CircuitBreakerState m_state = CircuitBreakerState::CLOSED;
    size_t m_failure_count = 0;
    size_t m_success_count_in_half_open = 0;
    bool m_probe_in_flight = false;
    std::chrono::steady_clock::time_point m_opened_at;

    /// Apply the time-driven OPEN -> HALF_OPEN transition. Caller holds m_mutex.
    void refreshLocked();
    bool recoveryElapsedLocked() const;
    void transitionLocked(CircuitBreakerState to);
};

/**
 * @brief Owns one breaker per endpoint
 *
 * Breakers are created on first use and live as long as the registry. The
 * map lock only guards lookup; each breaker serializes its own state.
 */
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(const CircuitBreakerConfig& config = CircuitBreakerConfig(),
                                    SteadyClock clock = SteadyClock());

    /**
     * @brief Breaker for an endpoint, created on first request
     */
    std::shared_ptr<CircuitBreaker> forEndpoint(const std::string& endpoint);

    /**
     * @brief Existing breaker or nullptr
     */
    std::shared_ptr<CircuitBreaker> find(const std::string& endpoint) const;

    std::vector<CircuitBreakerSnapshot> snapshot() const;

    const CircuitBreakerConfig& getConfig() const { return m_config; }

private:
    CircuitBreakerConfig m_config;
    SteadyClock m_clock;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> m_breakers;
};

} // namespace Sitewatch
