// =================================================================
// src/Sitewatch/CircuitBreaker.cpp
// =================================================================
// Implementation of the per-endpoint circuit breaker.

#include "Sitewatch/CircuitBreaker.hpp"
#include "Sitewatch/Logger.hpp"

namespace Sitewatch {

CircuitBreaker::CircuitBreaker(const std::string& endpoint, const CircuitBreakerConfig& config,
                               SteadyClock clock)
    : m_endpoint(endpoint), m_config(config), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return std::chrono::steady_clock::now(); };
    }
}

bool CircuitBreaker::allowRequest() {
    std::lock_guard<std::mutex> lock(m_mutex);
    refreshLocked();

    switch (m_state) {
        case CircuitBreakerState::CLOSED:
            return true;
        case CircuitBreakerState::OPEN:
            return false;
        case CircuitBreakerState::HALF_OPEN:
            if (m_probe_in_flight) {
                return false;
            }
            m_probe_in_flight = true;
            Logger::getInstance().debug("CircuitBreaker", "Admitting half-open probe", m_endpoint);
            return true;
    }
    return false;
}

bool CircuitBreaker::canAttempt() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (m_state) {
        case CircuitBreakerState::CLOSED:
            return true;
        case CircuitBreakerState::OPEN:
            return recoveryElapsedLocked();
        case CircuitBreakerState::HALF_OPEN:
            return !m_probe_in_flight;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(m_mutex);
    refreshLocked();

    if (m_state == CircuitBreakerState::HALF_OPEN) {
        m_success_count_in_half_open++;
        transitionLocked(CircuitBreakerState::CLOSED);
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(m_mutex);
    refreshLocked();

    m_failure_count++;

    if (m_state == CircuitBreakerState::HALF_OPEN) {
        Logger::getInstance().warning("CircuitBreaker", "Half-open probe failed, reopening circuit", m_endpoint);
        transitionLocked(CircuitBreakerState::OPEN);
    } else if (m_state == CircuitBreakerState::CLOSED &&
               m_failure_count >= m_config.failure_threshold) {
        Logger::getInstance().warning("CircuitBreaker",
            "Failure threshold reached (" + std::to_string(m_failure_count) + " failures)", m_endpoint);
        transitionLocked(CircuitBreakerState::OPEN);
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != CircuitBreakerState::CLOSED) {
        transitionLocked(CircuitBreakerState::CLOSED);
    }
    m_failure_count = 0;
}

CircuitBreakerState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == CircuitBreakerState::OPEN && recoveryElapsedLocked()) {
        return CircuitBreakerState::HALF_OPEN;
    }
    return m_state;
}

size_t CircuitBreaker::getFailureCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failure_count;
}

CircuitBreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    CircuitBreakerSnapshot snap;
    snap.endpoint = m_endpoint;
    snap.state = m_state;
    if (m_state == CircuitBreakerState::OPEN && recoveryElapsedLocked()) {
        snap.state = CircuitBreakerState::HALF_OPEN;
    }
    snap.failure_count = m_failure_count;
    snap.success_count_in_half_open = m_success_count_in_half_open;
    snap.probe_in_flight = m_probe_in_flight;
    snap.opened_at = m_opened_at;
    return snap;
}

void CircuitBreaker::refreshLocked() {
    if (m_state == CircuitBreakerState::OPEN && recoveryElapsedLocked()) {
        transitionLocked(CircuitBreakerState::HALF_OPEN);
    }
}

bool CircuitBreaker::recoveryElapsedLocked() const {
    return m_clock() - m_opened_at >= m_config.recovery_timeout;
}

void CircuitBreaker::transitionLocked(CircuitBreakerState to) {
    CircuitBreakerState from = m_state;
    m_state = to;

    switch (to) {
        case CircuitBreakerState::OPEN:
            m_opened_at = m_clock();
            m_probe_in_flight = false;
            break;
        case CircuitBreakerState::HALF_OPEN:
            m_probe_in_flight = false;
            m_success_count_in_half_open = 0;
            break;
        case CircuitBreakerState::CLOSED:
            m_failure_count = 0;
            m_probe_in_flight = false;
            break;
    }

    Logger::getInstance().logBreakerTransition(m_endpoint, from, to);
}

// =================================================================
// CircuitBreakerRegistry
// =================================================================

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreakerConfig& config, SteadyClock clock)
    : m_config(config), m_clock(std::move(clock)) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::forEndpoint(const std::string& endpoint) {
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_breakers.find(endpoint);
        if (it != m_breakers.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto& breaker = m_breakers[endpoint];
    if (!breaker) {
        breaker = std::make_shared<CircuitBreaker>(endpoint, m_config, m_clock);
    }
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& endpoint) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_breakers.find(endpoint);
    return it != m_breakers.end() ? it->second : nullptr;
}

std::vector<CircuitBreakerSnapshot> CircuitBreakerRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::vector<CircuitBreakerSnapshot> snapshots;
    snapshots.reserve(m_breakers.size());
    for (const auto& [endpoint, breaker] : m_breakers) {
        snapshots.push_back(breaker->snapshot());
    }
    return snapshots;
}

} // namespace Sitewatch
