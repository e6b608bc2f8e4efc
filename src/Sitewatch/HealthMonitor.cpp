// =================================================================
// src/Sitewatch/HealthMonitor.cpp
// =================================================================
// Implementation of the background engine health monitor.

#include "Sitewatch/HealthMonitor.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/Logger.hpp"
#include <set>

namespace Sitewatch {

HealthMonitor::HealthMonitor(ModelRegistry& registry, CircuitBreakerRegistry& breakers,
                             EngineClientTable& clients, const OrchestratorConfig& config)
    : m_registry(registry), m_breakers(breakers), m_clients(clients), m_config(config) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (m_thread || m_config.health_check_interval.count() <= 0) {
        return;
    }

    m_stop.store(false);
    m_thread = std::make_unique<std::thread>(&HealthMonitor::monitorLoop, this);
    Logger::getInstance().info("HealthMonitor", "Started health check thread (every " +
        std::to_string(m_config.health_check_interval.count()) + "s)");
}

void HealthMonitor::stop() {
    if (!m_thread) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wait_mutex);
        m_stop.store(true);
    }
    m_wait_cv.notify_all();
    m_thread->join();
    m_thread.reset();
    Logger::getInstance().info("HealthMonitor", "Stopped health check thread");
}

bool HealthMonitor::isRunning() const {
    return m_thread != nullptr;
}

size_t HealthMonitor::runOnce() {
    size_t healthy = 0;

    for (Capability capability : DetectionTypeUtils::allCapabilities()) {
        if (!m_registry.hasCapability(capability)) {
            continue;
        }

        std::set<std::string> probed;
        for (const auto& model : m_registry.list(capability)) {
            if (!probed.insert(model.endpoint).second) {
                continue;
            }
            if (probeEndpoint(model)) {
                healthy++;
            }
        }
    }

    Logger::getInstance().debug("HealthMonitor", "Health sweep finished: " +
        std::to_string(healthy) + " healthy endpoints");
    return healthy;
}

bool HealthMonitor::probeEndpoint(const ModelVersion& model) {
    ensureRecord(model.capability, model.endpoint);

    auto start_time = std::chrono::steady_clock::now();
    bool healthy = false;
    std::string failure;

    try {
        healthy = m_clients.forCapability(model.capability)->probe(model, m_config.health_check_timeout);
        if (!healthy) {
            failure = "probe reported unhealthy";
        }
    } catch (const OrchestratorError& e) {
        failure = e.describe();
    } catch (const std::exception& e) {
        failure = e.what();
    }

    long elapsed_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count());

    {
        auto& slot = m_health[DetectionTypeUtils::capabilityIndex(model.capability)];
        std::lock_guard<std::mutex> lock(slot.mutex);
        EngineHealth& record = slot.records.at(model.endpoint);
        record.healthy = healthy;
        record.last_check_time = std::chrono::system_clock::now();
        record.last_response_time_ms = elapsed_ms;
        if (healthy) {
            record.consecutive_failures = 0;
        } else {
            record.error_count++;
            record.consecutive_failures++;
        }
    }

    auto breaker = m_breakers.forEndpoint(model.endpoint);
    if (healthy) {
        breaker->recordSuccess();
    } else {
        breaker->recordFailure();
        Logger::getInstance().warning("HealthMonitor", "Health check failed for " +
            DetectionTypeUtils::capabilityToString(model.capability) + ": " + failure, model.endpoint);
    }

    return healthy;
}

void HealthMonitor::ensureRecord(Capability capability, const std::string& endpoint) {
    auto& slot = m_health[DetectionTypeUtils::capabilityIndex(capability)];
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.records.find(endpoint) == slot.records.end()) {
        EngineHealth record;
        record.capability = capability;
        record.endpoint = endpoint;
        slot.records.emplace(endpoint, record);
    }
}

std::map<Capability, std::vector<EngineHealth>> HealthMonitor::getHealth() const {
    std::map<Capability, std::vector<EngineHealth>> result;
    for (Capability capability : DetectionTypeUtils::allCapabilities()) {
        const auto& slot = m_health[DetectionTypeUtils::capabilityIndex(capability)];
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.records.empty()) {
            continue;
        }
        auto& records = result[capability];
        for (const auto& [endpoint, record] : slot.records) {
            records.push_back(record);
        }
    }
    return result;
}

std::optional<EngineHealth> HealthMonitor::getHealth(Capability capability, const std::string& endpoint) const {
    const auto& slot = m_health[DetectionTypeUtils::capabilityIndex(capability)];
    std::lock_guard<std::mutex> lock(slot.mutex);
    auto it = slot.records.find(endpoint);
    if (it == slot.records.end()) {
        return std::nullopt;
    }
    return it->second;
}

long HealthMonitor::responseTimeMs(Capability capability, const std::string& endpoint) const {
    auto record = getHealth(capability, endpoint);
    return record ? record->last_response_time_ms : 0;
}

HealthSummary HealthMonitor::summary() const {
    HealthSummary summary;

    for (const auto& [capability, records] : getHealth()) {
        for (const auto& record : records) {
            EngineStatus status;
            status.health = record;
            auto breaker = m_breakers.find(record.endpoint);
            if (breaker) {
                status.breaker_state = breaker->getState();
            }

            summary.total_engines++;
            if (record.healthy) {
                summary.healthy_engines++;
            }
            summary.engines.push_back(status);
        }
    }

    summary.status = summary.healthy_engines == summary.total_engines ? "healthy" : "degraded";
    return summary;
}

void HealthMonitor::monitorLoop() {
    while (!m_stop.load()) {
        try {
            runOnce();
        } catch (const std::exception& e) {
            Logger::getInstance().error("HealthMonitor",
                "Health check loop error: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(m_wait_mutex);
        m_wait_cv.wait_for(lock, m_config.health_check_interval, [this] { return m_stop.load(); });
    }
}

} // namespace Sitewatch
