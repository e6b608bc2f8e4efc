// =================================================================
// src/Sitewatch/MetricsCollector.cpp
// =================================================================
// Implementation of rolling orchestrator metrics.

#include "Sitewatch/MetricsCollector.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace Sitewatch {

MetricsCollector::MetricsCollector(size_t window_size) : m_requests(window_size) {
    for (auto& engine : m_engines) {
        engine = std::make_unique<EngineWindow>(window_size);
    }
}

void MetricsCollector::recordEngineCall(Capability capability, bool success, double latency_ms,
                                        double confidence) {
    auto& engine = *m_engines[DetectionTypeUtils::capabilityIndex(capability)];
    std::lock_guard<std::mutex> lock(engine.mutex);
    engine.window.push(CallSample{success, latency_ms, confidence});
}

void MetricsCollector::recordBreakerRejection(Capability capability) {
    auto& engine = *m_engines[DetectionTypeUtils::capabilityIndex(capability)];
    std::lock_guard<std::mutex> lock(engine.mutex);
    engine.breaker_rejections++;
}

void MetricsCollector::recordRequest(DetectionStatus status, double latency_ms) {
    std::lock_guard<std::mutex> lock(m_request_mutex);
    m_requests.push(RequestSample{status, latency_ms});
}

double MetricsCollector::percentile(const std::vector<double>& sorted, double fraction) {
    if (sorted.empty()) {
        return 0.0;
    }

    double rank = static_cast<double>(sorted.size() - 1) * fraction;
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = std::min(lower + 1, sorted.size() - 1);
    return sorted[lower] + (rank - static_cast<double>(lower)) * (sorted[upper] - sorted[lower]);
}

EngineMetrics MetricsCollector::engineSnapshot(Capability capability) const {
    std::vector<CallSample> samples;
    EngineMetrics metrics;
    {
        const auto& engine = *m_engines[DetectionTypeUtils::capabilityIndex(capability)];
        std::lock_guard<std::mutex> lock(engine.mutex);
        samples = engine.window.samples();
        metrics.breaker_rejections = engine.breaker_rejections;
    }

    metrics.total_requests = samples.size();
    if (samples.empty()) {
        return metrics;
    }

    std::vector<double> latencies;
    latencies.reserve(samples.size());
    double confidence_sum = 0.0;
    size_t successes = 0;
    for (const auto& sample : samples) {
        latencies.push_back(sample.latency_ms);
        if (sample.success) {
            confidence_sum += sample.confidence;
            successes++;
        } else {
            metrics.error_count++;
        }
    }
    std::sort(latencies.begin(), latencies.end());

    metrics.error_rate = static_cast<double>(metrics.error_count) / static_cast<double>(samples.size());
    metrics.avg_confidence = successes > 0 ? confidence_sum / static_cast<double>(successes) : 0.0;
    metrics.avg_latency_ms = std::accumulate(latencies.begin(), latencies.end(), 0.0) /
                             static_cast<double>(latencies.size());
    metrics.p50_latency_ms = percentile(latencies, 0.50);
    metrics.p90_latency_ms = percentile(latencies, 0.90);
    metrics.p95_latency_ms = percentile(latencies, 0.95);
    return metrics;
}

OrchestratorMetrics MetricsCollector::snapshot() const {
    std::vector<RequestSample> samples;
    {
        std::lock_guard<std::mutex> lock(m_request_mutex);
        samples = m_requests.samples();
    }

    OrchestratorMetrics metrics;
    metrics.total_requests = samples.size();

    std::vector<double> latencies;
    latencies.reserve(samples.size());
    for (const auto& sample : samples) {
        latencies.push_back(sample.latency_ms);
        if (sample.status == DetectionStatus::COMPLETED) {
            metrics.successful_requests++;
        } else if (sample.status == DetectionStatus::FAILED) {
            metrics.failed_requests++;
        }
    }

    if (!latencies.empty()) {
        std::sort(latencies.begin(), latencies.end());
        metrics.avg_latency_ms = std::accumulate(latencies.begin(), latencies.end(), 0.0) /
                                 static_cast<double>(latencies.size());
        metrics.p50_latency_ms = percentile(latencies, 0.50);
        metrics.p90_latency_ms = percentile(latencies, 0.90);
        metrics.p95_latency_ms = percentile(latencies, 0.95);
        metrics.error_rate = static_cast<double>(metrics.failed_requests) /
                             static_cast<double>(metrics.total_requests);
    }

    for (Capability capability : DetectionTypeUtils::allCapabilities()) {
        EngineMetrics engine = engineSnapshot(capability);
        if (engine.total_requests > 0 || engine.breaker_rejections > 0) {
            metrics.engine_metrics[capability] = engine;
        }
    }

    return metrics;
}

} // namespace Sitewatch
