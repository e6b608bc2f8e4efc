// =================================================================
// include/Sitewatch/MetricsCollector.hpp
// =================================================================
// Rolling latency and outcome statistics.

#pragma once

#include "Sitewatch/DetectionTypes.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <vector>

namespace Sitewatch {

/**
 * @brief Fixed-capacity ring of the most recent samples
 *
 * Once full, each push overwrites the oldest sample.
 */
template <typename T>
class SampleWindow {
public:
    explicit SampleWindow(size_t capacity) : m_capacity(capacity > 0 ? capacity : 1) {
        m_samples.reserve(m_capacity);
    }

    void push(const T& sample) {
        if (m_samples.size() < m_capacity) {
            m_samples.push_back(sample);
            return;
        }
        m_samples[m_head] = sample;
        m_head = (m_head + 1) % m_capacity;
    }

    /// Samples in no particular order.
    const std::vector<T>& samples() const { return m_samples; }

    size_t size() const { return m_samples.size(); }
    size_t capacity() const { return m_capacity; }

private:
    size_t m_capacity;
    size_t m_head = 0;
    std::vector<T> m_samples;
};

/**
 * @brief Records call and request outcomes in bounded windows
 *
 * One window per capability for engine calls plus one for whole requests,
 * each with its own lock. Statistics are derived on demand from the
 * windows' current contents.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(size_t window_size = 1000);

    virtual ~MetricsCollector() = default;

    /**
     * @brief Record one engine call outcome
     * @param capability Capability served
     * @param success Whether the call succeeded
     * @param latency_ms Call duration, timeouts included
     * @param confidence Reported confidence, 0 for failures
     */
    virtual void recordEngineCall(Capability capability, bool success, double latency_ms,
                                  double confidence = 0.0);

    /**
     * @brief Count a call rejected before reaching any engine
     *
     * Rejections are cumulative and live outside the sample window; they
     * are not engine calls and never affect latency or error rate.
     */
    virtual void recordBreakerRejection(Capability capability);

    /**
     * @brief Record one finished detection request
     */
    virtual void recordRequest(DetectionStatus status, double latency_ms);

    /**
     * @brief Derive statistics from the current windows
     */
    virtual OrchestratorMetrics snapshot() const;

    virtual EngineMetrics engineSnapshot(Capability capability) const;

    /**
     * @brief Linear-interpolated percentile of sorted values
     * @param sorted Values in ascending order
     * @param fraction Percentile as a fraction in [0, 1]
     * @return 0 for an empty input
     */
    static double percentile(const std::vector<double>& sorted, double fraction);

private:
    struct CallSample {
        bool success = false;
        double latency_ms = 0.0;
        double confidence = 0.0;
    };

    struct RequestSample {
        DetectionStatus status = DetectionStatus::COMPLETED;
        double latency_ms = 0.0;
    };

    struct EngineWindow {
        mutable std::mutex mutex;
        SampleWindow<CallSample> window;
        size_t breaker_rejections = 0;
        explicit EngineWindow(size_t capacity) : window(capacity) {}
    };

    std::array<std::unique_ptr<EngineWindow>, kCapabilityCount> m_engines;

    mutable std::mutex m_request_mutex;
    SampleWindow<RequestSample> m_requests;
};

} // namespace Sitewatch
