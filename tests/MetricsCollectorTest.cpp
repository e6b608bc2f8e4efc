// =================================================================
// tests/MetricsCollectorTest.cpp
// =================================================================
// Unit tests for MetricsCollector and SampleWindow.

#include "Sitewatch/MetricsCollector.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <thread>
#include <vector>

using Sitewatch::Capability;
using Sitewatch::DetectionStatus;

namespace {

bool near(double actual, double expected) {
    return std::abs(actual - expected) < 1e-9;
}

} // namespace

class MetricsCollectorTest {
public:
    void testPercentiles() {
        std::cout << "Testing request percentiles..." << std::endl;

        Sitewatch::MetricsCollector metrics;
        // Recorded out of order on purpose
        for (int i = 100; i >= 1; --i) {
            metrics.recordRequest(DetectionStatus::COMPLETED, i * 10.0);
        }

        auto snapshot = metrics.snapshot();
        assert(snapshot.total_requests == 100 && "All requests should be counted");
        assert(near(snapshot.p50_latency_ms, 505.0) && "p50 should interpolate to 505");
        assert(near(snapshot.p90_latency_ms, 901.0) && "p90 should interpolate to 901");
        assert(near(snapshot.p95_latency_ms, 950.5) && "p95 should interpolate to 950.5");
        assert(near(snapshot.avg_latency_ms, 505.0) && "Mean of 10..1000 is 505");
        assert(near(snapshot.error_rate, 0.0) && "No failures recorded");

        std::cout << "✓ Percentile test passed" << std::endl;
    }

    void testPercentileEdgeCases() {
        std::cout << "Testing percentile edge cases..." << std::endl;

        assert(Sitewatch::MetricsCollector::percentile({}, 0.5) == 0.0 && "Empty input yields zero");
        assert(Sitewatch::MetricsCollector::percentile({42.0}, 0.95) == 42.0 && "Single sample is every percentile");
        assert(near(Sitewatch::MetricsCollector::percentile({1.0, 2.0}, 0.5), 1.5) && "Midpoint interpolation");

        Sitewatch::MetricsCollector empty;
        auto snapshot = empty.snapshot();
        assert(snapshot.total_requests == 0 && "Nothing recorded yet");
        assert(snapshot.engine_metrics.empty() && "No engine windows have samples");

        std::cout << "✓ Percentile edge case test passed" << std::endl;
    }

    void testOutcomeCounts() {
        std::cout << "Testing outcome counting..." << std::endl;

        Sitewatch::MetricsCollector metrics;
        metrics.recordRequest(DetectionStatus::COMPLETED, 100);
        metrics.recordRequest(DetectionStatus::COMPLETED, 100);
        metrics.recordRequest(DetectionStatus::PARTIAL, 100);
        metrics.recordRequest(DetectionStatus::FAILED, 100);

        auto snapshot = metrics.snapshot();
        assert(snapshot.total_requests == 4 && "Four requests recorded");
        assert(snapshot.successful_requests == 2 && "Only COMPLETED counts as successful");
        assert(snapshot.failed_requests == 1 && "Only FAILED counts as failed");
        assert(near(snapshot.error_rate, 0.25) && "Error rate is failed over total");

        std::cout << "✓ Outcome counting test passed" << std::endl;
    }

    void testWindowEviction() {
        std::cout << "Testing window eviction..." << std::endl;

        Sitewatch::MetricsCollector metrics(10);
        for (int i = 0; i < 10; ++i) {
            metrics.recordRequest(DetectionStatus::FAILED, 1000.0);
        }
        for (int i = 0; i < 10; ++i) {
            metrics.recordRequest(DetectionStatus::COMPLETED, 10.0);
        }

        auto snapshot = metrics.snapshot();
        assert(snapshot.total_requests == 10 && "Window should hold its capacity only");
        assert(snapshot.failed_requests == 0 && "Old failures should have been evicted");
        assert(near(snapshot.p95_latency_ms, 10.0) && "Only recent latencies should remain");

        Sitewatch::SampleWindow<int> window(3);
        for (int i = 1; i <= 5; ++i) {
            window.push(i);
        }
        assert(window.size() == 3 && window.capacity() == 3 && "Ring should stay at capacity");
        int sum = 0;
        for (int value : window.samples()) {
            sum += value;
        }
        assert(sum == 12 && "Ring should keep the newest samples 3, 4, 5");

        std::cout << "✓ Window eviction test passed" << std::endl;
    }

    void testEngineMetrics() {
        std::cout << "Testing per-capability metrics..." << std::endl;

        Sitewatch::MetricsCollector metrics;
        metrics.recordEngineCall(Capability::DAMAGE, true, 100.0, 0.8);
        metrics.recordEngineCall(Capability::DAMAGE, true, 200.0, 0.6);
        metrics.recordEngineCall(Capability::DAMAGE, false, 5000.0);
        metrics.recordEngineCall(Capability::MATERIAL, true, 50.0, 0.95);

        auto damage = metrics.engineSnapshot(Capability::DAMAGE);
        assert(damage.total_requests == 3 && "Three damage calls");
        assert(damage.error_count == 1 && "One damage failure");
        assert(near(damage.error_rate, 1.0 / 3.0) && "Error rate per capability");
        assert(near(damage.avg_confidence, 0.7) && "Confidence averages successes only");
        assert(near(damage.p50_latency_ms, 200.0) && "Median of three latencies");

        auto snapshot = metrics.snapshot();
        assert(snapshot.engine_metrics.size() == 2 && "Only capabilities with samples are reported");
        assert(snapshot.engine_metrics.count(Capability::VOLUME) == 0 && "Volume never called");
        assert(snapshot.total_requests == 0 && "Engine calls are not requests");

        std::cout << "✓ Per-capability metrics test passed" << std::endl;
    }

    void testBreakerRejections() {
        std::cout << "Testing breaker rejection counts..." << std::endl;

        Sitewatch::MetricsCollector metrics(2);
        metrics.recordBreakerRejection(Capability::VOLUME);
        metrics.recordBreakerRejection(Capability::VOLUME);
        metrics.recordBreakerRejection(Capability::VOLUME);

        auto volume = metrics.engineSnapshot(Capability::VOLUME);
        assert(volume.breaker_rejections == 3 && "Rejections are not bounded by the window");
        assert(volume.total_requests == 0 && volume.error_rate == 0.0 && "Rejections are not engine calls");

        metrics.recordEngineCall(Capability::VOLUME, true, 40.0, 0.9);
        metrics.recordEngineCall(Capability::VOLUME, true, 60.0, 0.9);
        metrics.recordEngineCall(Capability::VOLUME, false, 80.0);
        volume = metrics.engineSnapshot(Capability::VOLUME);
        assert(volume.breaker_rejections == 3 && "Window eviction keeps the rejection count");
        assert(volume.total_requests == 2 && "Window still bounds call samples");

        auto snapshot = metrics.snapshot();
        assert(snapshot.engine_metrics.count(Capability::VOLUME) == 1 && "Volume reported");
        assert(metrics.engineSnapshot(Capability::DAMAGE).breaker_rejections == 0 && "Counts are per capability");

        std::cout << "✓ Breaker rejection count test passed" << std::endl;
    }

    void testConcurrentRecording() {
        std::cout << "Testing concurrent recording..." << std::endl;

        Sitewatch::MetricsCollector metrics(100000);
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&metrics]() {
                for (int i = 0; i < 500; ++i) {
                    metrics.recordEngineCall(Capability::DAMAGE, true, 10.0, 0.9);
                    metrics.recordRequest(DetectionStatus::COMPLETED, 10.0);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        auto snapshot = metrics.snapshot();
        assert(snapshot.total_requests == 4000 && "No request samples should be lost");
        assert(snapshot.engine_metrics[Capability::DAMAGE].total_requests == 4000 &&
               "No engine samples should be lost");

        std::cout << "✓ Concurrent recording test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running MetricsCollector tests..." << std::endl;
        std::cout << std::endl;

        testPercentiles();
        testPercentileEdgeCases();
        testOutcomeCounts();
        testWindowEviction();
        testEngineMetrics();
        testBreakerRejections();
        testConcurrentRecording();

        std::cout << std::endl;
        std::cout << "All MetricsCollector tests passed!" << std::endl;
    }
};

int main() {
    try {
        MetricsCollectorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
