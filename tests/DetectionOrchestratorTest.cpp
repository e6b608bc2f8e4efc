// =================================================================
// tests/DetectionOrchestratorTest.cpp
// =================================================================
// End-to-end tests of the DetectionOrchestrator facade over a mock engine.

#include "Sitewatch/DetectionOrchestrator.hpp"
#include "Sitewatch/Errors.hpp"
#include "MockEngineClient.hpp"
#include <iostream>
#include <cassert>

using Sitewatch::Capability;
using Sitewatch::CircuitBreakerState;
using Sitewatch::DetectionStatus;

class DetectionOrchestratorTest {
private:
    static Sitewatch::ApplicationConfig makeConfig() {
        Sitewatch::ApplicationConfig config;
        config.orchestrator.random_seed = 11;
        config.orchestrator.circuit_breaker_threshold = 2;
        config.orchestrator.engine_timeout = std::chrono::milliseconds(500);
        config.models = Sitewatch::ConfigParser::defaultModels();
        return config;
    }

    static Sitewatch::DetectionRequest makeRequest(std::vector<Capability> capabilities) {
        Sitewatch::DetectionRequest request;
        request.photo_id = "photo-7";
        request.photo_url = "https://cdn.example.com/photo-7.jpg";
        request.capabilities = std::move(capabilities);
        return request;
    }

public:
    DetectionOrchestratorTest() {
        SitewatchTest::quietLogs();
    }

    void testSubmitAndStatus() {
        std::cout << "Testing submit and status lookup..." << std::endl;

        auto client = std::make_shared<SitewatchTest::MockEngineClient>();
        Sitewatch::DetectionOrchestrator orchestrator(makeConfig(), client);

        auto response = orchestrator.submit(makeRequest({Capability::DAMAGE, Capability::VOLUME}));
        assert(response.status == DetectionStatus::COMPLETED && "Default models should answer");
        assert(response.model_versions[Capability::VOLUME] == "v1.0.0" && "Volume model reported");

        auto stored = orchestrator.getStatus(response.request_id);
        assert(stored.detection_id == response.detection_id && "Status returns the stored response");

        bool threw = false;
        try {
            orchestrator.getStatus("no-such-request");
        } catch (const Sitewatch::RequestNotFoundError&) {
            threw = true;
        }
        assert(threw && "Unknown ids raise RequestNotFound");

        auto metrics = orchestrator.getMetrics();
        assert(metrics.total_requests == 1 && metrics.successful_requests == 1 && "Metrics updated");
        assert(metrics.engine_metrics.size() == 2 && "Two capabilities called");

        std::cout << "✓ Submit and status test passed" << std::endl;
    }

    void testBreakerOpensAcrossRequests() {
        std::cout << "Testing breaker across requests..." << std::endl;

        SitewatchTest::ManualClock clock;
        auto client = std::make_shared<SitewatchTest::MockEngineClient>();
        SitewatchTest::EndpointBehavior broken;
        broken.fail = true;
        client->setBehavior("http://damage-engine:8001", broken);

        Sitewatch::DetectionOrchestrator orchestrator(makeConfig(), client, clock.source());

        orchestrator.submit(makeRequest({Capability::DAMAGE}));
        orchestrator.submit(makeRequest({Capability::DAMAGE}));
        auto third = orchestrator.submit(makeRequest({Capability::DAMAGE, Capability::MATERIAL}));

        assert(third.status == DetectionStatus::PARTIAL && "Material still succeeds");
        assert(third.results[Capability::DAMAGE].error->rfind("NoHealthyEngine: ", 0) == 0 &&
               "Open circuit fails fast");
        assert(client->callsTo("http://damage-engine:8001") == 2 && "No call once the circuit is open");

        bool found_open = false;
        for (const auto& snapshot : orchestrator.getBreakerStates()) {
            if (snapshot.endpoint == "http://damage-engine:8001") {
                found_open = snapshot.state == CircuitBreakerState::OPEN;
            }
        }
        assert(found_open && "Breaker snapshot shows the open circuit");

        // Recovery after the timeout through a single successful call
        client->setBehavior("http://damage-engine:8001", SitewatchTest::EndpointBehavior());
        clock.advance(std::chrono::seconds(60));
        auto recovered = orchestrator.submit(makeRequest({Capability::DAMAGE}));
        assert(recovered.status == DetectionStatus::COMPLETED && "Probe call goes through");
        auto next = orchestrator.submit(makeRequest({Capability::DAMAGE}));
        assert(next.status == DetectionStatus::COMPLETED && "Circuit closed again");

        std::cout << "✓ Breaker across requests test passed" << std::endl;
    }

    void testABTestAdministration() {
        std::cout << "Testing A/B administration..." << std::endl;

        auto client = std::make_shared<SitewatchTest::MockEngineClient>();
        Sitewatch::DetectionOrchestrator orchestrator(makeConfig(), client);
        orchestrator.registerModel(SitewatchTest::makeModel("damage-detector", "v1.3.0-rc1", Capability::DAMAGE,
                                                            "http://damage-canary:8001"));

        Sitewatch::ABTestSpec spec;
        spec.experiment_id = "damage-canary";
        spec.model_a_name = "damage-detector";
        spec.model_a_version = "v1.2.0";
        spec.model_b_name = "damage-detector";
        spec.model_b_version = "v1.3.0-rc1";
        spec.traffic_split = 0.0;
        orchestrator.createABTest(spec);
        assert(orchestrator.listABTests().size() == 1 && "Experiment created");

        for (int i = 0; i < 5; ++i) {
            auto response = orchestrator.submit(makeRequest({Capability::DAMAGE}));
            assert(response.model_versions[Capability::DAMAGE] == "v1.3.0-rc1" && "Split 0 routes everything to B");
        }

        Sitewatch::ABTestSpec unknown = spec;
        unknown.experiment_id = "missing";
        unknown.model_b_version = "v9";
        bool threw = false;
        try {
            orchestrator.createABTest(unknown);
        } catch (const Sitewatch::OrchestratorError&) {
            threw = true;
        }
        assert(threw && "Unknown versions are rejected");

        assert(orchestrator.removeABTest("damage-canary") && "Experiment removed");
        assert(orchestrator.listABTests().empty() && "No experiments left");

        std::cout << "✓ A/B administration test passed" << std::endl;
    }

    void testHealthAndModels() {
        std::cout << "Testing health and models..." << std::endl;

        auto client = std::make_shared<SitewatchTest::MockEngineClient>();
        SitewatchTest::EndpointBehavior down;
        down.healthy = false;
        client->setBehavior("http://volume-engine:8003", down);

        Sitewatch::DetectionOrchestrator orchestrator(makeConfig(), client);
        assert(orchestrator.getHealthSummary().total_engines == 0 && "No probes yet");

        size_t healthy = orchestrator.runHealthCheck();
        assert(healthy == 2 && "Two of three engines healthy");
        auto summary = orchestrator.getHealthSummary();
        assert(summary.status == "degraded" && summary.total_engines == 3 && "Summary reflects probes");
        assert(orchestrator.getHealth()[Capability::VOLUME].front().consecutive_failures == 1 &&
               "Per-capability records");

        auto models = orchestrator.listModels();
        assert(models.size() == 3 && "All capabilities listed");
        assert(orchestrator.getRegistryStatus().enabled_versions == 3 && "Registry status kept");

        auto dedicated = std::make_shared<SitewatchTest::MockEngineClient>();
        orchestrator.setEngineClient(Capability::MATERIAL, dedicated);
        orchestrator.submit(makeRequest({Capability::MATERIAL}));
        assert(dedicated->totalCalls() == 1 && "Dedicated client handles its capability");
        assert(client->totalCalls() == 0 && "Default client not used for material");

        std::cout << "✓ Health and models test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DetectionOrchestrator tests..." << std::endl;
        std::cout << std::endl;

        testSubmitAndStatus();
        testBreakerOpensAcrossRequests();
        testABTestAdministration();
        testHealthAndModels();

        std::cout << std::endl;
        std::cout << "All DetectionOrchestrator tests passed!" << std::endl;
    }
};

int main() {
    try {
        DetectionOrchestratorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All DetectionOrchestrator integration tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
