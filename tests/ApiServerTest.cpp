// =================================================================
// tests/ApiServerTest.cpp
// =================================================================
// Unit tests for the HTTP route handlers.

#include "Sitewatch/ApiServer.hpp"
#include "MockEngineClient.hpp"
#include <iostream>
#include <cassert>

using Sitewatch::Capability;

class ApiServerTest {
private:
    std::shared_ptr<SitewatchTest::MockEngineClient> m_client;
    std::unique_ptr<Sitewatch::DetectionOrchestrator> m_orchestrator;
    std::unique_ptr<Sitewatch::ApiServer> m_server;

public:
    ApiServerTest() {
        SitewatchTest::quietLogs();

        Sitewatch::ApplicationConfig config;
        config.orchestrator.random_seed = 3;
        config.models = Sitewatch::ConfigParser::defaultModels();

        m_client = std::make_shared<SitewatchTest::MockEngineClient>();
        m_orchestrator = std::make_unique<Sitewatch::DetectionOrchestrator>(config, m_client);
        m_server = std::make_unique<Sitewatch::ApiServer>(*m_orchestrator, config.server);
    }

    void testDetect() {
        std::cout << "Testing POST /detect..." << std::endl;

        auto reply = m_server->handleDetect(
            R"({"photo_id": "p-1", "photo_url": "s3://bucket/p-1.jpg", "capabilities": ["damage"]})",
            std::string("trace-9"));

        assert(reply.status == 200 && "Valid request accepted");
        assert(reply.body["status"] == "completed" && "Response status serialized");
        assert(reply.body["correlation_id"] == "trace-9" && "Header correlation id used");
        assert(reply.body["results"].contains("damage") && "Result keyed by capability");

        auto defaults = m_server->handleDetect(R"({"photo_id": "p-2", "photo_url": "s3://bucket/p-2.jpg"})",
                                               std::nullopt);
        assert(defaults.status == 200 && "Capabilities are optional");
        assert(defaults.body["results"].size() == 2 && "Damage and material by default");
        assert(defaults.body["correlation_id"].get<std::string>().rfind("orch-", 0) == 0 &&
               "Generated correlation id");

        std::cout << "✓ POST /detect test passed" << std::endl;
    }

    void testDetectRejections() {
        std::cout << "Testing POST /detect rejections..." << std::endl;

        auto invalid_json = m_server->handleDetect("{not json", std::nullopt);
        assert(invalid_json.status == 400 && invalid_json.body.contains("detail") && "Malformed JSON");

        auto missing = m_server->handleDetect(R"({"photo_url": "u"})", std::nullopt);
        assert(missing.status == 400 && "Missing photo_id");

        auto empty = m_server->handleDetect(R"({"photo_id": "p", "photo_url": "u", "capabilities": []})",
                                            std::nullopt);
        assert(empty.status == 400 && "Empty capability list");

        auto unknown = m_server->handleDetect(R"({"photo_id": "p", "photo_url": "u", "capabilities": ["x"]})",
                                              std::nullopt);
        assert(unknown.status == 400 && "Unknown capability");

        std::cout << "✓ POST /detect rejection test passed" << std::endl;
    }

    void testStatus() {
        std::cout << "Testing GET /status..." << std::endl;

        auto created = m_server->handleDetect(R"({"photo_id": "p-3", "photo_url": "u", "capabilities": ["volume"]})",
                                              std::nullopt);
        std::string request_id = created.body["request_id"];

        auto found = m_server->handleStatus(request_id);
        assert(found.status == 200 && found.body["photo_id"] == "p-3" && "Stored response returned");

        auto missing = m_server->handleStatus("missing");
        assert(missing.status == 404 && missing.body.contains("detail") && "Unknown id is 404");

        std::cout << "✓ GET /status test passed" << std::endl;
    }

    void testReports() {
        std::cout << "Testing GET /health, /metrics and /models..." << std::endl;

        m_orchestrator->runHealthCheck();
        auto health = m_server->handleHealth();
        assert(health.status == 200 && health.body["status"] == "healthy" && "All mock engines healthy");
        assert(health.body["engines"].size() == 3 && "One entry per endpoint");

        auto metrics = m_server->handleMetrics();
        assert(metrics.status == 200 && "Metrics served");
        assert(metrics.body["total_requests"].get<size_t>() >= 1 && "Earlier requests counted");

        auto models = m_server->handleModels();
        assert(models.status == 200 && "Models served");
        assert(models.body["models"]["damage"][0]["version"] == "v1.2.0" && "Default damage model");
        assert(models.body["ab_tests"].empty() && "No experiments configured");

        std::cout << "✓ Report routes test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ApiServer tests..." << std::endl;
        std::cout << std::endl;

        testDetect();
        testDetectRejections();
        testStatus();
        testReports();

        std::cout << std::endl;
        std::cout << "All ApiServer tests passed!" << std::endl;
    }
};

int main() {
    try {
        ApiServerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
