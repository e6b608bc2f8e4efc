// =================================================================
// tests/HttpEngineClientTest.cpp
// =================================================================
// Unit tests for HttpEngineClient payload handling.

#include "Sitewatch/HttpEngineClient.hpp"
#include "Sitewatch/Errors.hpp"
#include "MockEngineClient.hpp"
#include <httplib.h>
#include <iostream>
#include <cassert>
#include <mutex>
#include <thread>

using Sitewatch::Capability;
using Sitewatch::HttpEngineClient;

namespace {

/**
 * @brief Scripted engine served on an ephemeral localhost port
 */
class LocalEngine {
public:
    LocalEngine() {
        m_server.Post("/ok/predict", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_last_correlation_id = req.get_header_value("X-Correlation-ID");
                m_last_body = req.body;
            }
            res.set_content(R"({"model_version": "v2.1.0", "confidence": 0.88, "results": {"materials": ["rebar"]}})",
                            "application/json");
        });
        m_server.Post("/slow/predict", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(600));
            res.set_content(R"({"confidence": 0.5})", "application/json");
        });
        m_server.Post("/unavailable/predict", [](const httplib::Request&, httplib::Response& res) {
            res.status = 503;
            res.set_content("engine overloaded", "text/plain");
        });
        m_server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
        m_server.Get("/unavailable/health", [](const httplib::Request&, httplib::Response& res) {
            res.status = 503;
        });

        m_port = m_server.bind_to_any_port("127.0.0.1");
        if (m_port <= 0) {
            throw std::runtime_error("Could not bind a local engine port");
        }
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        while (!m_server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~LocalEngine() {
        m_server.stop();
        m_thread.join();
    }

    std::string endpoint() const {
        return "http://127.0.0.1:" + std::to_string(m_port);
    }

    std::string lastCorrelationId() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_correlation_id;
    }

    std::string lastBody() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_body;
    }

private:
    httplib::Server m_server;
    std::thread m_thread;
    int m_port = 0;
    std::mutex m_mutex;
    std::string m_last_correlation_id;
    std::string m_last_body;
};

} // namespace

class HttpEngineClientTest {
private:
    Sitewatch::ModelVersion m_model;

    static std::string predictFailureKind(HttpEngineClient& client, const Sitewatch::ModelVersion& model,
                                          const Sitewatch::InferenceCall& call,
                                          std::chrono::milliseconds timeout) {
        try {
            client.predict(model, call, timeout);
        } catch (const Sitewatch::OrchestratorError& e) {
            return e.kind();
        }
        return "";
    }

    bool rejects(const std::string& body) const {
        try {
            HttpEngineClient::parseReply(body, m_model);
        } catch (const Sitewatch::EngineCallError&) {
            return true;
        }
        return false;
    }

public:
    HttpEngineClientTest() {
        SitewatchTest::quietLogs();
        m_model = SitewatchTest::makeModel("material-detector", "v2.1.0", Capability::MATERIAL,
                                           "http://127.0.0.1:1", 0.8);
    }

    void testRequestBody() {
        std::cout << "Testing request body..." << std::endl;

        Sitewatch::InferenceCall call;
        call.request_id = "r-1";
        call.correlation_id = "trace-1";
        call.photo_id = "p-1";
        call.photo_url = "s3://bucket/p-1.jpg";
        call.capability = Capability::MATERIAL;
        call.priority = Sitewatch::Priority::LOW;
        call.metadata["site"] = "north-yard";

        auto body = HttpEngineClient::buildRequestBody(m_model, call);
        assert(body["photo_url"] == "s3://bucket/p-1.jpg" && "Photo reference forwarded");
        assert(body["capability"] == "material" && "Capability name forwarded");
        assert(body["priority"] == "low" && "Priority forwarded");
        assert(body["model_version"] == "v2.1.0" && "Selected version forwarded");
        assert(body["confidence_threshold"] == 0.8 && "Threshold forwarded");
        assert(body["metadata"]["site"] == "north-yard" && "Metadata forwarded");

        std::cout << "✓ Request body test passed" << std::endl;
    }

    void testParseReply() {
        std::cout << "Testing reply parsing..." << std::endl;

        auto reply = HttpEngineClient::parseReply(
            R"({"model_version": "v2.1.1", "confidence": 0.92, "results": {"materials": ["steel"]}})", m_model);
        assert(reply.model_version == "v2.1.1" && "Engine-reported version wins");
        assert(reply.confidence == 0.92 && "Confidence parsed");
        assert(reply.results["materials"][0] == "steel" && "Results passed through");

        auto sparse = HttpEngineClient::parseReply(R"({"confidence": 0.5})", m_model);
        assert(sparse.model_version == "v2.1.0" && "Missing version falls back to the selected one");
        assert(sparse.results.is_object() && sparse.results.empty() && "Missing results become an empty object");

        std::cout << "✓ Reply parsing test passed" << std::endl;
    }

    void testMalformedReplies() {
        std::cout << "Testing malformed replies..." << std::endl;

        assert(rejects("not json") && "Unparseable body");
        assert(rejects("[1, 2]") && "Body must be an object");
        assert(rejects(R"({"confidence": "high"})") && "Confidence must be numeric");
        assert(rejects(R"({"confidence": 1.5})") && "Confidence above one");
        assert(rejects(R"({"confidence": -0.1})") && "Confidence below zero");
        assert(rejects(R"({"confidence": 0.5, "results": [1]})") && "Results must be an object");

        std::cout << "✓ Malformed reply test passed" << std::endl;
    }

    void testUnreachableEngine() {
        std::cout << "Testing unreachable engine..." << std::endl;

        HttpEngineClient client;
        assert(client.getName() == "http" && "Client name");
        assert(!client.probe(m_model, std::chrono::milliseconds(200)) && "Closed port is unhealthy");

        Sitewatch::InferenceCall call;
        call.photo_id = "p-1";
        call.photo_url = "s3://bucket/p-1.jpg";
        assert(predictFailureKind(client, m_model, call, std::chrono::milliseconds(200)) == "EngineCallError" &&
               "Refused connection is a call error, not a timeout");

        std::cout << "✓ Unreachable engine test passed" << std::endl;
    }

    void testLocalEngine() {
        std::cout << "Testing calls against a local engine..." << std::endl;

        LocalEngine engine;
        Sitewatch::ModelVersion model = m_model;
        model.endpoint = engine.endpoint();

        Sitewatch::InferenceCall call;
        call.request_id = "r-9";
        call.correlation_id = "trace-9";
        call.photo_id = "p-9";
        call.photo_url = "s3://bucket/p-9.jpg";
        call.capability = Capability::MATERIAL;

        HttpEngineClient ok_client("/ok/predict");
        auto reply = ok_client.predict(model, call, std::chrono::milliseconds(2000));
        assert(reply.confidence == 0.88 && reply.results["materials"][0] == "rebar" && "Reply decoded");
        assert(engine.lastCorrelationId() == "trace-9" && "Correlation header sent");
        auto sent = nlohmann::json::parse(engine.lastBody());
        assert(sent["photo_url"] == "s3://bucket/p-9.jpg" && sent["capability"] == "material" &&
               "Request body sent as JSON");
        assert(ok_client.probe(model, std::chrono::milliseconds(1000)) && "2xx health is healthy");

        HttpEngineClient slow_client("/slow/predict");
        assert(predictFailureKind(slow_client, model, call, std::chrono::milliseconds(150)) == "EngineTimeout" &&
               "Read past the deadline is a timeout");

        HttpEngineClient unavailable_client("/unavailable/predict", "/unavailable/health");
        assert(predictFailureKind(unavailable_client, model, call, std::chrono::milliseconds(2000)) ==
               "EngineCallError" && "Non-2xx status is a call error");
        assert(!unavailable_client.probe(model, std::chrono::milliseconds(1000)) && "503 health is unhealthy");

        std::cout << "✓ Local engine test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running HttpEngineClient tests..." << std::endl;
        std::cout << std::endl;

        testRequestBody();
        testParseReply();
        testMalformedReplies();
        testUnreachableEngine();
        testLocalEngine();

        std::cout << std::endl;
        std::cout << "All HttpEngineClient tests passed!" << std::endl;
    }
};

int main() {
    try {
        HttpEngineClientTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
