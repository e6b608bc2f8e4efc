// =================================================================
// src/Sitewatch/HttpEngineClient.cpp
// =================================================================
// HTTP/JSON engine client built on cpp-httplib.

#include "Sitewatch/HttpEngineClient.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/Logger.hpp"
#include <httplib.h>

namespace Sitewatch {

namespace {

void applyTimeout(httplib::Client& client, std::chrono::milliseconds timeout) {
    auto sec = static_cast<time_t>(timeout.count() / 1000);
    auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
}

bool isTimeout(httplib::Error error) {
    return error == httplib::Error::Read || error == httplib::Error::ConnectionTimeout;
}

} // namespace

HttpEngineClient::HttpEngineClient(const std::string& predict_path, const std::string& health_path)
    : m_predict_path(predict_path), m_health_path(health_path) {}

EngineReply HttpEngineClient::predict(const ModelVersion& model, const InferenceCall& call,
                                      std::chrono::milliseconds timeout) {
    httplib::Client client(model.endpoint);
    applyTimeout(client, timeout);

    httplib::Headers headers = {{"Accept", "application/json"}};
    if (!call.correlation_id.empty()) {
        headers.emplace("X-Correlation-ID", call.correlation_id);
    }

    auto res = client.Post(m_predict_path.c_str(), headers,
                           buildRequestBody(model, call).dump(), "application/json");

    if (!res) {
        // A read that outlives the read timeout surfaces as Error::Read.
        if (isTimeout(res.error())) {
            throw EngineTimeoutError("Engine at " + model.endpoint + " did not answer within " +
                                     std::to_string(timeout.count()) + "ms");
        }
        throw EngineCallError("Failed to reach engine at " + model.endpoint + ": " +
                              httplib::to_string(res.error()));
    }

    if (res->status < 200 || res->status >= 300) {
        throw EngineCallError("Engine at " + model.endpoint + " returned status " +
                              std::to_string(res->status) + " - " + res->body);
    }

    return parseReply(res->body, model);
}

bool HttpEngineClient::probe(const ModelVersion& model, std::chrono::milliseconds timeout) {
    httplib::Client client(model.endpoint);
    applyTimeout(client, timeout);

    auto res = client.Get(m_health_path.c_str());
    if (!res) {
        Logger::getInstance().debug("HttpEngineClient", "Health probe could not connect",
                                    model.endpoint + ": " + httplib::to_string(res.error()));
        return false;
    }

    return res->status >= 200 && res->status < 300;
}

std::string HttpEngineClient::getName() const {
    return "http";
}

nlohmann::json HttpEngineClient::buildRequestBody(const ModelVersion& model, const InferenceCall& call) {
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : call.metadata) {
        metadata[key] = value;
    }

    return {
        {"request_id", call.request_id},
        {"photo_id", call.photo_id},
        {"photo_url", call.photo_url},
        {"capability", DetectionTypeUtils::capabilityToString(call.capability)},
        {"priority", DetectionTypeUtils::priorityToString(call.priority)},
        {"metadata", metadata},
        {"model_version", model.version},
        {"confidence_threshold", model.confidence_threshold}
    };
}

EngineReply HttpEngineClient::parseReply(const std::string& body, const ModelVersion& model) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw EngineCallError("Malformed engine response: " + std::string(e.what()));
    }

    if (!json.is_object()) {
        throw EngineCallError("Engine response is not a JSON object");
    }

    EngineReply reply;
    try {
        reply.model_version = json.value("model_version", model.version);
        reply.confidence = json.value("confidence", 0.0);
        if (json.contains("results")) {
            reply.results = json.at("results");
        }
    } catch (const nlohmann::json::type_error& e) {
        throw EngineCallError("Engine response has wrong field types: " + std::string(e.what()));
    }

    if (reply.confidence < 0.0 || reply.confidence > 1.0) {
        throw EngineCallError("Engine confidence out of range: " + std::to_string(reply.confidence));
    }
    if (!reply.results.is_object()) {
        throw EngineCallError("Engine results must be a JSON object");
    }

    return reply;
}

} // namespace Sitewatch
