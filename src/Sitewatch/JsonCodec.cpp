// =================================================================
// src/Sitewatch/JsonCodec.cpp
// =================================================================
// Implementation of the JSON codec.

#include "Sitewatch/JsonCodec.hpp"
#include "Sitewatch/Errors.hpp"
#include <stdexcept>

namespace Sitewatch {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

DetectionRequest JsonCodec::requestFromJson(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw OrchestratorError("Request body must be a JSON object");
    }

    DetectionRequest request;
    try {
        request.photo_id = body.at("photo_id").get<std::string>();
        request.photo_url = body.at("photo_url").get<std::string>();

        const char* capability_key = body.contains("capabilities") ? "capabilities" : "detection_types";
        if (body.contains(capability_key)) {
            for (const auto& name : body.at(capability_key)) {
                request.capabilities.push_back(
                    DetectionTypeUtils::stringToCapability(name.get<std::string>()));
            }
        } else {
            request.capabilities = {Capability::DAMAGE, Capability::MATERIAL};
        }

        if (body.contains("priority")) {
            request.priority = DetectionTypeUtils::stringToPriority(body.at("priority").get<std::string>());
        }

        if (body.contains("metadata")) {
            for (const auto& [key, value] : body.at("metadata").items()) {
                request.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw OrchestratorError("Invalid detection request: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw OrchestratorError("Invalid detection request: " + std::string(e.what()));
    }

    return request;
}

nlohmann::json JsonCodec::toJson(const EngineResult& result) {
    return {
        {"capability", DetectionTypeUtils::capabilityToString(result.capability)},
        {"model_version", result.model_version},
        {"endpoint", result.endpoint},
        {"confidence", result.confidence},
        {"meets_threshold", result.meets_threshold},
        {"results", result.result_payload},
        {"processing_time_ms", result.processing_time_ms},
        {"error", optionalString(result.error)}
    };
}

nlohmann::json JsonCodec::toJson(const DetectionResponse& response) {
    nlohmann::json results = nlohmann::json::object();
    for (const auto& [capability, result] : response.results) {
        results[DetectionTypeUtils::capabilityToString(capability)] = toJson(result);
    }

    nlohmann::json model_versions = nlohmann::json::object();
    for (const auto& [capability, version] : response.model_versions) {
        model_versions[DetectionTypeUtils::capabilityToString(capability)] = version;
    }

    return {
        {"request_id", response.request_id},
        {"detection_id", response.detection_id},
        {"photo_id", response.photo_id},
        {"status", DetectionTypeUtils::statusToString(response.status)},
        {"results", results},
        {"processing_time_ms", response.total_processing_time_ms},
        {"model_versions", model_versions},
        {"correlation_id", response.correlation_id},
        {"timestamp", DetectionTypeUtils::formatTimestamp(response.timestamp)},
        {"error", optionalString(response.error)}
    };
}

nlohmann::json JsonCodec::toJson(const EngineMetrics& metrics) {
    return {
        {"total_requests", metrics.total_requests},
        {"error_count", metrics.error_count},
        {"error_rate", metrics.error_rate},
        {"avg_confidence", metrics.avg_confidence},
        {"avg_latency_ms", metrics.avg_latency_ms},
        {"p50_latency_ms", metrics.p50_latency_ms},
        {"p90_latency_ms", metrics.p90_latency_ms},
        {"p95_latency_ms", metrics.p95_latency_ms},
        {"breaker_rejections", metrics.breaker_rejections}
    };
}

nlohmann::json JsonCodec::toJson(const OrchestratorMetrics& metrics) {
    nlohmann::json engines = nlohmann::json::object();
    for (const auto& [capability, engine] : metrics.engine_metrics) {
        engines[DetectionTypeUtils::capabilityToString(capability)] = toJson(engine);
    }

    return {
        {"total_requests", metrics.total_requests},
        {"successful_requests", metrics.successful_requests},
        {"failed_requests", metrics.failed_requests},
        {"avg_processing_time_ms", metrics.avg_latency_ms},
        {"p50_latency_ms", metrics.p50_latency_ms},
        {"p90_latency_ms", metrics.p90_latency_ms},
        {"p95_latency_ms", metrics.p95_latency_ms},
        {"error_rate", metrics.error_rate},
        {"engine_metrics", engines}
    };
}

nlohmann::json JsonCodec::toJson(const HealthSummary& summary) {
    nlohmann::json engines = nlohmann::json::array();
    for (const auto& engine : summary.engines) {
        const EngineHealth& health = engine.health;
        bool checked = health.last_check_time.time_since_epoch().count() != 0;
        engines.push_back({
            {"type", DetectionTypeUtils::capabilityToString(health.capability)},
            {"endpoint", health.endpoint},
            {"healthy", health.healthy},
            {"response_time_ms", health.last_response_time_ms},
            {"error_count", health.error_count},
            {"consecutive_failures", health.consecutive_failures},
            {"circuit_breaker", DetectionTypeUtils::breakerStateToString(engine.breaker_state)},
            {"last_check", checked ? nlohmann::json(DetectionTypeUtils::formatTimestamp(health.last_check_time))
                                   : nlohmann::json(nullptr)}
        });
    }

    return {
        {"status", summary.status},
        {"total_engines", summary.total_engines},
        {"healthy_engines", summary.healthy_engines},
        {"engines", engines}
    };
}

nlohmann::json JsonCodec::toJson(const ModelVersion& model) {
    return {
        {"name", model.name},
        {"version", model.version},
        {"capability", DetectionTypeUtils::capabilityToString(model.capability)},
        {"endpoint", model.endpoint},
        {"confidence_threshold", model.confidence_threshold},
        {"enabled", model.enabled}
    };
}

nlohmann::json JsonCodec::toJson(const ABTestConfig& test) {
    return {
        {"experiment_id", test.experiment_id},
        {"model_a", toJson(test.model_a)},
        {"model_b", toJson(test.model_b)},
        {"traffic_split", test.traffic_split},
        {"enabled", test.enabled}
    };
}

nlohmann::json JsonCodec::toJson(const CircuitBreakerSnapshot& snapshot) {
    return {
        {"endpoint", snapshot.endpoint},
        {"state", DetectionTypeUtils::breakerStateToString(snapshot.state)},
        {"failure_count", snapshot.failure_count},
        {"probe_in_flight", snapshot.probe_in_flight}
    };
}

nlohmann::json JsonCodec::toJson(const std::map<Capability, std::vector<ModelVersion>>& models) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [capability, versions] : models) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& model : versions) {
            list.push_back(toJson(model));
        }
        result[DetectionTypeUtils::capabilityToString(capability)] = list;
    }
    return result;
}

} // namespace Sitewatch
