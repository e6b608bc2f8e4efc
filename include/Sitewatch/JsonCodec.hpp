// =================================================================
// include/Sitewatch/JsonCodec.hpp
// =================================================================
// JSON representations of orchestrator requests, responses and reports.

#pragma once

#include "Sitewatch/CircuitBreaker.hpp"
#include "Sitewatch/DetectionTypes.hpp"
#include "Sitewatch/HealthMonitor.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <vector>

namespace Sitewatch {

/**
 * @brief Converts orchestrator types to and from the API's JSON shapes
 */
class JsonCodec {
public:
    /**
     * @brief Build a detection request from an API body
     *
     * Accepts "capabilities" or "detection_types"; both absent means
     * damage and material. Non-string metadata values are kept as JSON text.
     * @throws OrchestratorError for missing fields or unknown names
     */
    static DetectionRequest requestFromJson(const nlohmann::json& body);

    static nlohmann::json toJson(const EngineResult& result);
    static nlohmann::json toJson(const DetectionResponse& response);
    static nlohmann::json toJson(const OrchestratorMetrics& metrics);
    static nlohmann::json toJson(const EngineMetrics& metrics);
    static nlohmann::json toJson(const HealthSummary& summary);
    static nlohmann::json toJson(const ModelVersion& model);
    static nlohmann::json toJson(const ABTestConfig& test);
    static nlohmann::json toJson(const CircuitBreakerSnapshot& snapshot);
    static nlohmann::json toJson(const std::map<Capability, std::vector<ModelVersion>>& models);
};

} // namespace Sitewatch
