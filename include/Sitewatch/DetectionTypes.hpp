// =================================================================
// include/Sitewatch/DetectionTypes.hpp
// =================================================================
// Core data model shared by every orchestrator component.

#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Sitewatch {

/**
 * @brief Detection capabilities backed by inference engines
 */
enum class Capability {
    DAMAGE,     ///< Damage presence and severity
    MATERIAL,   ///< Material identification and counts
    VOLUME      ///< Volume estimation
};

/// Number of capability variants, used to size per-capability tables.
constexpr size_t kCapabilityCount = 3;

/**
 * @brief Request priority levels
 */
enum class Priority {
    HIGH,
    NORMAL,
    LOW
};

/**
 * @brief Lifecycle status of a detection request
 */
enum class DetectionStatus {
    QUEUED,
    PROCESSING,
    COMPLETED,
    FAILED,
    PARTIAL
};

/**
 * @brief Circuit breaker states
 */
enum class CircuitBreakerState {
    CLOSED,     ///< Normal operation
    OPEN,       ///< Failing, reject requests
    HALF_OPEN   ///< Testing recovery with a single probe
};

/**
 * @brief A registered model version served by one engine endpoint
 */
struct ModelVersion {
    std::string name;                      ///< Model identifier (e.g. "damage-detector")
    std::string version;                   ///< Version string (e.g. "v1.2.0")
    Capability capability = Capability::DAMAGE; ///< Capability served
    std::string endpoint;                  ///< Base URL of the engine
    double confidence_threshold = 0.75;    ///< Minimum acceptable confidence
    bool enabled = true;                   ///< Whether the version takes traffic
};

/**
 * @brief Health record for one (capability, endpoint) pair
 */
struct EngineHealth {
    Capability capability = Capability::DAMAGE;
    std::string endpoint;
    bool healthy = true;
    std::chrono::system_clock::time_point last_check_time; ///< Zero until first probe
    long last_response_time_ms = 0;
    size_t error_count = 0;
    size_t consecutive_failures = 0;
};

/**
 * @brief A/B experiment between two model versions of one capability
 */
struct ABTestConfig {
    std::string experiment_id;
    ModelVersion model_a;
    ModelVersion model_b;
    double traffic_split = 0.5;            ///< Fraction of traffic routed to model_a
    bool enabled = true;
};

/**
 * @brief Caller-supplied detection request
 */
struct DetectionRequest {
    std::string photo_id;
    std::string photo_url;
    std::vector<Capability> capabilities;
    Priority priority = Priority::NORMAL;
    std::unordered_map<std::string, std::string> metadata;
};

/**
 * @brief Outcome of one capability call
 */
struct EngineResult {
    Capability capability = Capability::DAMAGE;
    std::string model_version;
    std::string endpoint;
    double confidence = 0.0;
    bool meets_threshold = false;
    nlohmann::json result_payload = nlohmann::json::object();
    long processing_time_ms = 0;
    std::optional<std::string> error;
};

/**
 * @brief Aggregated response for one detection request
 */
struct DetectionResponse {
    std::string request_id;
    std::string detection_id;
    std::string photo_id;
    DetectionStatus status = DetectionStatus::QUEUED;
    std::map<Capability, EngineResult> results;
    long total_processing_time_ms = 0;
    std::map<Capability, std::string> model_versions;
    std::string correlation_id;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::string> error;
};

/**
 * @brief Rolling statistics for one capability
 */
struct EngineMetrics {
    size_t total_requests = 0;
    size_t error_count = 0;
    double error_rate = 0.0;
    double avg_confidence = 0.0;
    double avg_latency_ms = 0.0;
    double p50_latency_ms = 0.0;
    double p90_latency_ms = 0.0;
    double p95_latency_ms = 0.0;
    size_t breaker_rejections = 0;   ///< Calls failed fast with NoHealthyEngine, since startup
};

/**
 * @brief Snapshot of orchestrator-wide statistics
 */
struct OrchestratorMetrics {
    size_t total_requests = 0;
    size_t successful_requests = 0;
    size_t failed_requests = 0;
    double avg_latency_ms = 0.0;
    double p50_latency_ms = 0.0;
    double p90_latency_ms = 0.0;
    double p95_latency_ms = 0.0;
    double error_rate = 0.0;
    std::map<Capability, EngineMetrics> engine_metrics;
};

/**
 * @brief Conversions between enums and their wire names
 */
class DetectionTypeUtils {
public:
    static std::string capabilityToString(Capability capability);

    /**
     * @brief Convert a lowercase capability name to the enum
     * @throws std::invalid_argument for unknown names
     */
    static Capability stringToCapability(const std::string& str);

    static const std::array<Capability, kCapabilityCount>& allCapabilities();

    static size_t capabilityIndex(Capability capability);

    static std::string priorityToString(Priority priority);
    static Priority stringToPriority(const std::string& str);

    static std::string statusToString(DetectionStatus status);

    static std::string breakerStateToString(CircuitBreakerState state);

    /**
     * @brief Remove duplicate capabilities while keeping first-seen order
     */
    static std::vector<Capability> deduplicate(const std::vector<Capability>& capabilities);

    /**
     * @brief Generate a random RFC 4122 version 4 identifier
     */
    static std::string generateUuid();

    /**
     * @brief Format a time point as ISO-8601 UTC with millisecond precision
     */
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

} // namespace Sitewatch
