// =================================================================
// include/Sitewatch/EngineClient.hpp
// =================================================================
// Abstract interface to remote inference engines.

#pragma once

#include "Sitewatch/DetectionTypes.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Sitewatch {

/**
 * @brief Parameters forwarded to an engine for one capability call
 */
struct InferenceCall {
    std::string request_id;
    std::string correlation_id;
    std::string photo_id;
    std::string photo_url;                 ///< Reference only; bytes are never fetched here
    Capability capability = Capability::DAMAGE;
    Priority priority = Priority::NORMAL;
    std::unordered_map<std::string, std::string> metadata;
};

/**
 * @brief Successful engine answer
 */
struct EngineReply {
    std::string model_version;
    double confidence = 0.0;
    nlohmann::json results = nlohmann::json::object();
};

/**
 * @brief Request/response client for inference engine endpoints
 *
 * Implementations must bound every call by the given timeout and report
 * failures by throwing EngineCallError or EngineTimeoutError.
 */
class EngineClient {
public:
    virtual ~EngineClient() = default;

    /**
     * @brief Run inference on the engine serving a model version
     * @param model Selected model version (carries the endpoint)
     * @param call Photo reference and request parameters
     * @param timeout Deadline for the whole call
     * @return Engine reply
     * @throws EngineCallError on transport, status or payload errors
     * @throws EngineTimeoutError when the deadline is exceeded
     */
    virtual EngineReply predict(const ModelVersion& model, const InferenceCall& call,
                                std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Lightweight liveness check
     * @return True if the endpoint answered healthy within the timeout
     */
    virtual bool probe(const ModelVersion& model, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Client identifier for logging
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Capability to engine client dispatch table
 *
 * Shared by the dispatcher and the health monitor. Capabilities without a
 * dedicated handler fall back to the default client.
 */
class EngineClientTable {
public:
    explicit EngineClientTable(std::shared_ptr<EngineClient> default_client = nullptr);

    void setDefault(std::shared_ptr<EngineClient> client);
    void set(Capability capability, std::shared_ptr<EngineClient> client);

    /**
     * @brief Handler for a capability
     * @throws EngineCallError if neither a dedicated nor a default client is set
     */
    std::shared_ptr<EngineClient> forCapability(Capability capability) const;

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<EngineClient> m_default;
    std::array<std::shared_ptr<EngineClient>, kCapabilityCount> m_handlers;
};

} // namespace Sitewatch
