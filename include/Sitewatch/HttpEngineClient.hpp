// =================================================================
// include/Sitewatch/HttpEngineClient.hpp
// =================================================================
// HTTP/JSON client for inference engines.

#pragma once

#include "Sitewatch/EngineClient.hpp"
#include <string>

namespace Sitewatch {

/**
 * @brief Talks to engines over HTTP
 *
 * Inference is `POST {endpoint}/predict` with a JSON body; liveness is
 * `GET {endpoint}/health`. Stateless, so one instance serves every endpoint
 * and concurrent calls.
 */
class HttpEngineClient : public EngineClient {
public:
    HttpEngineClient(const std::string& predict_path = "/predict",
                     const std::string& health_path = "/health");

    EngineReply predict(const ModelVersion& model, const InferenceCall& call,
                        std::chrono::milliseconds timeout) override;
    bool probe(const ModelVersion& model, std::chrono::milliseconds timeout) override;
    std::string getName() const override;

    /**
     * @brief Build the JSON body sent to /predict
     */
    static nlohmann::json buildRequestBody(const ModelVersion& model, const InferenceCall& call);

    /**
     * @brief Parse an engine response body
     * @param body Raw response body
     * @param model Model version used for defaults
     * @throws EngineCallError if the body is not a valid reply
     */
    static EngineReply parseReply(const std::string& body, const ModelVersion& model);

private:
    std::string m_predict_path;
    std::string m_health_path;
};

} // namespace Sitewatch
