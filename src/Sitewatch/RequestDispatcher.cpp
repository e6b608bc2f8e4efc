// =================================================================
// src/Sitewatch/RequestDispatcher.cpp
// =================================================================
// Implementation of per-capability fan-out and response assembly.

#include "Sitewatch/RequestDispatcher.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <map>
#include <mutex>

namespace Sitewatch {

namespace {

using Clock = std::chrono::steady_clock;

long millisSince(Clock::time_point start) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start).count());
}

std::string trim(const std::string& value) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

/**
 * @brief Shared bookkeeping for one in-flight request
 *
 * Outlives process() when calls are abandoned at the caller deadline; late
 * tasks still settle into it so their outcomes reach breakers and metrics.
 */
struct RequestDispatcher::RequestState {
    struct Call {
        bool settled = false;
        bool abandoned = false;
        std::optional<ModelVersion> selected;
        std::optional<EngineResult> result;
    };

    std::string request_id;
    std::string correlation_id;
    std::mutex mutex;
    std::condition_variable cv;
    std::map<Capability, Call> calls;
};

RequestDispatcher::RequestDispatcher(LoadBalancer& balancer, CircuitBreakerRegistry& breakers,
                                     EngineClientTable& clients, MetricsCollector& metrics,
                                     RequestHistory& history, const OrchestratorConfig& config)
    : m_balancer(balancer), m_breakers(breakers), m_clients(clients), m_metrics(metrics),
      m_history(history), m_config(config) {
    Logger::getInstance().info("RequestDispatcher", "Initialized with " +
        std::to_string(m_config.engine_timeout.count()) + "ms default engine deadline");
}

RequestDispatcher::~RequestDispatcher() {
    std::lock_guard<std::mutex> lock(m_inflight_mutex);
    collectFinishedLocked(true);
}

void RequestDispatcher::collectFinishedLocked(bool wait) {
    for (auto it = m_inflight.begin(); it != m_inflight.end();) {
        if (!wait && it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }
        try {
            it->get();
        } catch (const std::exception& e) {
            Logger::getInstance().error("RequestDispatcher", "Capability call failed outside its result: " +
                                        std::string(e.what()));
        }
        it = m_inflight.erase(it);
    }
}

DetectionRequest RequestDispatcher::normalize(const DetectionRequest& request) {
    DetectionRequest normalized = request;
    normalized.photo_url = trim(request.photo_url);
    normalized.capabilities = DetectionTypeUtils::deduplicate(request.capabilities);

    if (normalized.photo_url.empty()) {
        throw OrchestratorError("photo_url must not be empty");
    }
    if (normalized.capabilities.empty()) {
        throw OrchestratorError("At least one capability must be requested");
    }
    return normalized;
}

DetectionStatus RequestDispatcher::aggregateStatus(const std::map<Capability, EngineResult>& results) {
    size_t failed = 0;
    for (const auto& [capability, result] : results) {
        if (result.error) {
            failed++;
        }
    }

    if (results.empty() || failed == results.size()) {
        return DetectionStatus::FAILED;
    }
    return failed == 0 ? DetectionStatus::COMPLETED : DetectionStatus::PARTIAL;
}

DetectionResponse RequestDispatcher::process(const DetectionRequest& request,
                                             const std::optional<std::string>& correlation_id,
                                             std::optional<std::chrono::milliseconds> request_timeout) {
    DetectionRequest normalized = normalize(request);
    auto start_time = Clock::now();

    auto state = std::make_shared<RequestState>();
    state->request_id = DetectionTypeUtils::generateUuid();
    state->correlation_id = correlation_id && !correlation_id->empty()
        ? *correlation_id : "orch-" + state->request_id;

    std::chrono::milliseconds caller_budget = request_timeout.value_or(m_config.request_timeout);
    std::optional<Clock::time_point> caller_deadline;
    if (caller_budget.count() > 0) {
        caller_deadline = start_time + caller_budget;
    }

    Logger::getInstance().info("RequestDispatcher", "Dispatching photo " + normalized.photo_id + " to " +
        std::to_string(normalized.capabilities.size()) + " capabilities",
        "request_id=" + state->request_id + " correlation_id=" + state->correlation_id);

    for (Capability capability : normalized.capabilities) {
        state->calls[capability];
    }

    {
        std::lock_guard<std::mutex> lock(m_inflight_mutex);
        collectFinishedLocked(false);

        for (Capability capability : normalized.capabilities) {
            Clock::time_point deadline = start_time + m_config.timeoutFor(capability);
            m_inflight.push_back(std::async(std::launch::async,
                [this, state, capability, normalized, deadline]() {
                    runCall(state, capability, normalized, deadline);
                }));
        }
    }

    std::map<Capability, EngineResult> results;
    {
        std::unique_lock<std::mutex> lock(state->mutex);

        for (Capability capability : normalized.capabilities) {
            auto& call = state->calls[capability];
            Clock::time_point call_deadline = start_time + m_config.timeoutFor(capability);
            Clock::time_point wait_deadline = caller_deadline
                ? std::min(call_deadline, *caller_deadline) : call_deadline;

            bool done = state->cv.wait_until(lock, wait_deadline, [&call] { return call.settled; });

            if (!done && wait_deadline == call_deadline) {
                EngineResult timeout;
                timeout.capability = capability;
                if (call.selected) {
                    timeout.model_version = call.selected->version;
                    timeout.endpoint = call.selected->endpoint;
                }
                timeout.processing_time_ms = static_cast<long>(m_config.timeoutFor(capability).count());
                timeout.error = EngineTimeoutError(DetectionTypeUtils::capabilityToString(capability) +
                    " call exceeded " + std::to_string(m_config.timeoutFor(capability).count()) +
                    "ms deadline").describe();
                settleLocked(*state, capability, timeout, call.selected.has_value());
            } else if (!done) {
                call.abandoned = true;
                EngineResult abandoned;
                abandoned.capability = capability;
                if (call.selected) {
                    abandoned.model_version = call.selected->version;
                    abandoned.endpoint = call.selected->endpoint;
                }
                abandoned.processing_time_ms = millisSince(start_time);
                abandoned.error = EngineTimeoutError("Request deadline of " +
                    std::to_string(caller_budget.count()) + "ms exceeded before " +
                    DetectionTypeUtils::capabilityToString(capability) + " completed").describe();
                results[capability] = abandoned;
                continue;
            }

            results[capability] = *call.result;
        }
    }

    DetectionResponse response;
    response.request_id = state->request_id;
    response.detection_id = DetectionTypeUtils::generateUuid();
    response.photo_id = normalized.photo_id;
    response.correlation_id = state->correlation_id;
    response.results = results;
    response.status = aggregateStatus(results);
    for (const auto& [capability, result] : results) {
        if (!result.model_version.empty()) {
            response.model_versions[capability] = result.model_version;
        }
    }
    if (response.status == DetectionStatus::FAILED) {
        response.error = "All detection engines failed";
    }
    response.timestamp = std::chrono::system_clock::now();
    response.total_processing_time_ms = millisSince(start_time);

    m_metrics.recordRequest(response.status, static_cast<double>(response.total_processing_time_ms));
    m_history.put(response);
    Logger::getInstance().logRequestSummary(response.request_id, response.status,
                                            response.total_processing_time_ms, results.size());

    return response;
}

void RequestDispatcher::runCall(const std::shared_ptr<RequestState>& state, Capability capability,
                                const DetectionRequest& request, Clock::time_point deadline) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        const auto& call = state->calls[capability];
        if (call.settled || call.abandoned) {
            return;
        }
    }

    auto call_start = Clock::now();
    EngineResult result;
    result.capability = capability;
    bool remote_call = false;

    try {
        auto client = m_clients.forCapability(capability);
        EngineSelection selection = m_balancer.select(capability, request);
        result.model_version = selection.model.version;
        result.endpoint = selection.model.endpoint;

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto& call = state->calls[capability];
            if (call.settled) {
                // Timed out while selecting; the admitted call still counts as failed.
                m_breakers.forEndpoint(selection.model.endpoint)->recordFailure();
                m_metrics.recordEngineCall(capability, false, static_cast<double>(millisSince(call_start)));
                return;
            }
            call.selected = selection.model;
        }

        remote_call = true;

        InferenceCall inference;
        inference.request_id = state->request_id;
        inference.correlation_id = state->correlation_id;
        inference.photo_id = request.photo_id;
        inference.photo_url = request.photo_url;
        inference.capability = capability;
        inference.priority = request.priority;
        inference.metadata = request.metadata;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() < 1) {
            remaining = std::chrono::milliseconds(1);
        }

        EngineReply reply = client->predict(selection.model, inference, remaining);
        if (!reply.model_version.empty()) {
            result.model_version = reply.model_version;
        }
        result.confidence = reply.confidence;
        result.meets_threshold = reply.confidence >= selection.model.confidence_threshold;
        result.result_payload = reply.results;
    } catch (const NoHealthyEngineError& e) {
        m_metrics.recordBreakerRejection(capability);
        result.error = e.describe();
    } catch (const OrchestratorError& e) {
        result.error = e.describe();
    } catch (const std::exception& e) {
        result.error = EngineCallError(e.what()).describe();
    }

    result.processing_time_ms = millisSince(call_start);

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->calls[capability].settled) {
        Logger::getInstance().debug("RequestDispatcher", "Discarding late " +
            DetectionTypeUtils::capabilityToString(capability) + " result", "request_id=" + state->request_id);
        return;
    }
    settleLocked(*state, capability, result, remote_call);
    state->cv.notify_all();
}

void RequestDispatcher::settleLocked(RequestState& state, Capability capability, EngineResult result,
                                     bool remote_call) {
    auto& call = state.calls[capability];
    call.settled = true;

    bool success = !result.error.has_value();
    if (remote_call && !result.endpoint.empty()) {
        auto breaker = m_breakers.forEndpoint(result.endpoint);
        if (success) {
            breaker->recordSuccess();
        } else {
            breaker->recordFailure();
        }
        m_metrics.recordEngineCall(capability, success, static_cast<double>(result.processing_time_ms),
                                   result.confidence);
    }

    Logger::getInstance().logEngineCall(capability, result.endpoint, result.processing_time_ms, success,
                                        success ? result.model_version : result.error.value_or(""));

    call.result = std::move(result);
}

} // namespace Sitewatch
