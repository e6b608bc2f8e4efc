// =================================================================
// src/Sitewatch/DetectionOrchestrator.cpp
// =================================================================
// Implementation of the detection orchestrator facade.

#include "Sitewatch/DetectionOrchestrator.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/HttpEngineClient.hpp"
#include "Sitewatch/Logger.hpp"

namespace Sitewatch {

namespace {

CircuitBreakerConfig breakerConfigFrom(const OrchestratorConfig& config) {
    CircuitBreakerConfig breaker;
    breaker.failure_threshold = config.circuit_breaker_threshold;
    breaker.recovery_timeout = config.circuit_breaker_timeout;
    return breaker;
}

} // namespace

DetectionOrchestrator::DetectionOrchestrator(const ApplicationConfig& config,
                                             std::shared_ptr<EngineClient> default_client,
                                             SteadyClock clock)
    : m_config(config) {

    if (!default_client) {
        default_client = std::make_shared<HttpEngineClient>();
    }

    const OrchestratorConfig& orchestrator = m_config.orchestrator;

    m_registry = std::make_unique<ModelRegistry>();
    m_breakers = std::make_unique<CircuitBreakerRegistry>(breakerConfigFrom(orchestrator), std::move(clock));
    m_clients = std::make_unique<EngineClientTable>(default_client);
    m_health = std::make_unique<HealthMonitor>(*m_registry, *m_breakers, *m_clients, orchestrator);
    m_balancer = std::make_unique<LoadBalancer>(*m_registry, *m_breakers, *m_health, orchestrator);
    m_metrics = std::make_unique<MetricsCollector>(orchestrator.metrics_window);
    m_history = std::make_unique<RequestHistory>(orchestrator.history_capacity);
    m_dispatcher = std::make_unique<RequestDispatcher>(*m_balancer, *m_breakers, *m_clients,
                                                       *m_metrics, *m_history, orchestrator);

    m_registry_status = m_registry->loadFromConfig(m_config);

    Logger::getInstance().info("DetectionOrchestrator", "Initialized with " +
        std::to_string(m_registry_status.enabled_versions) + " enabled model versions (" +
        std::to_string(m_registry_status.failed_to_load) + " configuration entries rejected)",
        "client=" + default_client->getName());
}

DetectionOrchestrator::~DetectionOrchestrator() {
    m_health->stop();
}

DetectionResponse DetectionOrchestrator::submit(const DetectionRequest& request,
                                                const std::optional<std::string>& correlation_id,
                                                std::optional<std::chrono::milliseconds> request_timeout) {
    return m_dispatcher->process(request, correlation_id, request_timeout);
}

DetectionResponse DetectionOrchestrator::getStatus(const std::string& request_id) {
    return m_history->get(request_id);
}

std::map<Capability, std::vector<EngineHealth>> DetectionOrchestrator::getHealth() const {
    return m_health->getHealth();
}

HealthSummary DetectionOrchestrator::getHealthSummary() const {
    return m_health->summary();
}

OrchestratorMetrics DetectionOrchestrator::getMetrics() const {
    return m_metrics->snapshot();
}

std::map<Capability, std::vector<ModelVersion>> DetectionOrchestrator::listModels() const {
    return m_registry->listModels();
}

std::vector<CircuitBreakerSnapshot> DetectionOrchestrator::getBreakerStates() const {
    return m_breakers->snapshot();
}

void DetectionOrchestrator::registerModel(const ModelVersion& model) {
    m_registry->registerModel(model);
}

void DetectionOrchestrator::createABTest(const ABTestSpec& spec) {
    auto model_a = m_registry->find(spec.model_a_name, spec.model_a_version);
    auto model_b = m_registry->find(spec.model_b_name, spec.model_b_version);
    if (!model_a) {
        throw OrchestratorError("Unknown model version " + spec.model_a_name + "@" + spec.model_a_version);
    }
    if (!model_b) {
        throw OrchestratorError("Unknown model version " + spec.model_b_name + "@" + spec.model_b_version);
    }

    ABTestConfig test;
    test.experiment_id = spec.experiment_id;
    test.model_a = *model_a;
    test.model_b = *model_b;
    test.traffic_split = spec.traffic_split;
    test.enabled = spec.enabled;
    m_registry->createABTest(test);
}

bool DetectionOrchestrator::removeABTest(const std::string& experiment_id) {
    return m_registry->removeABTest(experiment_id);
}

std::vector<ABTestConfig> DetectionOrchestrator::listABTests() const {
    return m_registry->listABTests();
}

void DetectionOrchestrator::setEngineClient(Capability capability, std::shared_ptr<EngineClient> client) {
    m_clients->set(capability, std::move(client));
}

void DetectionOrchestrator::startHealthMonitor() {
    m_health->start();
}

void DetectionOrchestrator::stopHealthMonitor() {
    m_health->stop();
}

size_t DetectionOrchestrator::runHealthCheck() {
    return m_health->runOnce();
}

} // namespace Sitewatch
