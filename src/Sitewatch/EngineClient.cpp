// =================================================================
// src/Sitewatch/EngineClient.cpp
// =================================================================
// Capability dispatch table for engine clients.

#include "Sitewatch/EngineClient.hpp"
#include "Sitewatch/Errors.hpp"

namespace Sitewatch {

EngineClientTable::EngineClientTable(std::shared_ptr<EngineClient> default_client)
    : m_default(std::move(default_client)) {}

void EngineClientTable::setDefault(std::shared_ptr<EngineClient> client) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_default = std::move(client);
}

void EngineClientTable::set(Capability capability, std::shared_ptr<EngineClient> client) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers[DetectionTypeUtils::capabilityIndex(capability)] = std::move(client);
}

std::shared_ptr<EngineClient> EngineClientTable::forCapability(Capability capability) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& handler = m_handlers[DetectionTypeUtils::capabilityIndex(capability)];
    if (handler) {
        return handler;
    }
    if (m_default) {
        return m_default;
    }
    throw EngineCallError("No engine client configured for capability " +
                          DetectionTypeUtils::capabilityToString(capability));
}

} // namespace Sitewatch
