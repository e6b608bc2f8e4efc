// =================================================================
// include/Sitewatch/Errors.hpp
// =================================================================
// Exception taxonomy for orchestrator failures.

#pragma once

#include <stdexcept>
#include <string>

namespace Sitewatch {

/**
 * @brief Base class for all orchestrator errors
 *
 * kind() returns the taxonomy name that prefixes error strings stored in
 * EngineResult, so callers can tell failure classes apart without exceptions.
 */
class OrchestratorError : public std::runtime_error {
public:
    explicit OrchestratorError(const std::string& message)
        : std::runtime_error(message) {}

    virtual std::string kind() const { return "OrchestratorError"; }

    /// "<kind>: <message>"
    std::string describe() const { return kind() + ": " + what(); }
};

/// Every candidate for a capability is circuit-open or disabled.
class NoHealthyEngineError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
    std::string kind() const override { return "NoHealthyEngine"; }
};

/// Transport failure, non-success response or malformed payload.
class EngineCallError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
    std::string kind() const override { return "EngineCallError"; }
};

/// Engine call deadline exceeded.
class EngineTimeoutError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
    std::string kind() const override { return "EngineTimeout"; }
};

/// No version was ever registered for the capability.
class UnknownCapabilityError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
    std::string kind() const override { return "UnknownCapability"; }
};

class RequestNotFoundError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
    std::string kind() const override { return "RequestNotFound"; }
};

/// Invalid or unreadable configuration.
class ConfigError : public OrchestratorError {
public:
    using OrchestratorError::OrchestratorError;
    std::string kind() const override { return "ConfigError"; }
};

} // namespace Sitewatch
