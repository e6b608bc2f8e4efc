// =================================================================
// src/Sitewatch/DetectionTypes.cpp
// =================================================================
// Implementation of data model utilities.

#include "Sitewatch/DetectionTypes.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace Sitewatch {

std::string DetectionTypeUtils::capabilityToString(Capability capability) {
    switch (capability) {
        case Capability::DAMAGE:
            return "damage";
        case Capability::MATERIAL:
            return "material";
        case Capability::VOLUME:
            return "volume";
        default:
            throw std::invalid_argument("Unknown Capability value");
    }
}

Capability DetectionTypeUtils::stringToCapability(const std::string& str) {
    static const std::unordered_map<std::string, Capability> capability_map = {
        {"damage", Capability::DAMAGE},
        {"material", Capability::MATERIAL},
        {"volume", Capability::VOLUME}
    };

    auto it = capability_map.find(str);
    if (it != capability_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown capability string: " + str);
}

const std::array<Capability, kCapabilityCount>& DetectionTypeUtils::allCapabilities() {
    static const std::array<Capability, kCapabilityCount> all = {
        Capability::DAMAGE,
        Capability::MATERIAL,
        Capability::VOLUME
    };
    return all;
}

size_t DetectionTypeUtils::capabilityIndex(Capability capability) {
    return static_cast<size_t>(capability);
}

std::string DetectionTypeUtils::priorityToString(Priority priority) {
    switch (priority) {
        case Priority::HIGH: return "high";
        case Priority::NORMAL: return "normal";
        case Priority::LOW: return "low";
        default:
            throw std::invalid_argument("Unknown Priority value");
    }
}

Priority DetectionTypeUtils::stringToPriority(const std::string& str) {
    if (str == "high") return Priority::HIGH;
    if (str == "normal") return Priority::NORMAL;
    if (str == "low") return Priority::LOW;
    throw std::invalid_argument("Unknown priority string: " + str);
}

std::string DetectionTypeUtils::statusToString(DetectionStatus status) {
    switch (status) {
        case DetectionStatus::QUEUED: return "queued";
        case DetectionStatus::PROCESSING: return "processing";
        case DetectionStatus::COMPLETED: return "completed";
        case DetectionStatus::FAILED: return "failed";
        case DetectionStatus::PARTIAL: return "partial";
        default:
            throw std::invalid_argument("Unknown DetectionStatus value");
    }
}

std::string DetectionTypeUtils::breakerStateToString(CircuitBreakerState state) {
    switch (state) {
        case CircuitBreakerState::CLOSED: return "closed";
        case CircuitBreakerState::OPEN: return "open";
        case CircuitBreakerState::HALF_OPEN: return "half_open";
        default:
            throw std::invalid_argument("Unknown CircuitBreakerState value");
    }
}

std::vector<Capability> DetectionTypeUtils::deduplicate(const std::vector<Capability>& capabilities) {
    std::vector<Capability> result;
    result.reserve(capabilities.size());

    for (const auto& capability : capabilities) {
        if (std::find(result.begin(), result.end(), capability) == result.end()) {
            result.push_back(capability);
        }
    }

    return result;
}

std::string DetectionTypeUtils::generateUuid() {
    static std::mutex gen_mutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high;
    uint64_t low;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        high = dis(gen);
        low = dis(gen);
    }

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << "-"
        << std::setw(4) << ((high >> 16) & 0xFFFF) << "-"
        << std::setw(4) << (high & 0xFFFF) << "-"
        << std::setw(4) << (low >> 48) << "-"
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string DetectionTypeUtils::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    return oss.str();
}

} // namespace Sitewatch
