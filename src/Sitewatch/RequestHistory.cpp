// =================================================================
// src/Sitewatch/RequestHistory.cpp
// =================================================================
// Implementation of the recent-request LRU store.

#include "Sitewatch/RequestHistory.hpp"
#include "Sitewatch/Errors.hpp"
#include "Sitewatch/Logger.hpp"

namespace Sitewatch {

RequestHistory::RequestHistory(size_t capacity) : m_capacity(capacity > 0 ? capacity : 1) {}

void RequestHistory::put(const DetectionResponse& response) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(response.request_id);
    if (it != m_index.end()) {
        *it->second = response;
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return;
    }

    m_entries.push_front(response);
    m_index[response.request_id] = m_entries.begin();

    if (m_entries.size() > m_capacity) {
        const std::string& evicted = m_entries.back().request_id;
        Logger::getInstance().debug("RequestHistory", "Evicting request " + evicted);
        m_index.erase(evicted);
        m_entries.pop_back();
    }
}

DetectionResponse RequestHistory::get(const std::string& request_id) {
    auto response = find(request_id);
    if (!response) {
        throw RequestNotFoundError("Request " + request_id + " not found");
    }
    return *response;
}

std::optional<DetectionResponse> RequestHistory::find(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(request_id);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    m_entries.splice(m_entries.begin(), m_entries, it->second);
    return *it->second;
}

std::vector<DetectionResponse> RequestHistory::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<DetectionResponse> responses;
    for (const auto& entry : m_entries) {
        if (responses.size() >= limit) {
            break;
        }
        responses.push_back(entry);
    }
    return responses;
}

size_t RequestHistory::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace Sitewatch
