// =================================================================
// include/Sitewatch/RequestHistory.hpp
// =================================================================
// Bounded store of recent detection responses.

#pragma once

#include "Sitewatch/DetectionTypes.hpp"
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Sitewatch {

/**
 * @brief LRU cache of responses keyed by request id
 *
 * Lookups refresh recency; inserting past capacity evicts the least
 * recently used response.
 */
class RequestHistory {
public:
    explicit RequestHistory(size_t capacity = 1000);

    virtual ~RequestHistory() = default;

    /**
     * @brief Store or replace a response
     */
    virtual void put(const DetectionResponse& response);

    /**
     * @brief Response for a request id
     * @throws RequestNotFoundError if the id is unknown or was evicted
     */
    virtual DetectionResponse get(const std::string& request_id);

    virtual std::optional<DetectionResponse> find(const std::string& request_id);

    /**
     * @brief Responses from most to least recently used
     */
    virtual std::vector<DetectionResponse> recent(size_t limit) const;

    virtual size_t size() const;
    size_t capacity() const { return m_capacity; }

private:
    size_t m_capacity;
    mutable std::mutex m_mutex;
    std::list<DetectionResponse> m_entries;   ///< Front is most recent
    std::unordered_map<std::string, std::list<DetectionResponse>::iterator> m_index;
};

} // namespace Sitewatch
