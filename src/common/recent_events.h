// src/common/recent_events.h
#ifndef LOGWARDEN_RECENT_EVENTS_H
#define LOGWARDEN_RECENT_EVENTS_H

#include <logwarden/types.h>
#include <nlohmann/json.hpp>
#include <deque>
#include <vector>
#include <mutex>

namespace logwarden {

/**
 * Bounded FIFO of the most recently parsed request events.
 * Oldest entries are evicted once capacity is reached.
 */
class RecentEvents {
public:
    explicit RecentEvents(size_t capacity = 1000);

    void Add(const RequestEvent& event);

    // Up to `limit` most recent events, oldest first. 0 means all.
    std::vector<RequestEvent> Latest(size_t limit = 0) const;

    size_t Size() const;
    size_t Capacity() const;
    void SetCapacity(size_t capacity);

    static nlohmann::json ToJson(const RequestEvent& event);

private:
    mutable std::mutex mutex_;
    std::deque<RequestEvent> events_;
    size_t capacity_;
};

} // namespace logwarden

#endif // LOGWARDEN_RECENT_EVENTS_H
