// src/common/recent_events.cpp
#include "recent_events.h"

namespace logwarden {

RecentEvents::RecentEvents(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void RecentEvents::Add(const RequestEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

std::vector<RequestEvent> RecentEvents::Latest(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = events_.size();
    if (limit > 0 && limit < count) {
        count = limit;
    }

    return std::vector<RequestEvent>(events_.end() - count, events_.end());
}

size_t RecentEvents::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

size_t RecentEvents::Capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

void RecentEvents::SetCapacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity == 0 ? 1 : capacity;
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

nlohmann::json RecentEvents::ToJson(const RequestEvent& event) {
    nlohmann::json j;
    j["ip"] = event.ip;
    j["path"] = event.path;
    j["status"] = event.status;
    j["timestamp"] = ToEpochMillis(event.timestamp);
    j["source"] = event.source;
    if (!event.method.empty()) {
        j["method"] = event.method;
    }
    if (!event.user_agent.empty()) {
        j["userAgent"] = event.user_agent;
    }
    return j;
}

} // namespace logwarden
