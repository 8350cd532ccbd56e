// src/common/event_queue.h
#ifndef LOGWARDEN_EVENT_QUEUE_H
#define LOGWARDEN_EVENT_QUEUE_H

#include <queue>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <atomic>

namespace logwarden {

// ─────────────────────────────────────────────────────────
// Thread-safe queue for the producer/consumer hand-off.
// Detection (producer) pushes decisions here instantly.
// The blocker thread (consumer) drains them separately, so a
// slow firewall never stalls the tailer.
// ─────────────────────────────────────────────────────────
template<typename T>
class EventQueue {
public:
    explicit EventQueue(size_t max_size = 10000) : max_size_(max_size) {}

    // Returns false when the queue is full and the item was dropped
    bool Push(const T& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ || queue_.size() >= max_size_) {
            ++dropped_;
            return false;
        }
        queue_.push(event);
        ++queue_size_;
        cv_.notify_one();
        return true;
    }

    bool Pop(T& event, int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock,
                          std::chrono::milliseconds(timeout_ms),
                          [this] { return !queue_.empty() || stopped_; })) {
            return false;  // Timeout
        }
        if (queue_.empty()) {
            return false;
        }
        event = queue_.front();
        queue_.pop();
        --queue_size_;
        return true;
    }

    void Stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_.notify_all();
    }

    bool Empty() const {
        return queue_size_ == 0;
    }

    size_t Size() const {
        return queue_size_;
    }

    size_t Dropped() const {
        return dropped_;
    }

private:
    size_t max_size_;
    std::queue<T> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    std::atomic<size_t> queue_size_{0};
    std::atomic<size_t> dropped_{0};
};

} // namespace logwarden

#endif // LOGWARDEN_EVENT_QUEUE_H
