// src/daemon/scheduler.h
#ifndef LOGWARDEN_SCHEDULER_H
#define LOGWARDEN_SCHEDULER_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace logwarden {
namespace daemon {

/**
 * Fixed-interval task scheduler
 *
 * Every task runs on its own thread, so a task never overlaps itself
 * and a slow task never delays the others. A task that throws is
 * logged and runs again at its next interval.
 */
class Scheduler {
public:
    using TaskFunction = std::function<void()>;

    Scheduler() = default;
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Register a task before Start(). Fails on a duplicate name or a
     * non-positive interval.
     */
    bool AddTask(const std::string& name, std::chrono::milliseconds interval,
                 TaskFunction fn, bool run_immediately = false);

    /**
     * Change a task's interval while running; the wait restarts from
     * the task's last run.
     */
    bool SetInterval(const std::string& name, std::chrono::milliseconds interval);

    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }

    uint64_t RunCount(const std::string& name) const;
    uint64_t FailureCount(const std::string& name) const;

private:
    struct Task {
        std::string name;
        std::chrono::milliseconds interval;
        TaskFunction fn;
        bool run_immediately = false;
        uint64_t generation = 0;    // bumped on interval change
        std::thread thread;
        std::atomic<uint64_t> runs{0};
        std::atomic<uint64_t> failures{0};
    };

    std::vector<std::unique_ptr<Task>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<bool> running_{false};

    void TaskLoop(Task* task);
    void Execute(Task* task);
    Task* FindTask(const std::string& name) const;
};

} // namespace daemon
} // namespace logwarden

#endif // LOGWARDEN_SCHEDULER_H
