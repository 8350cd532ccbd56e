// src/daemon/scheduler.cpp
#include "scheduler.h"
#include <iostream>
#include <exception>

namespace logwarden {
namespace daemon {

Scheduler::~Scheduler() {
    Stop();
}

bool Scheduler::AddTask(const std::string& name, std::chrono::milliseconds interval,
                        TaskFunction fn, bool run_immediately) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (running_) {
        std::cerr << "Cannot add task '" << name << "' while the scheduler runs" << std::endl;
        return false;
    }
    if (interval.count() <= 0 || !fn) {
        std::cerr << "Invalid task '" << name << "'" << std::endl;
        return false;
    }
    if (FindTask(name)) {
        std::cerr << "Duplicate task '" << name << "'" << std::endl;
        return false;
    }

    auto task = std::make_unique<Task>();
    task->name = name;
    task->interval = interval;
    task->fn = std::move(fn);
    task->run_immediately = run_immediately;
    tasks_.push_back(std::move(task));
    return true;
}

bool Scheduler::SetInterval(const std::string& name, std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Task* task = FindTask(name);
        if (!task) {
            return false;
        }
        if (task->interval == interval) {
            return true;
        }
        task->interval = interval;
        task->generation++;
    }
    cv_.notify_all();
    return true;
}

void Scheduler::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.exchange(true)) {
        return;
    }

    stopping_ = false;
    for (auto& task : tasks_) {
        task->thread = std::thread(&Scheduler::TaskLoop, this, task.get());
    }

    std::cout << "✓ Scheduler started (" << tasks_.size() << " tasks)" << std::endl;
}

void Scheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& task : tasks_) {
        if (task->thread.joinable()) {
            task->thread.join();
        }
    }

    running_ = false;
}

void Scheduler::TaskLoop(Task* task) {
    if (task->run_immediately) {
        Execute(task);
    }

    auto last_run = std::chrono::steady_clock::now();

    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);

        uint64_t generation = task->generation;
        auto deadline = last_run + task->interval;
        bool woken = cv_.wait_until(lock, deadline, [&] {
            return stopping_ || task->generation != generation;
        });

        if (stopping_) {
            break;
        }
        if (woken) {
            continue;  // Interval changed, recompute the deadline
        }

        lock.unlock();
        Execute(task);
        last_run = std::chrono::steady_clock::now();
    }
}

void Scheduler::Execute(Task* task) {
    try {
        task->fn();
    } catch (const std::exception& e) {
        task->failures++;
        std::cerr << "⚠️  Task '" << task->name << "' failed: " << e.what() << std::endl;
    }
    task->runs++;
}

Scheduler::Task* Scheduler::FindTask(const std::string& name) const {
    for (const auto& task : tasks_) {
        if (task->name == name) {
            return task.get();
        }
    }
    return nullptr;
}

uint64_t Scheduler::RunCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Task* task = FindTask(name);
    return task ? task->runs.load() : 0;
}

uint64_t Scheduler::FailureCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Task* task = FindTask(name);
    return task ? task->failures.load() : 0;
}

} // namespace daemon
} // namespace logwarden
