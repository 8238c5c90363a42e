#pragma once

#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <optional>
#include "task.h"

namespace droidrun {

// Balancer-side row for one ticket. worker_id is set once and never changes.
struct TaskEntry {
    std::string ticket;
    std::string worker_id;
    std::string project;
    std::string user_id;
    TaskStatus last_status = TaskStatus::RUNNING;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point updated_at;
};

// Thread-safe ticket -> TaskEntry table
class TaskRegistry {
public:
    using Clock = std::chrono::steady_clock;

    // Returns false if the ticket is already present (entry left untouched)
    bool record(const TaskEntry& entry);

    std::optional<TaskEntry> lookup(const std::string& ticket) const;

    // Terminal statuses stick: a terminal entry is never moved back
    void update_status(const std::string& ticket, TaskStatus status);

    // Mark entries still Running after deadline as Timeout; returns how many
    size_t mark_overdue(std::chrono::seconds deadline, Clock::time_point now = Clock::now());

    // Remove terminal entries idle longer than ttl and any entry older than
    // max_age; returns how many
    size_t evict(std::chrono::seconds ttl, std::chrono::seconds max_age,
                 Clock::time_point now = Clock::now());

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, TaskEntry> entries_;
};

} // namespace droidrun
