#include "task_registry.h"
#include <iostream>

namespace droidrun {

bool TaskRegistry::record(const TaskEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.emplace(entry.ticket, entry).second;
}

std::optional<TaskEntry> TaskRegistry::lookup(const std::string& ticket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(ticket);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void TaskRegistry::update_status(const std::string& ticket, TaskStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(ticket);
    if (it == entries_.end()) return;

    TaskEntry& entry = it->second;
    if (is_terminal(entry.last_status) || entry.last_status == status) return;
    entry.last_status = status;
    entry.updated_at = Clock::now();
}

size_t TaskRegistry::mark_overdue(std::chrono::seconds deadline, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t marked = 0;
    for (auto& [ticket, entry] : entries_) {
        if (is_terminal(entry.last_status)) continue;
        if (now - entry.created_at <= deadline) continue;

        entry.last_status = TaskStatus::TIMEOUT;
        entry.updated_at = now;
        ++marked;
        std::cout << "[Registry] Ticket " << ticket << " on worker " << entry.worker_id
                  << " exceeded " << deadline.count() << "s; marked timeout" << std::endl;
    }
    return marked;
}

size_t TaskRegistry::evict(std::chrono::seconds ttl, std::chrono::seconds max_age,
                           Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    auto it = entries_.begin();
    while (it != entries_.end()) {
        const TaskEntry& entry = it->second;
        bool expired = is_terminal(entry.last_status) && now - entry.updated_at > ttl;
        bool too_old = now - entry.created_at > max_age;

        if (expired || too_old) {
            std::cout << "[Registry] Evicting ticket " << it->first << std::endl;
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace droidrun
