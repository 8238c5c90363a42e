#pragma once

#include <string>
#include <atomic>
#include <mutex>

namespace droidrun {

// Single exclusive slot per worker gating build/run operations.
// try_acquire never blocks; status reads never touch this lock.
class WorkerLock {
public:
    WorkerLock() = default;
    WorkerLock(const WorkerLock&) = delete;
    WorkerLock& operator=(const WorkerLock&) = delete;

    // Returns false immediately if another ticket holds the lock
    bool try_acquire(const std::string& ticket);

    // Must only be called by the current holder, once per successful try_acquire
    void release();

    bool active() const { return held_.load(); }

    // Ticket of the current holder, empty when free
    std::string holder() const;

    // Releases on destruction. Move-only; the background unit owns it.
    class Guard {
    public:
        Guard() = default;
        explicit Guard(WorkerLock& lock) : lock_(&lock) {}
        Guard(Guard&& other) noexcept : lock_(other.lock_) { other.lock_ = nullptr; }
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard() { reset(); }

        void reset();
        bool owns_lock() const { return lock_ != nullptr; }

    private:
        WorkerLock* lock_ = nullptr;
    };

private:
    std::atomic<bool> held_{false};
    mutable std::mutex holder_mutex_;
    std::string holder_;
};

} // namespace droidrun
