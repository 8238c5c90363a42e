#include "worker_lock.h"
#include <iostream>

namespace droidrun {

bool WorkerLock::try_acquire(const std::string& ticket) {
    bool expected = false;
    if (!held_.compare_exchange_strong(expected, true)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(holder_mutex_);
        holder_ = ticket;
    }
    std::cout << "[WorkerLock] Acquired execution lock with ticket " << ticket << std::endl;
    return true;
}

void WorkerLock::release() {
    std::string ticket;
    {
        std::lock_guard<std::mutex> lock(holder_mutex_);
        ticket.swap(holder_);
    }

    if (!held_.exchange(false)) {
        std::cerr << "[WorkerLock] Release called while lock not held" << std::endl;
        return;
    }
    std::cout << "[WorkerLock] Released execution lock with ticket " << ticket << std::endl;
}

std::string WorkerLock::holder() const {
    std::lock_guard<std::mutex> lock(holder_mutex_);
    return holder_;
}

WorkerLock::Guard& WorkerLock::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        reset();
        lock_ = other.lock_;
        other.lock_ = nullptr;
    }
    return *this;
}

void WorkerLock::Guard::reset() {
    if (lock_) {
        lock_->release();
        lock_ = nullptr;
    }
}

} // namespace droidrun
