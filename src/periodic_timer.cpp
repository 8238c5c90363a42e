#include "periodic_timer.h"

#include <exception>
#include <iostream>

namespace droidrun {

PeriodicTimer::PeriodicTimer(std::chrono::milliseconds interval, Callback callback)
    : interval_(interval), callback_(std::move(callback)) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void PeriodicTimer::start() {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        previous = std::move(thread_);
    }
    // A loop stopped from its own callback exits once the callback returns
    if (previous.joinable()) previous.join();

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&PeriodicTimer::loop, this);
}

void PeriodicTimer::stop() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && !thread_.joinable()) return;
        running_ = false;
        cv_.notify_all();
        // The callback may stop its own timer; that thread is reaped later
        if (thread_.get_id() != std::this_thread::get_id()) {
            finished = std::move(thread_);
        }
    }
    if (finished.joinable()) finished.join();
}

bool PeriodicTimer::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PeriodicTimer::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto next = std::chrono::steady_clock::now() + interval_;
    while (running_) {
        if (cv_.wait_until(lock, next, [this] { return !running_; })) break;
        next += interval_;

        lock.unlock();
        try {
            callback_();
        } catch (const std::exception& e) {
            std::cerr << "[Timer] Callback failed: " << e.what() << std::endl;
        }
        lock.lock();
    }
}

} // namespace droidrun
