#pragma once

#include <chrono>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>

namespace droidrun {

// Calls a function every interval on its own thread until stopped.
// start() and stop() return promptly; stop() waits for an in-progress tick.
class PeriodicTimer {
public:
    using Callback = std::function<void()>;

    PeriodicTimer(std::chrono::milliseconds interval, Callback callback);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    // First tick fires one interval after start()
    void start();

    // Safe to call from inside the callback
    void stop();

    bool running() const;

private:
    std::chrono::milliseconds interval_;
    Callback callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::thread thread_;

    void loop();
};

} // namespace droidrun
