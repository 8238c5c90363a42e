#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <functional>
#include "task.h"
#include "http_client.h"
#include "periodic_timer.h"

namespace droidrun {

// What a client can ask of the balancer. Calls throw TaskError.
class TaskApi {
public:
    virtual ~TaskApi() = default;

    virtual TaskAssignment create_task(const std::string& project,
                                       const std::vector<Patch>& patches,
                                       const std::string& user_id) = 0;
    virtual ResultRecord get_status(const std::string& ticket) = 0;
    virtual ProjectFile get_project(const std::string& project) = 0;
};

// The balancer's /rest/balancer/v1 routes over HTTP
class HttpTaskApi : public TaskApi {
public:
    explicit HttpTaskApi(Endpoint balancer,
                         int connect_timeout_ms = WORKER_CONNECT_TIMEOUT_MS,
                         int io_timeout_ms = WORKER_IO_TIMEOUT_MS);

    TaskAssignment create_task(const std::string& project, const std::vector<Patch>& patches,
                               const std::string& user_id) override;
    ResultRecord get_status(const std::string& ticket) override;
    ProjectFile get_project(const std::string& project) override;

private:
    HttpClient http_;
};

enum class PollState {
    IDLE,
    SUBMITTING,
    RUNNING,
    COMPLETE,
    FAILED,         // Task ended in Error, or the request was refused
    BUSY,           // Create rejected with worker_locked
    TIMEOUT,        // Gave up locally, or the worker reported timeout
    NETWORK_ERROR   // Too many consecutive transport failures
};

std::string poll_state_to_string(PollState state);
bool is_final(PollState state);

struct PollerOptions {
    std::chrono::milliseconds interval{CLIENT_POLL_INTERVAL_MS};
    std::chrono::milliseconds timeout{CLIENT_POLL_TIMEOUT_SECONDS * 1000};
    int max_transport_failures = CLIENT_MAX_TRANSPORT_FAILURES;
};

// Submits one task and polls it on a PeriodicTimer until it reaches a
// terminal status or the local deadline passes. The local Timeout is not
// sent anywhere; the worker keeps running.
class ClientPoller {
public:
    using StateCallback = std::function<void(PollState state, const std::string& payload)>;

    explicit ClientPoller(TaskApi& api, PollerOptions options = PollerOptions());
    ~ClientPoller();

    ClientPoller(const ClientPoller&) = delete;
    ClientPoller& operator=(const ClientPoller&) = delete;

    // Called on every state change, from the submitting or timer thread
    void on_change(StateCallback callback);

    // Creates the task and, if accepted, starts polling. Returns the state
    // after the create call: RUNNING, BUSY, FAILED or NETWORK_ERROR.
    PollState submit(const std::string& project, const std::vector<Patch>& patches,
                     const std::string& user_id);

    // Blocks until a final state
    PollState wait();

    // false if still not final after timeout
    bool wait_for(std::chrono::milliseconds timeout);

    // Stops polling; the state stays as it was
    void cancel();

    PollState state() const;
    std::string ticket() const;
    std::string payload() const;

    // One-line text shown to the user for a final state
    static std::string describe(PollState state, const std::string& payload);

private:
    TaskApi& api_;
    PollerOptions options_;
    PeriodicTimer timer_;

    mutable std::mutex mutex_;
    std::condition_variable final_cv_;
    PollState state_ = PollState::IDLE;
    std::string ticket_;
    std::string payload_;
    int transport_failures_ = 0;
    std::chrono::steady_clock::time_point started_at_;
    StateCallback callback_;

    void tick();
    void transition(PollState state, const std::string& payload);
};

} // namespace droidrun
