#include "client_poller.h"
#include "errors.h"
#include "wire.h"

#include <iostream>

namespace droidrun {

// ----------------------------------------------------------------------------
// HttpTaskApi
// ----------------------------------------------------------------------------

HttpTaskApi::HttpTaskApi(Endpoint balancer, int connect_timeout_ms, int io_timeout_ms)
    : http_(std::move(balancer), connect_timeout_ms, io_timeout_ms) {}

TaskAssignment HttpTaskApi::create_task(const std::string& project,
                                        const std::vector<Patch>& patches,
                                        const std::string& user_id) {
    Json::Value args;
    args["project"] = project;
    args["patches"] = patches_to_json(patches);
    args["userId"] = user_id;

    auto resp = http_.post("/rest/balancer/v1/task", write_json(args));
    return assignment_from_json(unwrap_payload(resp.status_code, resp.body));
}

ResultRecord HttpTaskApi::get_status(const std::string& ticket) {
    Json::Value args;
    args["ticket"] = ticket;

    auto resp = http_.get(get_target("/rest/balancer/v1/task", args));
    return record_from_status_json(ticket, unwrap_payload(resp.status_code, resp.body));
}

ProjectFile HttpTaskApi::get_project(const std::string& project) {
    Json::Value args;
    args["project"] = project;

    auto resp = http_.get(get_target("/rest/balancer/v1/project", args));
    return project_file_from_json(unwrap_payload(resp.status_code, resp.body));
}

// ----------------------------------------------------------------------------
// ClientPoller
// ----------------------------------------------------------------------------

std::string poll_state_to_string(PollState state) {
    switch (state) {
        case PollState::IDLE: return "idle";
        case PollState::SUBMITTING: return "submitting";
        case PollState::RUNNING: return "running";
        case PollState::COMPLETE: return "complete";
        case PollState::FAILED: return "failed";
        case PollState::BUSY: return "busy";
        case PollState::TIMEOUT: return "timeout";
        case PollState::NETWORK_ERROR: return "network_error";
    }
    return "failed";
}

bool is_final(PollState state) {
    return state != PollState::IDLE && state != PollState::SUBMITTING &&
           state != PollState::RUNNING;
}

ClientPoller::ClientPoller(TaskApi& api, PollerOptions options)
    : api_(api), options_(options), timer_(options.interval, [this] { tick(); }) {}

ClientPoller::~ClientPoller() {
    timer_.stop();
}

void ClientPoller::on_change(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

PollState ClientPoller::submit(const std::string& project, const std::vector<Patch>& patches,
                               const std::string& user_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != PollState::IDLE) {
            throw TaskError(ErrorCode::BAD_REQUEST, "Poller already used");
        }
        transport_failures_ = 0;
    }
    transition(PollState::SUBMITTING, "");

    TaskAssignment assignment;
    try {
        assignment = api_.create_task(project, patches, user_id);
    } catch (const TaskError& e) {
        switch (e.code()) {
            case ErrorCode::WORKER_BUSY:
                transition(PollState::BUSY, e.what());
                break;
            case ErrorCode::TRANSPORT_ERROR:
            case ErrorCode::NO_WORKER_AVAILABLE:
                transition(PollState::NETWORK_ERROR, e.what());
                break;
            default:
                transition(PollState::FAILED, e.what());
                break;
        }
        return state();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticket_ = assignment.ticket;
        started_at_ = std::chrono::steady_clock::now();
    }
    std::cout << "[Client] Ticket " << assignment.ticket << " running on worker "
              << assignment.worker_id << std::endl;
    transition(PollState::RUNNING, "");
    timer_.start();
    return PollState::RUNNING;
}

void ClientPoller::tick() {
    std::string ticket;
    std::chrono::steady_clock::time_point started_at;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != PollState::RUNNING) return;
        ticket = ticket_;
        started_at = started_at_;
    }

    if (std::chrono::steady_clock::now() - started_at >= options_.timeout) {
        transition(PollState::TIMEOUT, "");
        return;
    }

    ResultRecord record;
    try {
        record = api_.get_status(ticket);
    } catch (const TaskError& e) {
        if (e.code() != ErrorCode::TRANSPORT_ERROR) {
            transition(PollState::FAILED, e.what());
            return;
        }

        int failures;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failures = ++transport_failures_;
        }
        std::cerr << "[Client] Poll " << failures << " for " << ticket << " failed: "
                  << e.what() << std::endl;
        if (failures >= options_.max_transport_failures) {
            transition(PollState::NETWORK_ERROR, e.what());
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_failures_ = 0;
    }

    switch (record.status) {
        case TaskStatus::COMPLETE:
            transition(PollState::COMPLETE, record.payload);
            break;
        case TaskStatus::ERROR:
            transition(PollState::FAILED, record.payload);
            break;
        case TaskStatus::TIMEOUT:
            transition(PollState::TIMEOUT, record.payload);
            break;
        case TaskStatus::CREATED:
        case TaskStatus::RUNNING:
            transition(PollState::RUNNING, record.payload);
            break;
    }
}

void ClientPoller::transition(PollState state, const std::string& payload) {
    StateCallback callback;
    bool changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_final(state_)) return;
        changed = state_ != state || payload_ != payload;
        state_ = state;
        payload_ = payload;
        callback = callback_;
        if (is_final(state)) final_cv_.notify_all();
    }

    if (is_final(state)) timer_.stop();
    if (changed && callback) callback(state, payload);
}

PollState ClientPoller::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    final_cv_.wait(lock, [this] { return is_final(state_); });
    return state_;
}

bool ClientPoller::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return final_cv_.wait_for(lock, timeout, [this] { return is_final(state_); });
}

void ClientPoller::cancel() {
    timer_.stop();
}

PollState ClientPoller::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ClientPoller::ticket() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticket_;
}

std::string ClientPoller::payload() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return payload_;
}

std::string ClientPoller::describe(PollState state, const std::string& payload) {
    switch (state) {
        case PollState::COMPLETE:
            return "Run complete.";
        case PollState::FAILED:
            return payload.empty() ? "Run failed." : payload;
        case PollState::BUSY:
            return "All workers busy; please try again later.";
        case PollState::TIMEOUT:
            return "Run timed out.";
        case PollState::NETWORK_ERROR:
            return "Error fetching results; please try again.";
        case PollState::IDLE:
        case PollState::SUBMITTING:
        case PollState::RUNNING:
            break;
    }
    return "Running...";
}

} // namespace droidrun
