#include "task_executor.h"
#include "errors.h"
#include "workspace.h"

#include <iostream>
#include <system_error>

namespace droidrun {

TaskExecutor::TaskExecutor(WorkerLock& lock, ResultStore& store, BuildRunner& runner,
                           std::string workspace_root)
    : lock_(lock), store_(store), runner_(runner), workspace_root_(std::move(workspace_root)) {}

TaskExecutor::~TaskExecutor() {
    wait_idle();
    if (worker_.joinable()) worker_.join();
}

SubmitOutcome TaskExecutor::submit(const std::string& ticket, const ProjectConfig& project,
                                   const std::vector<Patch>& patches) {
    if (!lock_.try_acquire(ticket)) {
        std::cout << "[Executor] Rejected ticket " << ticket << ": worker locked by "
                  << lock_.holder() << std::endl;
        return SubmitOutcome::WORKER_BUSY;
    }
    WorkerLock::Guard guard(lock_);

    // Durable before the caller hears "accepted"; a throw here releases the lock
    write_record(ticket, TaskStatus::RUNNING, "Staging");

    // The previous unit released the lock as its last step; reap its thread
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(worker_);
        ++in_flight_;
    }
    if (previous.joinable()) previous.join();

    try {
        std::thread unit([this, guard = std::move(guard), ticket, project, patches]() mutable {
            run_task(std::move(guard), ticket, project, patches);
        });
        std::lock_guard<std::mutex> lock(mutex_);
        worker_ = std::move(unit);
    } catch (const std::system_error& e) {
        std::cerr << "[Executor] Unable to start task " << ticket << ": " << e.what() << std::endl;
        write_final(ticket, BuildOutcome{TaskStatus::ERROR, "Unable to start task"});
        finish_unit();
        throw TaskError(ErrorCode::INTERNAL, "Unable to start task");
    }

    std::cout << "[Executor] Accepted ticket " << ticket << " for project " << project.name
              << " (" << patches.size() << " patch(es))" << std::endl;
    return SubmitOutcome::ACCEPTED;
}

void TaskExecutor::run_task(WorkerLock::Guard guard, const std::string& ticket,
                            const ProjectConfig& project, const std::vector<Patch>& patches) {
    auto start = std::chrono::steady_clock::now();
    BuildOutcome outcome;

    try {
        StagedProject staged(project, workspace_root_, ticket);
        staged.apply_patches(patches);
        outcome = runner_.build_and_run(project, staged.path().string(),
            [this, &ticket](const std::string& phase) {
                try {
                    write_record(ticket, TaskStatus::RUNNING, phase);
                } catch (const std::exception& e) {
                    std::cerr << "[Executor] Unable to record progress for " << ticket
                              << ": " << e.what() << std::endl;
                }
            });
    } catch (const TaskError& e) {
        std::cerr << "[Executor] Task " << ticket << " failed: " << e.what() << std::endl;
        outcome = BuildOutcome{TaskStatus::ERROR, e.what()};
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Task " << ticket << " failed: " << e.what() << std::endl;
        outcome = BuildOutcome{TaskStatus::ERROR, std::string("Internal error: ") + e.what()};
    } catch (...) {
        std::cerr << "[Executor] Task " << ticket << " failed with unknown exception" << std::endl;
        outcome = BuildOutcome{TaskStatus::ERROR, "Internal error"};
    }

    if (!is_terminal(outcome.status)) {
        outcome = BuildOutcome{TaskStatus::ERROR, "Build runner returned a non-terminal status"};
    }

    write_final(ticket, outcome);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "[Executor] Task " << ticket << " finished with status "
              << task_status_to_string(outcome.status) << " in " << elapsed.count() << "ms"
              << std::endl;

    // Last action of the unit
    guard.reset();
    finish_unit();
}

void TaskExecutor::write_record(const std::string& ticket, TaskStatus status,
                                const std::string& payload) {
    ResultRecord record;
    record.ticket = ticket;
    record.status = status;
    record.payload = payload;
    record.written_at = std::chrono::system_clock::now();
    store_.write(record);
}

void TaskExecutor::write_final(const std::string& ticket, const BuildOutcome& outcome) {
    try {
        write_record(ticket, outcome.status, outcome.payload);
        return;
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Unable to write result for " << ticket << ": " << e.what()
                  << std::endl;
    }

    // A Running record left behind would never be collected
    try {
        write_record(ticket, TaskStatus::ERROR, "Unable to store result");
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Unable to write error record for " << ticket << ": "
                  << e.what() << "; erasing" << std::endl;
        store_.erase(ticket);
    }
}

void TaskExecutor::finish_unit() {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    idle_cv_.notify_all();
}

void TaskExecutor::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

bool TaskExecutor::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_ > 0;
}

} // namespace droidrun
