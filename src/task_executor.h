#pragma once

#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include "task.h"
#include "worker_lock.h"
#include "result_store.h"
#include "build_runner.h"

namespace droidrun {

enum class SubmitOutcome {
    ACCEPTED,     // Running record written, background unit started
    WORKER_BUSY   // Lock held by another ticket; nothing written
};

// Runs one build/run at a time in the background. submit() returns as soon
// as the Running record is durable; the background unit owns the worker lock
// until it has written the terminal record.
class TaskExecutor {
public:
    TaskExecutor(WorkerLock& lock, ResultStore& store, BuildRunner& runner,
                 std::string workspace_root);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    // Throws TaskError(INTERNAL) if the Running record cannot be written;
    // the lock is released before the exception leaves.
    SubmitOutcome submit(const std::string& ticket, const ProjectConfig& project,
                         const std::vector<Patch>& patches);

    // Block until no background unit is in flight
    void wait_idle();

    bool busy() const;

private:
    WorkerLock& lock_;
    ResultStore& store_;
    BuildRunner& runner_;
    std::string workspace_root_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    int in_flight_ = 0;
    std::thread worker_;

    void run_task(WorkerLock::Guard guard, const std::string& ticket,
                  const ProjectConfig& project, const std::vector<Patch>& patches);
    void write_record(const std::string& ticket, TaskStatus status, const std::string& payload);
    void write_final(const std::string& ticket, const BuildOutcome& outcome);
    void finish_unit();
};

} // namespace droidrun
