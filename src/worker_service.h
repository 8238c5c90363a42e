#pragma once

#include <string>
#include <vector>
#include <chrono>
#include "task.h"
#include "project_config.h"
#include "result_store.h"
#include "task_executor.h"
#include "worker_lock.h"
#include "http_server.h"

namespace droidrun {

// The worker-facing API. accept_task contends only on the worker lock;
// poll_status is a plain store read and never waits on a build.
class WorkerService {
public:
    WorkerService(std::string worker_id, const ProjectTable& projects, ResultStore& store,
                  WorkerLock& lock, TaskExecutor& executor,
                  std::chrono::seconds results_ttl = std::chrono::seconds(RESULTS_TTL_SECONDS));

    // Throws TaskError: BAD_REQUEST for an invalid or reused ticket,
    // PROJECT_MISCONFIGURED for an unknown project, WORKER_BUSY when locked
    TaskAssignment accept_task(const std::string& ticket, const std::string& project,
                               const std::vector<Patch>& patches);

    // Throws TaskError(UNKNOWN_TICKET), or WRONG_WORKER when worker_id is
    // given and is not this worker's
    ResultRecord poll_status(const std::string& ticket, const std::string& worker_id = "") const;

    // Throws TaskError(PROJECT_MISCONFIGURED) when the project or its
    // editor file is missing
    ProjectFile get_project(const std::string& project) const;

    // True while the worker can take a new task
    bool healthy() const { return !lock_.active(); }

    // Drop results older than the TTL; Running records are kept
    size_t collect_garbage();

    const std::string& worker_id() const { return worker_id_; }

    // /rest/v1/task (POST, GET), /rest/v1/project (GET), /health (GET)
    void register_routes(HttpServer& server);

private:
    std::string worker_id_;
    const ProjectTable& projects_;
    ResultStore& store_;
    WorkerLock& lock_;
    TaskExecutor& executor_;
    std::chrono::seconds results_ttl_;

    const ProjectConfig& require_project(const std::string& project) const;
};

} // namespace droidrun
