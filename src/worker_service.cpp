#include "worker_service.h"
#include "errors.h"
#include "wire.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace droidrun {

WorkerService::WorkerService(std::string worker_id, const ProjectTable& projects,
                             ResultStore& store, WorkerLock& lock, TaskExecutor& executor,
                             std::chrono::seconds results_ttl)
    : worker_id_(std::move(worker_id)),
      projects_(projects),
      store_(store),
      lock_(lock),
      executor_(executor),
      results_ttl_(results_ttl) {}

const ProjectConfig& WorkerService::require_project(const std::string& project) const {
    const ProjectConfig* config = projects_.find(project);
    if (!config) {
        throw TaskError(ErrorCode::PROJECT_MISCONFIGURED, "Project " + project + " not configured");
    }
    return *config;
}

TaskAssignment WorkerService::accept_task(const std::string& ticket, const std::string& project,
                                          const std::vector<Patch>& patches) {
    if (!is_valid_ticket(ticket)) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Invalid ticket");
    }
    const ProjectConfig& config = require_project(project);

    if (store_.read(ticket)) {
        throw TaskError(ErrorCode::BAD_REQUEST, "Ticket " + ticket + " already used");
    }

    if (executor_.submit(ticket, config, patches) == SubmitOutcome::WORKER_BUSY) {
        throw TaskError(ErrorCode::WORKER_BUSY, "Worker locked");
    }

    // Old results go on every accepted task; busy refusals skip the scan
    collect_garbage();

    std::cout << "[Worker] Accepted ticket " << ticket << " for project " << project << std::endl;
    return TaskAssignment{ticket, worker_id_};
}

ResultRecord WorkerService::poll_status(const std::string& ticket,
                                        const std::string& worker_id) const {
    if (!worker_id.empty() && worker_id != worker_id_) {
        throw TaskError(ErrorCode::WRONG_WORKER, "Request sent to wrong worker");
    }

    auto record = store_.read(ticket);
    if (!record) {
        throw TaskError(ErrorCode::UNKNOWN_TICKET, "Unknown ticket " + ticket);
    }
    return *record;
}

ProjectFile WorkerService::get_project(const std::string& project) const {
    const ProjectConfig& config = require_project(project);

    fs::path editor_path = fs::path(config.path) / config.editor_file;
    std::ifstream in(editor_path, std::ios::binary);
    if (!in.is_open()) {
        throw TaskError(ErrorCode::PROJECT_MISCONFIGURED,
                        "Editor file for project " + project + " not found");
    }

    ProjectFile file;
    file.filename = (fs::path(config.name) / config.editor_file).generic_string();
    file.project_name = config.name;
    file.contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return file;
}

size_t WorkerService::collect_garbage() {
    auto cutoff = std::chrono::system_clock::now() - results_ttl_;
    size_t removed = store_.collect_garbage(cutoff);
    if (removed > 0) {
        std::cout << "[Worker] Collected " << removed << " expired result(s)" << std::endl;
    }
    return removed;
}

void WorkerService::register_routes(HttpServer& server) {
    // POST /rest/v1/task
    server.route("POST", "/rest/v1/task", [this](const HttpRequest& req) {
        return with_task_errors([&] {
            Json::Value args = request_args(req);
            std::string ticket = require_string(args, "ticket");
            std::string project = require_string(args, "project");
            std::vector<Patch> patches;
            if (!args["patches"].isNull()) patches = patches_from_json(args["patches"]);

            try {
                return json_response(assignment_to_json(accept_task(ticket, project, patches)));
            } catch (const TaskError& e) {
                std::cout << "[Worker] Rejected ticket " << ticket << ": " << e.what() << std::endl;
                throw;
            }
        });
    });

    // GET /rest/v1/task?request={"ticket": ..., "workerId": ...}
    server.route("GET", "/rest/v1/task", [this](const HttpRequest& req) {
        return with_task_errors([&] {
            Json::Value args = request_args(req);
            std::string ticket = require_string(args, "ticket");
            std::string worker_id = args["workerId"].isString() ? args["workerId"].asString() : "";
            return json_response(record_to_status_json(poll_status(ticket, worker_id)));
        });
    });

    // GET /rest/v1/project?request={"project": ...}
    server.route("GET", "/rest/v1/project", [this](const HttpRequest& req) {
        return with_task_errors([&] {
            Json::Value args = request_args(req);
            return json_response(project_file_to_json(get_project(require_string(args, "project"))));
        });
    });

    // GET /health - 500 while a build holds the lock
    server.route("GET", "/health", [this](const HttpRequest&) {
        if (healthy()) {
            return json_response("ok");
        }
        return error_response(ErrorCode::WORKER_BUSY, "Worker locked");
    });
}

} // namespace droidrun
