#include "balancer.h"
#include "encoding.h"
#include "errors.h"
#include "wire.h"

#include <iostream>

namespace droidrun {

Balancer::Balancer(std::vector<std::unique_ptr<WorkerClient>> workers, TaskRegistry& registry,
                   std::unique_ptr<WorkerSelector> selector, TicketGenerator generate_ticket)
    : workers_(std::move(workers)),
      registry_(registry),
      selector_(std::move(selector)),
      generate_ticket_(std::move(generate_ticket)) {}

std::string Balancer::random_ticket() {
    return Encoding::random_hex(16);
}

WorkerClient* Balancer::find_worker(const std::string& id) const {
    for (const auto& worker : workers_) {
        if (worker->id() == id) return worker.get();
    }
    return nullptr;
}

TaskAssignment Balancer::create_task(const std::string& project,
                                     const std::vector<Patch>& patches,
                                     const std::string& user_id) {
    if (workers_.empty()) {
        throw TaskError(ErrorCode::NO_WORKER_AVAILABLE, "No workers configured");
    }

    bool any_busy = false;
    for (size_t index : selector_->candidates(workers_.size())) {
        WorkerClient& worker = *workers_[index];
        // A ticket is never offered to two workers
        std::string ticket = generate_ticket_();

        try {
            worker.accept_task(ticket, project, patches);
        } catch (const TaskError& e) {
            if (e.code() == ErrorCode::WORKER_BUSY) {
                std::cout << "[Balancer] Worker " << worker.id() << " busy" << std::endl;
                any_busy = true;
                continue;
            }
            if (e.code() == ErrorCode::TRANSPORT_ERROR && !e.request_sent()) {
                std::cerr << "[Balancer] Worker " << worker.id() << " unreachable: "
                          << e.what() << std::endl;
                continue;
            }
            if (e.code() == ErrorCode::TRANSPORT_ERROR) {
                // The worker may hold this ticket already; another offer could
                // start a second build for the same request
                std::cerr << "[Balancer] Ticket " << ticket << " lost in transit to worker "
                          << worker.id() << ": " << e.what() << std::endl;
            }
            throw;
        }

        TaskEntry entry;
        entry.ticket = ticket;
        entry.worker_id = worker.id();
        entry.project = project;
        entry.user_id = user_id;
        entry.last_status = TaskStatus::RUNNING;
        entry.created_at = TaskRegistry::Clock::now();
        entry.updated_at = entry.created_at;
        if (!registry_.record(entry)) {
            throw TaskError(ErrorCode::INTERNAL, "Ticket " + ticket + " issued twice");
        }

        std::cout << "[Balancer] Ticket " << ticket << " (project " << project << ", user "
                  << (user_id.empty() ? "-" : user_id) << ") assigned to worker "
                  << worker.id() << std::endl;
        return TaskAssignment{ticket, worker.id()};
    }

    if (any_busy) {
        throw TaskError(ErrorCode::WORKER_BUSY, "All workers busy");
    }
    throw TaskError(ErrorCode::NO_WORKER_AVAILABLE, "No worker reachable");
}

ResultRecord Balancer::get_status(const std::string& ticket) {
    auto entry = registry_.lookup(ticket);
    if (!entry) {
        throw TaskError(ErrorCode::UNKNOWN_TICKET, "Unknown ticket " + ticket);
    }

    WorkerClient* worker = find_worker(entry->worker_id);
    if (!worker) {
        throw TaskError(ErrorCode::INTERNAL, "Worker " + entry->worker_id + " left the pool");
    }

    ResultRecord record = worker->poll_status(ticket);
    registry_.update_status(ticket, record.status);
    return record;
}

ProjectFile Balancer::get_project(const std::string& project) {
    for (const auto& worker : workers_) {
        try {
            return worker->get_project(project);
        } catch (const TaskError& e) {
            if (e.code() != ErrorCode::TRANSPORT_ERROR) throw;
            std::cerr << "[Balancer] Worker " << worker->id() << " unreachable: "
                      << e.what() << std::endl;
        }
    }
    throw TaskError(ErrorCode::NO_WORKER_AVAILABLE, "No worker reachable");
}

void Balancer::housekeeping(std::chrono::seconds deadline, std::chrono::seconds ttl,
                            std::chrono::seconds max_age) {
    registry_.mark_overdue(deadline);
    size_t evicted = registry_.evict(ttl, max_age);
    if (evicted > 0) {
        std::cout << "[Balancer] Evicted " << evicted << " registry entr"
                  << (evicted == 1 ? "y" : "ies") << "; " << registry_.size() << " left"
                  << std::endl;
    }
}

void Balancer::register_routes(HttpServer& server) {
    // POST /rest/balancer/v1/task
    server.route("POST", "/rest/balancer/v1/task", [this](const HttpRequest& req) {
        return with_task_errors([&] {
            Json::Value args = request_args(req);
            std::string project = require_string(args, "project");
            std::vector<Patch> patches;
            if (!args["patches"].isNull()) patches = patches_from_json(args["patches"]);
            std::string user_id = args["userId"].isString() ? args["userId"].asString() : "";
            return json_response(assignment_to_json(create_task(project, patches, user_id)));
        });
    });

    // GET /rest/balancer/v1/task?request={"ticket": ...}
    server.route("GET", "/rest/balancer/v1/task", [this](const HttpRequest& req) {
        return with_task_errors([&] {
            Json::Value args = request_args(req);
            return json_response(record_to_status_json(get_status(require_string(args, "ticket"))));
        });
    });

    // GET /rest/balancer/v1/project?request={"project": ...}
    server.route("GET", "/rest/balancer/v1/project", [this](const HttpRequest& req) {
        return with_task_errors([&] {
            Json::Value args = request_args(req);
            return json_response(project_file_to_json(get_project(require_string(args, "project"))));
        });
    });
}

} // namespace droidrun
