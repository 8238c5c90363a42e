#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include "task.h"
#include "task_registry.h"
#include "worker_client.h"
#include "worker_selector.h"
#include "http_server.h"

namespace droidrun {

// Client-facing service: assigns each new task to one worker, then relays
// status polls to that worker. Never queues; a busy pool fails fast.
class Balancer {
public:
    using TicketGenerator = std::function<std::string()>;

    Balancer(std::vector<std::unique_ptr<WorkerClient>> workers, TaskRegistry& registry,
             std::unique_ptr<WorkerSelector> selector = std::make_unique<RoundRobinSelector>(),
             TicketGenerator generate_ticket = random_ticket);

    // Throws TaskError: WORKER_BUSY when every reachable worker is locked,
    // NO_WORKER_AVAILABLE when none could be reached, TRANSPORT_ERROR when a
    // worker got the request but its answer was lost (not retried elsewhere),
    // or the worker's own rejection (BAD_REQUEST, PROJECT_MISCONFIGURED)
    TaskAssignment create_task(const std::string& project, const std::vector<Patch>& patches,
                               const std::string& user_id);

    // Relays the assigned worker's record unchanged.
    // Throws TaskError(UNKNOWN_TICKET) for tickets not in the registry.
    ResultRecord get_status(const std::string& ticket);

    // Served by the first worker that answers
    ProjectFile get_project(const std::string& project);

    // Periodic bookkeeping: overdue Running rows become Timeout, old rows go
    void housekeeping(std::chrono::seconds deadline, std::chrono::seconds ttl,
                      std::chrono::seconds max_age);

    // /rest/balancer/v1/task (POST, GET), /rest/balancer/v1/project (GET)
    void register_routes(HttpServer& server);

    size_t worker_count() const { return workers_.size(); }

    // 128 random bits, hex
    static std::string random_ticket();

private:
    std::vector<std::unique_ptr<WorkerClient>> workers_;
    TaskRegistry& registry_;
    std::unique_ptr<WorkerSelector> selector_;
    TicketGenerator generate_ticket_;

    WorkerClient* find_worker(const std::string& id) const;
};

} // namespace droidrun
