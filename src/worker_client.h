#pragma once

#include <string>
#include <vector>
#include <memory>
#include "task.h"
#include "http_client.h"

namespace droidrun {

class WorkerService;

// How the balancer talks to one worker. Every call throws TaskError; a
// worker that cannot be reached is TRANSPORT_ERROR.
class WorkerClient {
public:
    virtual ~WorkerClient() = default;

    virtual const std::string& id() const = 0;

    virtual TaskAssignment accept_task(const std::string& ticket, const std::string& project,
                                       const std::vector<Patch>& patches) = 0;
    virtual ResultRecord poll_status(const std::string& ticket) = 0;
    virtual ProjectFile get_project(const std::string& project) = 0;
};

// Worker reached over HTTP
class HttpWorkerClient : public WorkerClient {
public:
    // When verify_id is set, polls carry id so a worker answering at a
    // reassigned address rejects them with WRONG_WORKER
    HttpWorkerClient(std::string id, Endpoint endpoint, bool verify_id = true,
                     int connect_timeout_ms = WORKER_CONNECT_TIMEOUT_MS,
                     int io_timeout_ms = WORKER_IO_TIMEOUT_MS);

    const std::string& id() const override { return id_; }

    TaskAssignment accept_task(const std::string& ticket, const std::string& project,
                               const std::vector<Patch>& patches) override;
    ResultRecord poll_status(const std::string& ticket) override;
    ProjectFile get_project(const std::string& project) override;

private:
    std::string id_;
    bool verify_id_;
    HttpClient http_;
};

// Worker in the same process (tests and single-host setups)
class LocalWorkerClient : public WorkerClient {
public:
    LocalWorkerClient(std::string id, WorkerService& service);

    const std::string& id() const override { return id_; }

    TaskAssignment accept_task(const std::string& ticket, const std::string& project,
                               const std::vector<Patch>& patches) override;
    ResultRecord poll_status(const std::string& ticket) override;
    ProjectFile get_project(const std::string& project) override;

private:
    std::string id_;
    WorkerService& service_;
};

// Parses "id=host:port,host:port,..." (the --workers flag). An entry
// without "id=" is named by its URL and polled without id checks.
// Throws TaskError(BAD_REQUEST).
std::vector<std::unique_ptr<WorkerClient>> parse_worker_pool(const std::string& list);

} // namespace droidrun
