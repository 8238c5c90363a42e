#include "worker_client.h"
#include "worker_service.h"
#include "errors.h"
#include "wire.h"

#include <set>
#include <sstream>

namespace droidrun {

HttpWorkerClient::HttpWorkerClient(std::string id, Endpoint endpoint, bool verify_id,
                                   int connect_timeout_ms, int io_timeout_ms)
    : id_(std::move(id)),
      verify_id_(verify_id),
      http_(std::move(endpoint), connect_timeout_ms, io_timeout_ms) {}

TaskAssignment HttpWorkerClient::accept_task(const std::string& ticket,
                                             const std::string& project,
                                             const std::vector<Patch>& patches) {
    Json::Value args;
    args["ticket"] = ticket;
    args["project"] = project;
    args["patches"] = patches_to_json(patches);

    auto resp = http_.post("/rest/v1/task", write_json(args));
    Json::Value payload = unwrap_payload(resp.status_code, resp.body);
    try {
        return assignment_from_json(payload);
    } catch (const TaskError& e) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR, std::string("Bad accept response: ") + e.what());
    }
}

ResultRecord HttpWorkerClient::poll_status(const std::string& ticket) {
    Json::Value args;
    args["ticket"] = ticket;
    if (verify_id_) args["workerId"] = id_;

    auto resp = http_.get(get_target("/rest/v1/task", args));
    Json::Value payload = unwrap_payload(resp.status_code, resp.body);
    try {
        return record_from_status_json(ticket, payload);
    } catch (const TaskError& e) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR, std::string("Bad status response: ") + e.what());
    }
}

ProjectFile HttpWorkerClient::get_project(const std::string& project) {
    Json::Value args;
    args["project"] = project;

    auto resp = http_.get(get_target("/rest/v1/project", args));
    Json::Value payload = unwrap_payload(resp.status_code, resp.body);
    try {
        return project_file_from_json(payload);
    } catch (const TaskError& e) {
        throw TaskError(ErrorCode::TRANSPORT_ERROR, std::string("Bad project response: ") + e.what());
    }
}

LocalWorkerClient::LocalWorkerClient(std::string id, WorkerService& service)
    : id_(std::move(id)), service_(service) {}

TaskAssignment LocalWorkerClient::accept_task(const std::string& ticket,
                                              const std::string& project,
                                              const std::vector<Patch>& patches) {
    return service_.accept_task(ticket, project, patches);
}

ResultRecord LocalWorkerClient::poll_status(const std::string& ticket) {
    return service_.poll_status(ticket);
}

ProjectFile LocalWorkerClient::get_project(const std::string& project) {
    return service_.get_project(project);
}

std::vector<std::unique_ptr<WorkerClient>> parse_worker_pool(const std::string& list) {
    std::vector<std::unique_ptr<WorkerClient>> pool;
    std::set<std::string> ids;

    std::istringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) continue;

        std::string id;
        std::string address = item;
        bool explicit_id = false;
        size_t eq = item.find('=');
        if (eq != std::string::npos) {
            id = item.substr(0, eq);
            address = item.substr(eq + 1);
            explicit_id = true;
            if (id.empty()) {
                throw TaskError(ErrorCode::BAD_REQUEST, "Empty worker id in: " + item);
            }
        }

        Endpoint endpoint = parse_endpoint(address);
        if (!explicit_id) id = endpoint.url();
        if (!ids.insert(id).second) {
            throw TaskError(ErrorCode::BAD_REQUEST, "Duplicate worker id: " + id);
        }
        pool.push_back(std::make_unique<HttpWorkerClient>(id, endpoint, explicit_id));
    }

    if (pool.empty()) {
        throw TaskError(ErrorCode::BAD_REQUEST, "No workers given");
    }
    return pool;
}

} // namespace droidrun
