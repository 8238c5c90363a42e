/*
 * droidrun balancer - assigns tasks to workers and relays status
 */

#include "http_server.h"
#include "balancer.h"
#include "task_registry.h"
#include "worker_client.h"
#include "periodic_timer.h"
#include "errors.h"
#include "constants.h"
#include <iostream>
#include <string>
#include <cstdlib>
#include <csignal>

using namespace droidrun;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --workers LIST [options]\n"
              << "  --workers LIST         [id=]host:port,... (required)\n"
              << "  --host ADDR            Listen address (default 0.0.0.0)\n"
              << "  --port N               Listen port (default " << DEFAULT_BALANCER_PORT << ")\n"
              << "  --task-deadline SEC    Running tasks marked timeout after (default "
              << BALANCER_TASK_DEADLINE_SECONDS << ")\n"
              << "  --registry-ttl SEC     Finished tasks forgotten after (default "
              << REGISTRY_TTL_SECONDS << ")\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string host = "0.0.0.0";
    int port = DEFAULT_BALANCER_PORT;
    std::string workers_list;
    int task_deadline = BALANCER_TASK_DEADLINE_SECONDS;
    int registry_ttl = REGISTRY_TTL_SECONDS;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--workers" && i + 1 < argc) {
            workers_list = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (arg == "--task-deadline" && i + 1 < argc) {
            task_deadline = std::atoi(argv[++i]);
        } else if (arg == "--registry-ttl" && i + 1 < argc) {
            registry_ttl = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (port < 0 || port > 65535 || task_deadline <= 0 || registry_ttl <= 0) {
        std::cerr << "Invalid numeric option" << std::endl;
        return 1;
    }

    std::vector<std::unique_ptr<WorkerClient>> workers;
    try {
        workers = parse_worker_pool(workers_list);
    } catch (const TaskError& e) {
        std::cerr << "[Balancer] " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "droidrun balancer" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    for (const auto& worker : workers) {
        std::cout << "Worker: " << worker->id() << std::endl;
    }

    TaskRegistry registry;
    Balancer balancer(std::move(workers), registry);

    auto deadline = std::chrono::seconds(task_deadline);
    auto ttl = std::chrono::seconds(registry_ttl);
    PeriodicTimer housekeeping(std::chrono::seconds(HOUSEKEEPING_INTERVAL_SECONDS),
                               [&balancer, deadline, ttl] {
                                   balancer.housekeeping(deadline, ttl, 2 * ttl);
                               });
    housekeeping.start();

    HttpServer server(port, host);
    balancer.register_routes(server);

    std::cout << "API endpoints:" << std::endl;
    std::cout << "  POST /rest/balancer/v1/task     - Create a task" << std::endl;
    std::cout << "  GET  /rest/balancer/v1/task     - Task status" << std::endl;
    std::cout << "  GET  /rest/balancer/v1/project  - Fetch a project's editor file" << std::endl;

    // Start server (blocks)
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[Balancer] " << e.what() << std::endl;
        housekeeping.stop();
        return 1;
    }

    housekeeping.stop();
    return 0;
}
