/*
 * droidrun worker - builds and runs one task at a time, answers status polls
 */

#include "http_server.h"
#include "project_config.h"
#include "result_store.h"
#include "worker_lock.h"
#include "build_runner.h"
#include "task_executor.h"
#include "worker_service.h"
#include "workspace.h"
#include "periodic_timer.h"
#include "errors.h"
#include "constants.h"
#include <iostream>
#include <string>
#include <cstdlib>
#include <csignal>
#include <filesystem>

using namespace droidrun;
namespace fs = std::filesystem;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --host ADDR            Listen address (default 0.0.0.0)\n"
              << "  --port N               Listen port (default " << DEFAULT_WORKER_PORT << ")\n"
              << "  --worker-id ID         Id reported to the balancer (default host:port)\n"
              << "  --config PATH          Project table (default projects/config.json)\n"
              << "  --results-dir PATH     Result records (default results)\n"
              << "  --workspace-dir PATH   Staged project copies (default workspace)\n"
              << "  --results-ttl SEC      Result lifetime (default " << RESULTS_TTL_SECONDS << ")\n"
              << "  --build-timeout SEC    Limit per build/run step (default "
              << DEFAULT_BUILD_TIMEOUT_SECONDS << ")\n"
              << "  --clean results        Remove all results and exit\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string host = "0.0.0.0";
    int port = DEFAULT_WORKER_PORT;
    std::string worker_id;
    std::string config_path = "projects/config.json";
    std::string results_dir = "results";
    std::string workspace_dir = "workspace";
    int results_ttl = RESULTS_TTL_SECONDS;
    int build_timeout = DEFAULT_BUILD_TIMEOUT_SECONDS;
    std::string clean;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (arg == "--worker-id" && i + 1 < argc) {
            worker_id = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--results-dir" && i + 1 < argc) {
            results_dir = argv[++i];
        } else if (arg == "--workspace-dir" && i + 1 < argc) {
            workspace_dir = argv[++i];
        } else if (arg == "--results-ttl" && i + 1 < argc) {
            results_ttl = std::atoi(argv[++i]);
        } else if (arg == "--build-timeout" && i + 1 < argc) {
            build_timeout = std::atoi(argv[++i]);
        } else if (arg == "--clean" && i + 1 < argc) {
            clean = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (port < 0 || port > 65535 || results_ttl <= 0 || build_timeout <= 0) {
        std::cerr << "Invalid numeric option" << std::endl;
        return 1;
    }

    if (directories_overlap(workspace_dir, results_dir)) {
        std::cerr << "[Worker] --workspace-dir " << workspace_dir << " and --results-dir "
                  << results_dir << " must not overlap" << std::endl;
        return 1;
    }

    if (!clean.empty()) {
        if (clean != "results") {
            std::cerr << "Nothing to clean for: " << clean << std::endl;
            return 1;
        }
        DiskResultStore(results_dir).clear();
        return 0;
    }

    // Peers hanging up mid-response must not kill the worker
    std::signal(SIGPIPE, SIG_IGN);

    ProjectTable projects;
    try {
        projects = ProjectTable::load(config_path);
    } catch (const TaskError& e) {
        std::cerr << "[Worker] " << e.what() << std::endl;
        return 1;
    }
    for (const auto& name : projects.names()) {
        const ProjectConfig* project = projects.find(name);
        if (!fs::is_directory(project->path)) {
            std::cerr << "[Worker] Warning: project " << name << " missing at "
                      << project->path << std::endl;
        }
    }

    if (worker_id.empty()) {
        worker_id = host + ":" + std::to_string(port);
    }

    std::error_code ec;
    fs::create_directories(workspace_dir, ec);
    if (ec) {
        std::cerr << "[Worker] Unable to create " << workspace_dir << ": " << ec.message() << std::endl;
        return 1;
    }

    DiskResultStore store(results_dir);
    WorkerLock lock;
    CommandBuildRunner runner{std::chrono::seconds(build_timeout)};
    TaskExecutor executor(lock, store, runner, fs::absolute(workspace_dir).string());
    WorkerService service(worker_id, projects, store, lock, executor,
                          std::chrono::seconds(results_ttl));

    PeriodicTimer housekeeping(std::chrono::seconds(HOUSEKEEPING_INTERVAL_SECONDS),
                               [&service] { service.collect_garbage(); });
    housekeeping.start();

    HttpServer server(port, host);
    service.register_routes(server);

    std::cout << "droidrun worker " << worker_id << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Projects: " << projects.size() << " | Results: " << results_dir
              << " | TTL: " << results_ttl << "s | Build timeout: " << build_timeout << "s"
              << std::endl;
    std::cout << "API endpoints:" << std::endl;
    std::cout << "  POST /rest/v1/task     - Accept a task" << std::endl;
    std::cout << "  GET  /rest/v1/task     - Poll task status" << std::endl;
    std::cout << "  GET  /rest/v1/project  - Fetch a project's editor file" << std::endl;
    std::cout << "  GET  /health           - 200 when idle, 500 when locked" << std::endl;

    // Start server (blocks)
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[Worker] " << e.what() << std::endl;
        housekeeping.stop();
        return 1;
    }

    housekeeping.stop();
    executor.wait_idle();
    return 0;
}
