/*
 * droidrun submit - command-line client: fetch a project, submit an edited
 * file, poll until the run finishes, save the screenshot
 */

#include "client_poller.h"
#include "encoding.h"
#include "errors.h"
#include "constants.h"
#include <iostream>
#include <fstream>
#include <string>
#include <cstdlib>
#include <csignal>

using namespace droidrun;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --project NAME [options]\n"
              << "  --balancer HOST:PORT   Balancer address (default 127.0.0.1:"
              << DEFAULT_BALANCER_PORT << ")\n"
              << "  --project NAME         Project to build (required)\n"
              << "  --file PATH            Replacement for the project's editor file;\n"
              << "                         without it the editor file is printed\n"
              << "  --user ID              Submitter id (advisory)\n"
              << "  --output PATH          Where the screenshot goes (default result.jpg)\n"
              << "  --interval MS          Poll interval (default " << CLIENT_POLL_INTERVAL_MS << ")\n"
              << "  --timeout SEC          Give up after (default " << CLIENT_POLL_TIMEOUT_SECONDS << ")\n";
}

bool write_image(const std::string& path, const std::string& payload) {
    std::vector<unsigned char> bytes = Encoding::base64_decode(payload);
    if (bytes.empty()) return false;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string balancer = "127.0.0.1:" + std::to_string(DEFAULT_BALANCER_PORT);
    std::string project;
    std::string file;
    std::string user_id;
    std::string output = "result.jpg";
    int interval_ms = CLIENT_POLL_INTERVAL_MS;
    int timeout_sec = CLIENT_POLL_TIMEOUT_SECONDS;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--balancer" && i + 1 < argc) {
            balancer = argv[++i];
        } else if (arg == "--project" && i + 1 < argc) {
            project = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            file = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            user_id = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output = argv[++i];
        } else if (arg == "--interval" && i + 1 < argc) {
            interval_ms = std::atoi(argv[++i]);
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (project.empty() || interval_ms <= 0 || timeout_sec <= 0) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    try {
        HttpTaskApi api(parse_endpoint(balancer));

        ProjectFile editor = api.get_project(project);
        if (file.empty()) {
            std::cout << "// " << editor.filename << "\n" << editor.contents;
            return 0;
        }

        std::ifstream in(file, std::ios::binary);
        if (!in.is_open()) {
            std::cerr << "Unable to read " << file << std::endl;
            return 1;
        }
        std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        PollerOptions options;
        options.interval = std::chrono::milliseconds(interval_ms);
        options.timeout = std::chrono::seconds(timeout_sec);

        ClientPoller poller(api, options);
        poller.on_change([](PollState state, const std::string& payload) {
            if (state == PollState::RUNNING && !payload.empty()) {
                std::cout << "[Client] " << payload << std::endl;
            }
        });

        poller.submit(project, {Patch{editor.filename, contents}}, user_id);
        PollState state = poller.wait();

        if (state == PollState::COMPLETE) {
            if (!write_image(output, poller.payload())) {
                std::cerr << "Unable to save result image to " << output << std::endl;
                return 1;
            }
            std::cout << ClientPoller::describe(state, poller.payload()) << " Screenshot saved to "
                      << output << std::endl;
            return 0;
        }

        std::cerr << ClientPoller::describe(state, poller.payload()) << std::endl;
        return 2;
    } catch (const TaskError& e) {
        if (e.code() == ErrorCode::TRANSPORT_ERROR || e.code() == ErrorCode::NO_WORKER_AVAILABLE) {
            std::cerr << ClientPoller::describe(PollState::NETWORK_ERROR, "") << " (" << e.what()
                      << ")" << std::endl;
        } else {
            std::cerr << e.what() << std::endl;
        }
        return 1;
    }
}
