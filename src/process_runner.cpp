#include "process_runner.h"

#include <sys/wait.h>
#include <sys/types.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>

extern char** environ;

namespace droidrun {

namespace {

// Child side of fork(): only async-signal-safe calls until exec
[[noreturn]] void exec_child(const std::vector<char*>& argv, const std::vector<char*>& envp,
                             const char* working_dir, int out_fd) {
    setpgid(0, 0);
    dup2(out_fd, STDOUT_FILENO);
    dup2(out_fd, STDERR_FILENO);
    close(out_fd);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }

    if (working_dir && working_dir[0] != '\0' && chdir(working_dir) != 0) {
        const char msg[] = "droidrun: chdir failed\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(126);
    }

    execvpe(argv[0], argv.data(), envp.data());
    const char msg[] = "droidrun: exec failed\n";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
}

void append_capped(ProcessResult& result, const char* data, size_t len, size_t cap) {
    result.output.append(data, len);
    if (result.output.size() > cap) {
        // Keep the tail; build failures report at the end
        result.output.erase(0, result.output.size() - cap);
        result.output_truncated = true;
    }
}

} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& command,
                                 const ProcessOptions& options) {
    ProcessResult result;
    auto start_time = std::chrono::steady_clock::now();

    if (command.empty()) {
        result.error_message = "Empty command";
        return result;
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> env_storage;
    for (char** env = environ; env && *env; ++env) {
        std::string entry = *env;
        std::string key = entry.substr(0, entry.find('='));
        if (options.environment.count(key) == 0) env_storage.push_back(entry);
    }
    for (const auto& [key, value] : options.environment) {
        env_storage.push_back(key + "=" + value);
    }

    std::vector<char*> argv;
    for (const auto& arg : command) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& entry : env_storage) envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) == -1) {
        result.error_message = "Failed to create pipe: " + std::string(std::strerror(errno));
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        result.error_message = "Failed to fork process: " + std::string(std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        close(out_pipe[0]);
        exec_child(argv, envp, options.working_dir.c_str(), out_pipe[1]);
    }

    // Parent process
    setpgid(pid, pid);  // Also done in the child; whichever runs first wins
    close(out_pipe[1]);

    auto deadline = start_time + options.timeout;
    char buffer[PIPE_BUFFER_SIZE];
    bool open_pipe = true;

    while (open_pipe) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill(-pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        struct pollfd pfd;
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        int rc = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            append_capped(result, buffer, static_cast<size_t>(n), options.max_output_bytes);
        } else if (n == 0 || errno != EINTR) {
            open_pipe = false;
        }
    }
    close(out_pipe[0]);

    // Output closed: the child is done or detached its descriptors.
    // Still enforce the deadline while waiting for it to exit.
    int status = 0;
    while (true) {
        pid_t waited = waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
        if (waited == pid) break;
        if (waited == -1 && errno != EINTR) {
            result.error_message = "Failed to wait for child process";
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline && !result.timed_out) {
            kill(-pid, SIGKILL);
            result.timed_out = true;
            continue;
        }
        struct timespec pause = {0, 10 * 1000 * 1000};
        nanosleep(&pause, nullptr);
    }

    // Kill anything the command left behind in its group
    kill(-pid, SIGKILL);

    if (result.error_message.empty()) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = -WTERMSIG(status);
        }
    }

    result.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    return result;
}

} // namespace droidrun
