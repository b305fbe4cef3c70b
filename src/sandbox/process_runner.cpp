#include "sandbox/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "sandbox/resource_limiter.hpp"

namespace shellbench::sandbox {

using core::errors::BenchError;
using core::errors::ErrorCategory;

namespace {

struct StreamCapture {
    std::string& text;
    std::size_t& total;
    std::size_t limit;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int pipe_fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (pipe_fds[i] >= 0) {
            static_cast<void>(close(pipe_fds[i]));
            pipe_fds[i] = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, StreamCapture out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto count = static_cast<std::size_t>(n);
            out.total += count;
            if (out.text.size() < out.limit) {
                out.text.append(buffer, std::min(count, out.limit - out.text.size()));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty()) {
        return BenchError{ErrorCategory::Internal, "Process request has no argv.",
                          "empty_argv"};
    }

    std::string executable = request.argv.front();
    if (const auto resolved = find_executable(executable, request.environment)) {
        executable = resolved->string();
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> envp_storage = to_envp(request.environment);
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::vector<char*> envp;
    envp.reserve(envp_storage.size() + 1);
    for (auto& entry : envp_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return BenchError{ErrorCategory::Execution, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        return BenchError{ErrorCategory::Execution, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return BenchError{ErrorCategory::Execution, "Failed to fork process.",
                          "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        const int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
            static_cast<void>(close(dev_null));
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        if (request.limiter != nullptr) {
            request.limiter->apply(request.timeout);
        }
        execve(executable.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    // Also set from the parent so the group exists before any kill.
    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;
    const auto timeout_ms = request.timeout.count();

    while (stdout_open || stderr_open || !child_exited) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!capture.timed_out && timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(timeout_ms)) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_pipe[0], stdout_open,
                   {capture.stdout_text, capture.stdout_total_bytes,
                    request.max_output_bytes});
        drain_pipe(stderr_pipe[0], stderr_open,
                   {capture.stderr_text, capture.stderr_total_bytes,
                    request.max_output_bytes});

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A background grandchild can hold the pipes open after the shell
        // exits; once timed out, stop waiting for it.
        if (child_exited && capture.timed_out) {
            break;
        }
    }

    if (stdout_open) {
        static_cast<void>(close(stdout_pipe[0]));
    }
    if (stderr_open) {
        static_cast<void>(close(stderr_pipe[0]));
    }
    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.term_signal = WTERMSIG(status);
        capture.exit_code = 128 + capture.term_signal;
    }

    capture.duration_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return capture;
}

core::errors::Result<ProcessCapture> run_shell(const std::string& command,
                                               ProcessRequest request) {
    request.argv = {"/bin/sh", "-c", command};
    return run_process(request);
}

}  // namespace shellbench::sandbox
