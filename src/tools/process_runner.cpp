#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace strand::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

// Read end of a child pipe, drained without blocking.
struct PipeReader {
    int fd = -1;
    bool open = false;
    std::string* sink = nullptr;

    void drain() {
        if (!open) {
            return;
        }
        char buffer[4096];
        while (true) {
            const ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                sink->append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            close_fd();
            return;
        }
    }

    void close_fd() {
        if (open) {
            static_cast<void>(close(fd));
            open = false;
        }
    }
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) {
        static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
    }
}

void close_pair(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

core::errors::Result<ProcessOutcome> run_process(const std::string& command,
                                                 const std::filesystem::path& cwd,
                                                 const std::uint32_t timeout_ms,
                                                 const protocol::CancelToken& cancel_token) {
    ProcessOutcome outcome;
    if (protocol::is_cancelled(cancel_token)) {
        outcome.cancelled = true;
        outcome.stderr_text = "Command cancelled before start.";
        return outcome;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        return AgentError{ErrorCategory::ToolExecution,
                          "Failed to create process pipes.", "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        return AgentError{ErrorCategory::ToolExecution, "Failed to fork process.",
                          "fork_failed"};
    }

    if (pid == 0) {
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(out_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(err_pipe[1], STDERR_FILENO));
        close_pair(out_pipe);
        close_pair(err_pipe);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(close(out_pipe[1]));
    static_cast<void>(close(err_pipe[1]));
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    PipeReader readers[2] = {{out_pipe[0], true, &outcome.stdout_text},
                             {err_pipe[0], true, &outcome.stderr_text}};
    bool exited = false;
    bool killed = false;
    int status = 0;

    while (readers[0].open || readers[1].open || !exited) {
        if (!exited && !killed) {
            const auto elapsed = std::chrono::steady_clock::now() - started;
            if (protocol::is_cancelled(cancel_token)) {
                outcome.cancelled = true;
            } else if (timeout_ms > 0 &&
                       elapsed > std::chrono::milliseconds(timeout_ms)) {
                outcome.timed_out = true;
            }
            if (outcome.cancelled || outcome.timed_out) {
                static_cast<void>(kill(pid, SIGKILL));
                killed = true;
            }
        }

        pollfd fds[2];
        nfds_t count = 0;
        for (const auto& reader : readers) {
            if (reader.open) {
                fds[count].fd = reader.fd;
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                ++count;
            }
        }
        if (count > 0) {
            static_cast<void>(poll(fds, count, 50));
        } else {
            usleep(10 * 1000);
        }
        for (auto& reader : readers) {
            reader.drain();
        }

        if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
            exited = true;
        }
    }

    outcome.exit_code = decode_status(status);
    outcome.duration_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                                  started)
            .count();
    return outcome;
}

}  // namespace strand::tools
