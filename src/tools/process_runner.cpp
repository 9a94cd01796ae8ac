#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace warden::tools {

using core::errors::ErrorKind;
using core::errors::WardenError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void kill_group(const pid_t pid) {
    static_cast<void>(kill(-pid, SIGKILL));
    static_cast<void>(kill(pid, SIGKILL));
}

// Returns the number of bytes appended.
std::size_t drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return 0;
    }

    std::size_t appended = 0;
    char buffer[4096];
    // Bounded so a flooding child cannot starve the timeout checks.
    constexpr std::size_t kMaxBytesPerDrain = 256 * 1024;
    while (appended < kMaxBytesPerDrain) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            appended += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return appended;
        }
        close_fd(fd);
        return appended;
    }
    return appended;
}

// Blocks until exec succeeds (pipe closed by O_CLOEXEC) or the child
// reports the errno of a failed exec.
int read_exec_errno(const int fd) {
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessSpec& spec) {
    if (spec.program.empty()) {
        return WardenError{ErrorKind::EmptyCommand, "Program cannot be empty."};
    }

    if (spec.cancel_token && spec.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    // argv must be fully built before fork.
    std::vector<std::string> owned;
    owned.reserve(spec.args.size() + 1);
    owned.push_back(spec.program);
    owned.insert(owned.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(owned.size() + 1);
    for (auto& arg : owned) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    // dup2 in the child clears close-on-exec on fds 1 and 2 only.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        for (int* fds : {stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return WardenError{ErrorKind::SpawnFailed, "Failed to create process pipes."};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fds : {stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return WardenError{ErrorKind::SpawnFailed, "Failed to fork process."};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        execvp(argv[0], argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    // Both sides set the group to avoid racing the child's own setpgid.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    const int exec_errno = read_exec_errno(exec_pipe[0]);
    close_fd(exec_pipe[0]);
    if (exec_errno != 0) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return WardenError{ErrorKind::SpawnFailed,
                           "Failed to execute '" + spec.program +
                               "': " + std::strerror(exec_errno)};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool child_exited = false;
    bool killed = false;
    int status = 0;
    std::size_t total_output = 0;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();

        if (!killed && spec.cancel_token && spec.cancel_token->load()) {
            capture.cancelled = true;
            killed = true;
            kill_group(pid);
            LOG_WARN("ProcessRunner: cancelled '" + spec.program + "' (pid " +
                     std::to_string(pid) + ")");
        }

        if (!killed && spec.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(spec.timeout_ms)) {
            capture.timed_out = true;
            killed = true;
            kill_group(pid);
            LOG_WARN("ProcessRunner: '" + spec.program + "' exceeded " +
                     std::to_string(spec.timeout_ms) + " ms, killed process group");
        }

        if (!killed && spec.max_output_bytes > 0 && total_output > spec.max_output_bytes) {
            capture.output_exceeded = true;
            killed = true;
            kill_group(pid);
            LOG_WARN("ProcessRunner: '" + spec.program + "' exceeded output cap of " +
                     std::to_string(spec.max_output_bytes) + " bytes");
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        }

        total_output += drain_pipe(stdout_pipe[0], capture.stdout_text);
        total_output += drain_pipe(stderr_pipe[0], capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        if (child_exited && stdout_pipe[0] < 0 && stderr_pipe[0] < 0) {
            break;
        }
        // Whatever still holds the pipes after a kill escaped the group.
        if (child_exited && killed) {
            break;
        }
        if (nfds == 0 && !child_exited) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    if (spec.max_output_bytes > 0) {
        if (total_output > spec.max_output_bytes) {
            capture.output_exceeded = true;
        }
        if (capture.stdout_text.size() > spec.max_output_bytes) {
            capture.stdout_text.resize(spec.max_output_bytes);
        }
        if (capture.stderr_text.size() > spec.max_output_bytes) {
            capture.stderr_text.resize(spec.max_output_bytes);
        }
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace warden::tools
