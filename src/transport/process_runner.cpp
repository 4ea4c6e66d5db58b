#include "transport/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "transport/worker_process.hpp"

namespace fabric::transport {

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

void feed_pipe(const int fd, bool& is_open, const std::string& data, std::size_t& offset) {
    if (!is_open) {
        return;
    }
    while (offset < data.size()) {
        const ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return;
        }
        // EPIPE: the child stopped reading; the rest of stdin is discarded.
        break;
    }
    is_open = false;
    static_cast<void>(close(fd));
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }
    ignore_sigpipe_once();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            if (fds[0] >= 0) static_cast<void>(close(fds[0]));
            if (fds[1] >= 0) static_cast<void>(close(fds[1]));
        }
        return core::errors::FabricError{core::errors::ErrorCategory::Internal,
                                         "Failed to create process pipes.",
                                         "pipe_creation_failed"};
    }

    const std::string cwd = request.working_directory.string();
    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            static_cast<void>(close(fds[0]));
            static_cast<void>(close(fds[1]));
        }
        return core::errors::FabricError{core::errors::ErrorCategory::Internal,
                                         "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execl("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdin_open = true;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    std::size_t stdin_offset = 0;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (request.cancel_token && request.cancel_token->load() && !child_exited &&
            !capture.cancelled) {
            capture.cancelled = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdin_open) {
            fds[nfds].fd = stdin_pipe[1];
            fds[nfds].events = POLLOUT;
            ++nfds;
        }
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
        }

        feed_pipe(stdin_pipe[1], stdin_open, request.stdin_text, stdin_offset);
        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A killed child may leave grandchildren holding the pipes open.
        if (child_exited && (capture.timed_out || capture.cancelled)) {
            break;
        }
        if (child_exited && !stdout_open && !stderr_open) {
            break;
        }
    }

    if (stdin_open) static_cast<void>(close(stdin_pipe[1]));
    if (stdout_open) static_cast<void>(close(stdout_pipe[0]));
    if (stderr_open) static_cast<void>(close(stderr_pipe[0]));

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace fabric::transport
