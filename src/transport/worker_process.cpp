#include "transport/worker_process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <set>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace fabric::transport {

using core::errors::ErrorCategory;
using core::errors::FabricError;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

std::vector<std::string> build_environment(const protocol::ServerSpec& spec) {
    std::vector<std::string> entries;
    std::set<std::string> overridden;
    for (const auto& [key, value] : spec.env) {
        overridden.insert(key);
        entries.push_back(key + "=" + value);
    }
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const auto eq = text.find('=');
        if (eq != std::string::npos && overridden.count(text.substr(0, eq)) != 0) {
            continue;
        }
        entries.push_back(text);
    }
    return entries;
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

}  // namespace

void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, []() { static_cast<void>(signal(SIGPIPE, SIG_IGN)); });
}

std::string describe_command(const protocol::ServerSpec& spec) {
    std::string text = spec.command;
    for (const auto& arg : spec.args) {
        text += " " + arg;
    }
    return text;
}

core::errors::Result<std::unique_ptr<WorkerProcess>> WorkerProcess::spawn(
    const protocol::ServerSpec& spec) {
    if (spec.command.empty()) {
        return FabricError{ErrorCategory::Launch,
                           "Server '" + spec.id + "' has an empty command.",
                           "empty_command"};
    }
    ignore_sigpipe_once();

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argv_values;
    argv_values.push_back(spec.command);
    argv_values.insert(argv_values.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> env_values = build_environment(spec);
    std::vector<char*> argv = to_c_array(argv_values);
    std::vector<char*> envp = to_c_array(env_values);
    const std::string cwd = spec.working_directory.string();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return FabricError{ErrorCategory::Internal,
                           "Failed to create worker pipes: " + reason,
                           "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return FabricError{ErrorCategory::Launch,
                           "Failed to fork worker '" + spec.id + "': " + reason,
                           "fork_failed"};
    }

    if (pid == 0) {
        // status_pipe[1] stays open until exec succeeds (O_CLOEXEC closes it).
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        int child_errno = 0;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_errno = errno;
        } else {
            execvpe(argv[0], argv.data(), envp.data());
            child_errno = errno;
        }
        static_cast<void>(write(status_pipe[1], &child_errno, sizeof(child_errno)));
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(status_pipe[1]));

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(status_pipe[0]));

    std::unique_ptr<WorkerProcess> process(
        new WorkerProcess(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
    if (n > 0) {
        process->terminate(std::chrono::milliseconds(0));
        return FabricError{ErrorCategory::Launch,
                           "Failed to launch '" + describe_command(spec) +
                               "': " + std::strerror(child_errno),
                           "exec_failed",
                           "Check the server command and working directory."};
    }
    return process;
}

WorkerProcess::WorkerProcess(const pid_t pid, const int stdin_fd, const int stdout_fd,
                             const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

WorkerProcess::~WorkerProcess() {
    terminate(std::chrono::milliseconds(0));
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

core::errors::Result<std::size_t> WorkerProcess::write_all(const std::string& data) {
    if (stdin_fd_ < 0) {
        return FabricError{ErrorCategory::ConnectionLost, "Worker stdin is closed.",
                           "stdin_closed"};
    }

    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const std::string reason = n < 0 ? std::strerror(errno) : "short write";
        return FabricError{ErrorCategory::ConnectionLost,
                           "Failed to write to worker: " + reason, "write_failed"};
    }
    return written;
}

void WorkerProcess::close_stdin() {
    close_fd(stdin_fd_);
}

void WorkerProcess::record_status(const int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool WorkerProcess::has_exited() {
    if (exit_code_.has_value()) {
        return true;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        record_status(status);
        return true;
    }
    if (waited < 0 && errno == ECHILD) {
        exit_code_ = -1;
        return true;
    }
    return false;
}

int WorkerProcess::terminate(const std::chrono::milliseconds grace) {
    close_stdin();
    if (has_exited()) {
        return exit_code_.value();
    }

    static_cast<void>(kill(pid_, SIGTERM));
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (has_exited()) {
            return exit_code_.value();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!has_exited()) {
        static_cast<void>(kill(pid_, SIGKILL));
        int status = 0;
        pid_t waited = 0;
        do {
            waited = waitpid(pid_, &status, 0);
        } while (waited < 0 && errno == EINTR);
        if (waited == pid_) {
            record_status(status);
        } else {
            exit_code_ = -1;
        }
    }
    return exit_code_.value();
}

}  // namespace fabric::transport
