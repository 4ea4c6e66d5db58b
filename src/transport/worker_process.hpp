#pragma once

#include <sys/types.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/fabric_errors.hpp"
#include "protocol/server_spec.hpp"

namespace fabric::transport {

// A long-lived child process whose stdin/stdout/stderr are pipes owned by the
// parent. Writes are not serialized here; callers that share a process must
// hold their own write lock.
class WorkerProcess {
public:
    static core::errors::Result<std::unique_ptr<WorkerProcess>> spawn(
        const protocol::ServerSpec& spec);

    ~WorkerProcess();
    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    core::errors::Result<std::size_t> write_all(const std::string& data);
    void close_stdin();

    // Reaps the child if it has exited; never blocks.
    bool has_exited();
    std::optional<int> exit_code() const { return exit_code_; }

    // Closes stdin, sends SIGTERM, waits up to grace, then SIGKILLs. Idempotent.
    int terminate(std::chrono::milliseconds grace);

private:
    WorkerProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
    void record_status(int status);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> exit_code_;
};

// Ignores SIGPIPE once per process so writes to dead workers fail with EPIPE.
void ignore_sigpipe_once();

std::string describe_command(const protocol::ServerSpec& spec);

}  // namespace fabric::transport
