#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/fabric_errors.hpp"
#include "mesh/tool_endpoint.hpp"
#include "protocol/server_spec.hpp"
#include "transport/worker_process.hpp"

namespace fabric::mesh {

struct ConnectionOptions {
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds shutdown_grace{2000};
    std::string client_name = "toolfabric";
    std::string client_version = "0.1.0";
};

// One worker process and the framed request/response protocol over its stdio.
// Any number of calls may be outstanding; responses are routed by call id.
class ServerConnection : public ToolEndpoint {
public:
    explicit ServerConnection(protocol::ServerSpec spec, ConnectionOptions options = {});
    ~ServerConnection() override;

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    // Spawns the worker and performs the handshake. Launch errors leave the
    // connection Closed; a live worker that misses the handshake deadline
    // leaves it Degraded and returns a Timeout error.
    core::errors::Result<ConnectionState> start();

    const std::string& server_id() const override { return spec_.id; }
    ConnectionState state() const override;

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() override;

    core::errors::Result<protocol::ToolResult> invoke(
        const std::string& name, const nlohmann::json& arguments,
        std::chrono::milliseconds timeout,
        const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr) override;

    // Terminates the worker and fails every pending call with ConnectionLost.
    void close();

    const protocol::ServerSpec& spec() const { return spec_; }
    std::size_t pending_count() const;
    std::size_t protocol_error_count() const { return protocol_errors_.load(); }

private:
    struct PendingCall {
        std::int64_t call_id = 0;
        std::string method;
        std::chrono::steady_clock::time_point issued_at;
        std::chrono::steady_clock::time_point timeout_at;
        std::optional<core::errors::Result<nlohmann::json>> outcome;
    };

    core::errors::Result<nlohmann::json> request(
        const std::string& method, const nlohmann::json& params,
        std::chrono::milliseconds timeout,
        const std::shared_ptr<std::atomic_bool>& cancel_token);
    core::errors::Result<std::size_t> send_frame(const std::string& frame);
    void send_cancellation(std::int64_t call_id, const std::string& reason);

    void reader_loop();
    void handle_line(const std::string& line);
    void handle_stderr_line(const std::string& line);
    void complete_call(std::int64_t call_id, core::errors::Result<nlohmann::json> outcome);
    void fail_all_pending(const core::errors::FabricError& error);
    void transition(ConnectionState next);
    void transition_locked(ConnectionState next);
    std::string exit_detail();

    protocol::ServerSpec spec_;
    ConnectionOptions options_;
    std::unique_ptr<transport::WorkerProcess> process_;

    mutable std::mutex mutex_;  // guards state_, pending_, last_stderr_
    std::condition_variable pending_cv_;
    ConnectionState state_ = ConnectionState::Starting;
    std::unordered_map<std::int64_t, std::shared_ptr<PendingCall>> pending_;
    std::string last_stderr_;

    std::mutex write_mutex_;  // single writer for outbound frames
    std::mutex lifecycle_mutex_;
    bool started_ = false;
    bool torn_down_ = false;

    std::thread reader_;
    std::atomic_bool stop_reader_{false};
    std::atomic<std::int64_t> next_call_id_{0};
    std::atomic<std::size_t> protocol_errors_{0};
};

}  // namespace fabric::mesh
