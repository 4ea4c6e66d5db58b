#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/errors/fabric_errors.hpp"
#include "mesh/server_connection.hpp"
#include "mesh/tool_registry.hpp"
#include "protocol/server_spec.hpp"

namespace fabric::mesh {

// Owns every ServerConnection built from configuration and publishes the
// catalog over the live ones. Lifecycle: add servers, use snapshots, shutdown.
class ServerPool {
public:
    explicit ServerPool(ConnectionOptions options = {});
    ~ServerPool();

    ServerPool(const ServerPool&) = delete;
    ServerPool& operator=(const ServerPool&) = delete;

    // Starts one server. On failure the server is remembered (so it can be
    // reconnected) but contributes no tools.
    core::errors::Result<ConnectionState> add_server(const protocol::ServerSpec& spec);

    // Starts several servers in parallel and rebuilds the catalog once.
    // Returns one error per server that failed to start.
    std::vector<core::errors::FabricError> add_servers(
        const std::vector<protocol::ServerSpec>& specs);

    core::errors::Result<ConnectionState> reconnect(const std::string& server_id);
    core::errors::Result<ConnectionState> remove_server(const std::string& server_id);

    // Rebuilds the catalog from scratch, e.g. after a worker crashed.
    std::shared_ptr<const ToolRegistry> refresh();

    std::shared_ptr<const ToolRegistry> snapshot() const;

    std::vector<std::string> server_ids() const;
    core::errors::Result<ConnectionState> server_state(const std::string& server_id) const;

    void shutdown();

private:
    struct Slot {
        protocol::ServerSpec spec;
        std::shared_ptr<ServerConnection> connection;
        bool started = false;
    };

    Slot launch(const protocol::ServerSpec& spec, core::errors::Result<ConnectionState>& outcome);
    std::shared_ptr<const ToolRegistry> rebuild_locked();

    ConnectionOptions options_;
    mutable std::mutex mutex_;  // guards servers_ and current_
    std::map<std::string, Slot> servers_;
    std::shared_ptr<const ToolRegistry> current_;
    bool shut_down_ = false;
};

}  // namespace fabric::mesh
