#include "mesh/server_pool.hpp"

#include <future>
#include <utility>
#include "core/logging/logger.hpp"

namespace fabric::mesh {

using core::errors::ErrorCategory;
using core::errors::FabricError;

namespace {

FabricError server_not_found(const std::string& server_id) {
    return FabricError{ErrorCategory::Input, "Server not found: " + server_id,
                       "server_not_found"};
}

}  // namespace

ServerPool::ServerPool(ConnectionOptions options)
    : options_(std::move(options)), current_(ToolRegistry::empty()) {}

ServerPool::~ServerPool() {
    shutdown();
}

ServerPool::Slot ServerPool::launch(const protocol::ServerSpec& spec,
                                    core::errors::Result<ConnectionState>& outcome) {
    Slot slot;
    slot.spec = spec;
    slot.connection = std::make_shared<ServerConnection>(spec, options_);
    outcome = slot.connection->start();
    slot.started = !core::errors::is_error(outcome);
    return slot;
}

std::shared_ptr<const ToolRegistry> ServerPool::rebuild_locked() {
    std::vector<std::shared_ptr<ToolEndpoint>> endpoints;
    for (const auto& [id, slot] : servers_) {
        if (slot.started) {
            endpoints.push_back(slot.connection);
        }
    }
    current_ = ToolRegistry::build(endpoints);
    return current_;
}

core::errors::Result<ConnectionState> ServerPool::add_server(const protocol::ServerSpec& spec) {
    auto errors = add_servers({spec});
    if (!errors.empty()) {
        return errors.front();
    }
    return server_state(spec.id);
}

std::vector<FabricError> ServerPool::add_servers(const std::vector<protocol::ServerSpec>& specs) {
    std::vector<FabricError> errors;
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        errors.push_back(FabricError{ErrorCategory::Input, "Server pool is shut down.",
                                     "pool_shut_down"});
        return errors;
    }

    using Launched = std::pair<Slot, core::errors::Result<ConnectionState>>;
    std::vector<std::future<Launched>> launches;
    for (const auto& spec : specs) {
        if (servers_.count(spec.id) != 0) {
            errors.push_back(FabricError{ErrorCategory::Input,
                                         "Server '" + spec.id + "' is already registered.",
                                         "duplicate_server"});
            continue;
        }
        launches.push_back(std::async(std::launch::async, [this, spec]() {
            core::errors::Result<ConnectionState> outcome = ConnectionState::Starting;
            Slot slot = launch(spec, outcome);
            return Launched{std::move(slot), std::move(outcome)};
        }));
    }

    for (auto& future : launches) {
        auto launched = future.get();
        const std::string id = launched.first.spec.id;
        if (core::errors::is_error(launched.second)) {
            const auto& error = core::errors::get_error(launched.second);
            LOG_ERROR("ServerPool: server '" + id + "' unavailable [" + error.code +
                      "]: " + error.message);
            errors.push_back(error);
        } else {
            LOG_INFO("ServerPool: server '" + id + "' ready");
        }
        servers_.emplace(id, std::move(launched.first));
    }

    rebuild_locked();
    return errors;
}

core::errors::Result<ConnectionState> ServerPool::reconnect(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
        return server_not_found(server_id);
    }

    LOG_INFO("ServerPool: reconnecting server '" + server_id + "'");
    it->second.connection->close();
    core::errors::Result<ConnectionState> outcome = ConnectionState::Starting;
    it->second = launch(it->second.spec, outcome);
    rebuild_locked();
    return outcome;
}

core::errors::Result<ConnectionState> ServerPool::remove_server(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
        return server_not_found(server_id);
    }

    it->second.connection->close();
    servers_.erase(it);
    rebuild_locked();
    return ConnectionState::Closed;
}

std::shared_ptr<const ToolRegistry> ServerPool::refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    return rebuild_locked();
}

std::shared_ptr<const ToolRegistry> ServerPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::vector<std::string> ServerPool::server_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, slot] : servers_) {
        ids.push_back(id);
    }
    return ids;
}

core::errors::Result<ConnectionState> ServerPool::server_state(
    const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(server_id);
    if (it == servers_.end()) {
        return server_not_found(server_id);
    }
    return it->second.connection->state();
}

void ServerPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    for (auto& [id, slot] : servers_) {
        slot.connection->close();
    }
    current_ = ToolRegistry::empty();
    LOG_INFO("ServerPool: shut down " + std::to_string(servers_.size()) + " servers");
}

}  // namespace fabric::mesh
