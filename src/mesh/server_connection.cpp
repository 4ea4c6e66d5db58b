#include "mesh/server_connection.hpp"

#include <algorithm>
#include <cerrno>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/rpc_frame.hpp"

namespace fabric::mesh {

using core::errors::ErrorCategory;
using core::errors::FabricError;
using nlohmann::json;

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{20};
constexpr int kReaderPollMs = 50;
constexpr std::size_t kMaxFrameBytes = 16 * 1024 * 1024;

std::int64_t elapsed_ms(const std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

}  // namespace

ServerConnection::ServerConnection(protocol::ServerSpec spec, ConnectionOptions options)
    : spec_(std::move(spec)), options_(std::move(options)) {}

ServerConnection::~ServerConnection() {
    close();
}

ConnectionState ServerConnection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t ServerConnection::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void ServerConnection::transition(const ConnectionState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    transition_locked(next);
}

void ServerConnection::transition_locked(const ConnectionState next) {
    if (state_ == next || state_ == ConnectionState::Closed) {
        return;
    }
    LOG_INFO("ServerConnection[" + spec_.id + "]: transition " + to_string(state_) +
             " -> " + to_string(next));
    state_ = next;
}

std::string ServerConnection::exit_detail() {
    std::string detail;
    if (process_ && process_->has_exited() && process_->exit_code().has_value()) {
        detail = " (exit code " + std::to_string(process_->exit_code().value()) + ")";
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_stderr_.empty()) {
        detail += ": " + last_stderr_;
    }
    return detail;
}

core::errors::Result<ConnectionState> ServerConnection::start() {
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (started_) {
            return FabricError{ErrorCategory::Input,
                               "Server '" + spec_.id + "' was already started.",
                               "already_started"};
        }
        started_ = true;

        if (spec_.transport != "stdio") {
            transition(ConnectionState::Closed);
            return FabricError{ErrorCategory::Launch,
                               "Server '" + spec_.id + "' uses unsupported transport '" +
                                   spec_.transport + "'.",
                               "unsupported_transport"};
        }

        LOG_INFO("ServerConnection[" + spec_.id + "]: launching " +
                 transport::describe_command(spec_));
        auto spawned = transport::WorkerProcess::spawn(spec_);
        if (core::errors::is_error(spawned)) {
            transition(ConnectionState::Closed);
            auto error = core::errors::get_error(spawned);
            error.category = ErrorCategory::Launch;
            LOG_ERROR("ServerConnection[" + spec_.id + "]: " + error.message);
            return error;
        }
        process_ = std::move(core::errors::get_value(spawned));
        reader_ = std::thread(&ServerConnection::reader_loop, this);
    }

    auto handshake = request(protocol::rpc::kMethodInitialize,
                             protocol::rpc::make_initialize_params(options_.client_name,
                                                                   options_.client_version),
                             options_.handshake_timeout, nullptr);
    if (core::errors::is_error(handshake)) {
        const auto& error = core::errors::get_error(handshake);
        if (error.category == ErrorCategory::Timeout && state() != ConnectionState::Closed) {
            transition(ConnectionState::Degraded);
            LOG_WARN("ServerConnection[" + spec_.id + "]: handshake timed out after " +
                     std::to_string(options_.handshake_timeout.count()) + "ms");
            return FabricError{ErrorCategory::Timeout,
                               "Server '" + spec_.id + "' did not answer the handshake within " +
                                   std::to_string(options_.handshake_timeout.count()) + "ms.",
                               "handshake_timeout",
                               "The worker is running but slow; reconnect to retry."};
        }

        std::string message = "Server '" + spec_.id + "' failed during handshake: " +
                              error.message;
        if (error.category == ErrorCategory::ConnectionLost) {
            message = "Server '" + spec_.id + "' exited before handshake" + exit_detail();
        }
        LOG_ERROR("ServerConnection[" + spec_.id + "]: " + message);
        close();
        return FabricError{ErrorCategory::Launch, message, "handshake_failed"};
    }

    auto notified = send_frame(
        protocol::rpc::encode_notification(protocol::rpc::kMethodInitialized, json::object()));
    if (core::errors::is_error(notified)) {
        const std::string message =
            "Server '" + spec_.id + "' exited before handshake" + exit_detail();
        LOG_ERROR("ServerConnection[" + spec_.id + "]: " + message);
        close();
        return FabricError{ErrorCategory::Launch, message, "handshake_failed"};
    }

    transition(ConnectionState::Ready);
    return state();
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> ServerConnection::list_tools() {
    std::vector<protocol::ToolDescriptor> tools;
    std::optional<std::string> cursor;
    constexpr int kMaxPages = 64;
    for (int page_index = 0; page_index < kMaxPages; ++page_index) {
        json params = json::object();
        if (cursor.has_value()) {
            params["cursor"] = cursor.value();
        }

        auto response = request(protocol::rpc::kMethodListTools, params,
                                options_.handshake_timeout, nullptr);
        if (core::errors::is_error(response)) {
            auto error = core::errors::get_error(response);
            if (error.category == ErrorCategory::Execution) {
                error.category = ErrorCategory::Protocol;
            }
            return error;
        }

        auto page = protocol::rpc::parse_tool_page(core::errors::get_value(response), spec_.id);
        if (core::errors::is_error(page)) {
            ++protocol_errors_;
            return core::errors::get_error(page);
        }
        auto& parsed = core::errors::get_value(page);
        for (auto& tool : parsed.tools) {
            tools.push_back(std::move(tool));
        }
        if (!parsed.next_cursor.has_value()) {
            LOG_DEBUG("ServerConnection[" + spec_.id + "]: listed " +
                      std::to_string(tools.size()) + " tools");
            return tools;
        }
        cursor = parsed.next_cursor;
    }

    return FabricError{ErrorCategory::Protocol,
                       "Server '" + spec_.id + "' returned too many tools/list pages.",
                       "tool_list_pagination"};
}

core::errors::Result<protocol::ToolResult> ServerConnection::invoke(
    const std::string& name, const json& arguments, const std::chrono::milliseconds timeout,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    const auto started = std::chrono::steady_clock::now();
    auto response = request(protocol::rpc::kMethodCallTool,
                            json{{"name", name},
                                 {"arguments", arguments.is_null() ? json::object() : arguments}},
                            timeout, cancel_token);

    protocol::ToolResult result;
    result.tool_name = name;
    if (core::errors::is_error(response)) {
        const auto& error = core::errors::get_error(response);
        if (error.category != ErrorCategory::Execution) {
            return error;
        }
        result.success = false;
        result.error_message = error.message;
        result.error_category = ErrorCategory::Execution;
    } else {
        protocol::rpc::apply_call_result(core::errors::get_value(response), result);
    }
    result.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    return result;
}

core::errors::Result<json> ServerConnection::request(
    const std::string& method, const json& params, const std::chrono::milliseconds timeout,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    auto call = std::make_shared<PendingCall>();
    call->call_id = ++next_call_id_;
    call->method = method;
    call->issued_at = std::chrono::steady_clock::now();
    call->timeout_at = call->issued_at + timeout;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Closed) {
            return FabricError{ErrorCategory::ConnectionLost,
                               "Server '" + spec_.id + "' is not connected.",
                               "connection_closed"};
        }
        pending_.emplace(call->call_id, call);
    }

    auto sent = send_frame(protocol::rpc::encode_request(call->call_id, method, params));
    if (core::errors::is_error(sent)) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(call->call_id);
        return FabricError{ErrorCategory::ConnectionLost,
                           "Server '" + spec_.id + "' stopped accepting requests: " +
                               core::errors::get_error(sent).message,
                           "connection_lost"};
    }

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (call->outcome.has_value()) {
            return std::move(call->outcome.value());
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= call->timeout_at) {
            pending_.erase(call->call_id);
            lock.unlock();
            LOG_WARN("ServerConnection[" + spec_.id + "]: " + method + " call " +
                     std::to_string(call->call_id) + " timed out after " +
                     std::to_string(elapsed_ms(call->issued_at)) + "ms");
            send_cancellation(call->call_id, "timeout");
            return FabricError{ErrorCategory::Timeout,
                               "Server '" + spec_.id + "' did not answer " + method +
                                   " within " + std::to_string(timeout.count()) + "ms.",
                               "call_timeout"};
        }

        if (cancel_token && cancel_token->load()) {
            pending_.erase(call->call_id);
            lock.unlock();
            send_cancellation(call->call_id, "cancelled");
            return FabricError{ErrorCategory::Cancelled, "cancelled", "cancelled"};
        }

        const auto wake_at = cancel_token ? std::min(call->timeout_at, now + kCancelPollInterval)
                                          : call->timeout_at;
        pending_cv_.wait_until(lock, wake_at);
    }
}

core::errors::Result<std::size_t> ServerConnection::send_frame(const std::string& frame) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!process_) {
        return FabricError{ErrorCategory::ConnectionLost, "Worker is not running.",
                           "not_running"};
    }
    return process_->write_all(frame);
}

void ServerConnection::send_cancellation(const std::int64_t call_id, const std::string& reason) {
    if (state() == ConnectionState::Closed) {
        return;
    }
    auto sent = send_frame(protocol::rpc::encode_notification(
        protocol::rpc::kMethodCancelled, json{{"requestId", call_id}, {"reason", reason}}));
    if (core::errors::is_error(sent)) {
        LOG_DEBUG("ServerConnection[" + spec_.id + "]: could not send cancellation for call " +
                  std::to_string(call_id) + ": " + core::errors::get_error(sent).message);
    }
}

void ServerConnection::complete_call(const std::int64_t call_id,
                                     core::errors::Result<json> outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(call_id);
    if (it == pending_.end()) {
        LOG_WARN("ServerConnection[" + spec_.id + "]: dropping response for unknown call id " +
                 std::to_string(call_id));
        return;
    }
    it->second->outcome = std::move(outcome);
    pending_.erase(it);
    pending_cv_.notify_all();
}

void ServerConnection::fail_all_pending(const FabricError& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [call_id, call] : pending_) {
        call->outcome = error;
    }
    pending_.clear();
    pending_cv_.notify_all();
}

void ServerConnection::handle_line(const std::string& line) {
    auto decoded = protocol::rpc::decode_frame(line);
    if (core::errors::is_error(decoded)) {
        ++protocol_errors_;
        LOG_WARN("ServerConnection[" + spec_.id + "]: " +
                 core::errors::get_error(decoded).message);
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Ready) {
            transition_locked(ConnectionState::Degraded);
        }
        return;
    }

    const auto& frame = core::errors::get_value(decoded);
    switch (frame.kind) {
        case protocol::rpc::FrameKind::Response: {
            if (frame.error.has_value()) {
                complete_call(frame.id.value(),
                              FabricError{ErrorCategory::Execution,
                                          "Server '" + spec_.id + "' returned error " +
                                              std::to_string(frame.error->code) + ": " +
                                              frame.error->message,
                                          "rpc_error"});
            } else {
                complete_call(frame.id.value(), frame.result);
            }
            return;
        }
        case protocol::rpc::FrameKind::Request: {
            // Workers may ping; anything else is not offered by this client.
            std::string reply;
            if (frame.method == "ping") {
                reply = protocol::rpc::encode_result(frame.id.value(), json::object());
            } else {
                reply = protocol::rpc::encode_error(frame.id.value(), -32601,
                                                    "Method not found: " + frame.method);
            }
            auto sent = send_frame(reply);
            if (core::errors::is_error(sent)) {
                LOG_DEBUG("ServerConnection[" + spec_.id + "]: could not answer " +
                          frame.method);
            }
            return;
        }
        case protocol::rpc::FrameKind::Notification:
            LOG_DEBUG("ServerConnection[" + spec_.id + "]: notification " + frame.method);
            return;
    }
}

void ServerConnection::handle_stderr_line(const std::string& line) {
    LOG_DEBUG("[" + spec_.id + " stderr] " + line);
    std::lock_guard<std::mutex> lock(mutex_);
    last_stderr_ = line;
}

void ServerConnection::reader_loop() {
    const int out_fd = process_->stdout_fd();
    const int err_fd = process_->stderr_fd();
    bool out_open = true;
    bool err_open = true;
    std::string out_buffer;
    std::string err_buffer;
    char chunk[4096];

    auto split_lines = [](std::string& buffer, auto&& on_line) {
        std::size_t newline = 0;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty()) {
                on_line(line);
            }
        }
    };

    while (out_open && !stop_reader_.load()) {
        pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds].fd = out_fd;
        fds[nfds].events = POLLIN;
        ++nfds;
        if (err_open) {
            fds[nfds].fd = err_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        const int ready = poll(fds, nfds, kReaderPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("ServerConnection[" + spec_.id + "]: poll failed");
            break;
        }
        if (ready == 0) {
            continue;
        }

        if (err_open && nfds > 1 && fds[1].revents != 0) {
            const ssize_t n = read(err_fd, chunk, sizeof(chunk));
            if (n > 0) {
                err_buffer.append(chunk, static_cast<std::size_t>(n));
                split_lines(err_buffer, [this](const std::string& line) {
                    handle_stderr_line(line);
                });
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                err_open = false;
            }
        }

        if (fds[0].revents != 0) {
            const ssize_t n = read(out_fd, chunk, sizeof(chunk));
            if (n > 0) {
                out_buffer.append(chunk, static_cast<std::size_t>(n));
                split_lines(out_buffer, [this](const std::string& line) { handle_line(line); });
                if (out_buffer.size() > kMaxFrameBytes) {
                    ++protocol_errors_;
                    LOG_WARN("ServerConnection[" + spec_.id +
                             "]: discarding oversized frame without newline");
                    out_buffer.clear();
                }
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                out_open = false;
            }
        }
    }

    if (!stop_reader_.load()) {
        LOG_WARN("ServerConnection[" + spec_.id + "]: worker output closed");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transition_locked(ConnectionState::Closed);
    }
    fail_all_pending(FabricError{ErrorCategory::ConnectionLost,
                                 "Connection to server '" + spec_.id + "' was lost.",
                                 "connection_lost"});
}

void ServerConnection::close() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (torn_down_) {
        return;
    }
    torn_down_ = true;

    transition(ConnectionState::Closed);
    fail_all_pending(FabricError{ErrorCategory::ConnectionLost,
                                 "Connection to server '" + spec_.id + "' was closed.",
                                 "connection_closed"});

    stop_reader_ = true;
    if (process_) {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        const int code = process_->terminate(options_.shutdown_grace);
        LOG_DEBUG("ServerConnection[" + spec_.id + "]: worker exited with code " +
                  std::to_string(code));
    }
    if (reader_.joinable()) {
        reader_.join();
    }
}

}  // namespace fabric::mesh
