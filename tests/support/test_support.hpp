#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "conversation/reasoner.hpp"
#include "core/config/conversation_id.hpp"
#include "mesh/tool_endpoint.hpp"
#include "protocol/server_spec.hpp"

namespace fabric::testing {

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& prefix = "workspace") {
        root_ = std::filesystem::temp_directory_path() /
                (".tmp_" + prefix + "_" + core::config::generate_conversation_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline protocol::ServerSpec fake_server_spec(const std::string& id,
                                             std::vector<std::string> extra_args = {}) {
    protocol::ServerSpec spec;
    spec.id = id;
    spec.command = FABRIC_FAKE_SERVER_PATH;
    spec.args = {"--name", id};
    spec.args.insert(spec.args.end(), extra_args.begin(), extra_args.end());
    return spec;
}

// In-process endpoint whose tools are plain functions.
class FakeEndpoint : public mesh::ToolEndpoint {
public:
    using Handler = std::function<core::errors::Result<protocol::ToolResult>(
        const nlohmann::json& arguments, const std::shared_ptr<std::atomic_bool>& cancel)>;

    explicit FakeEndpoint(std::string id) : id_(std::move(id)) {}

    void add_tool(const std::string& name, Handler handler, const std::string& description = "") {
        protocol::ToolDescriptor descriptor;
        descriptor.name = name;
        descriptor.description = description;
        tools_.push_back(descriptor);
        handlers_[name] = std::move(handler);
    }

    // Answers with text after delay, returning early once cancelled.
    void add_sleepy_tool(const std::string& name, std::chrono::milliseconds delay,
                         const std::string& text) {
        add_tool(name, [delay, text, name](const nlohmann::json&,
                                           const std::shared_ptr<std::atomic_bool>& cancel)
                           -> core::errors::Result<protocol::ToolResult> {
            const auto deadline = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < deadline) {
                if (cancel && cancel->load()) {
                    return core::errors::FabricError{core::errors::ErrorCategory::Cancelled,
                                                     "cancelled", "cancelled"};
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            protocol::ToolResult result;
            result.tool_name = name;
            result.success = true;
            result.output = text;
            return result;
        });
    }

    void set_state(mesh::ConnectionState state) { state_ = state; }
    void fail_listing(core::errors::FabricError error) { listing_error_ = std::move(error); }

    const std::string& server_id() const override { return id_; }
    mesh::ConnectionState state() const override { return state_.load(); }

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools() override {
        ++list_calls_;
        if (listing_error_) {
            return listing_error_.value();
        }
        return tools_;
    }

    core::errors::Result<protocol::ToolResult> invoke(
        const std::string& name, const nlohmann::json& arguments,
        std::chrono::milliseconds /*timeout*/,
        const std::shared_ptr<std::atomic_bool>& cancel_token) override {
        const int now = ++in_flight_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            peak_in_flight_ = std::max(peak_in_flight_, now);
            invoked_.push_back(name);
        }
        auto it = handlers_.find(name);
        core::errors::Result<protocol::ToolResult> outcome =
            it == handlers_.end()
                ? core::errors::Result<protocol::ToolResult>(core::errors::FabricError{
                      core::errors::ErrorCategory::Execution, "no handler for " + name,
                      "rpc_error"})
                : it->second(arguments, cancel_token);
        --in_flight_;
        return outcome;
    }

    int peak_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_in_flight_;
    }

    std::vector<std::string> invoked() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return invoked_;
    }

    int list_calls() const { return list_calls_.load(); }

private:
    std::string id_;
    std::atomic<mesh::ConnectionState> state_{mesh::ConnectionState::Ready};
    std::vector<protocol::ToolDescriptor> tools_;
    std::map<std::string, Handler> handlers_;
    std::optional<core::errors::FabricError> listing_error_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> list_calls_{0};
    mutable std::mutex mutex_;
    int peak_in_flight_ = 0;
    std::vector<std::string> invoked_;
};

inline protocol::ToolResult text_result(const std::string& text) {
    protocol::ToolResult result;
    result.success = true;
    result.output = text;
    return result;
}

// Reasoner driven by a callback; records every history and catalog it saw.
class CallbackReasoner : public conversation::Reasoner {
public:
    using Callback = std::function<core::errors::Result<protocol::ReasonerOutput>(
        const std::vector<protocol::Message>&, const std::vector<protocol::ToolDescriptor>&)>;

    explicit CallbackReasoner(Callback callback) : callback_(std::move(callback)) {}

    core::errors::Result<protocol::ReasonerOutput> reason(
        const std::vector<protocol::Message>& history,
        const std::vector<protocol::ToolDescriptor>& catalog) override {
        ++calls_;
        catalogs_.push_back(catalog);
        return callback_(history, catalog);
    }

    int calls() const { return calls_; }
    const std::vector<std::vector<protocol::ToolDescriptor>>& catalogs() const { return catalogs_; }

private:
    Callback callback_;
    int calls_ = 0;
    std::vector<std::vector<protocol::ToolDescriptor>> catalogs_;
};

inline protocol::ToolCall make_call(const std::string& name,
                                    nlohmann::json arguments = nlohmann::json::object(),
                                    const std::string& id = "") {
    protocol::ToolCall call;
    call.id = id;
    call.name = name;
    call.arguments = std::move(arguments);
    return call;
}

inline protocol::ReasonerOutput wants(std::vector<protocol::ToolCall> calls) {
    protocol::ReasonerOutput output;
    output.tool_calls = std::move(calls);
    return output;
}

inline protocol::ReasonerOutput answers(const std::string& text) {
    protocol::ReasonerOutput output;
    output.text = text;
    return output;
}

}  // namespace fabric::testing
