#include "mesh/dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <optional>
#include "core/logging/logger.hpp"

namespace fabric::mesh {

using core::errors::ErrorCategory;
using core::errors::FabricError;
using protocol::ToolCall;
using protocol::ToolResult;

namespace {

const FabricError kCancelled{ErrorCategory::Cancelled, "cancelled", "cancelled"};

bool is_cancelled(const std::shared_ptr<std::atomic_bool>& cancel_token) {
    return cancel_token && cancel_token->load();
}

}  // namespace

Dispatcher::Dispatcher(DispatcherOptions options) : options_(options) {
    if (options_.max_in_flight == 0) {
        options_.max_in_flight = 1;
    }
}

ToolResult Dispatcher::execute_one(const ToolRegistry& registry, const ToolCall& call,
                                   const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    if (is_cancelled(cancel_token)) {
        return protocol::make_failed_result(call, kCancelled);
    }

    auto resolved = registry.resolve(call.name);
    if (core::errors::is_error(resolved)) {
        LOG_WARN("Dispatcher: " + core::errors::get_error(resolved).message);
        return protocol::make_failed_result(call, core::errors::get_error(resolved));
    }

    const auto& entry = core::errors::get_value(resolved);
    const auto started = std::chrono::steady_clock::now();
    LOG_DEBUG("Dispatcher: call " + call.id + " -> " + entry.descriptor.server_id + "/" +
              entry.descriptor.name);

    auto invoked = entry.endpoint->invoke(entry.descriptor.name, call.arguments,
                                          options_.call_timeout, cancel_token);
    const double duration_ms = std::chrono::duration<double, std::milli>(
                                   std::chrono::steady_clock::now() - started)
                                   .count();
    if (core::errors::is_error(invoked)) {
        const auto& error = core::errors::get_error(invoked);
        LOG_WARN("Dispatcher: call " + call.id + " (" + call.name + ") failed: " + error.message);
        return protocol::make_failed_result(call, error, duration_ms);
    }

    ToolResult result = core::errors::get_value(invoked);
    result.call_id = call.id;
    result.tool_name = call.name;
    result.duration_ms = duration_ms;
    return result;
}

std::vector<ToolResult> Dispatcher::execute(const ToolRegistry& registry,
                                            const std::vector<ToolCall>& calls,
                                            std::shared_ptr<std::atomic_bool> cancel_token) const {
    std::vector<std::optional<ToolResult>> slots(calls.size());
    std::atomic<std::size_t> next_index{0};

    // Each worker claims the next unclaimed call, so at most max_in_flight
    // invocations are outstanding and a slow call never holds up its siblings.
    auto worker = [&]() {
        while (true) {
            const std::size_t index = next_index.fetch_add(1);
            if (index >= calls.size()) {
                return;
            }
            // A worker payload that trips the JSON library must not escape the batch.
            try {
                slots[index] = execute_one(registry, calls[index], cancel_token);
            } catch (const std::exception& e) {
                LOG_ERROR("Dispatcher: call " + calls[index].id + " raised: " + e.what());
                slots[index] = protocol::make_failed_result(
                    calls[index],
                    FabricError{ErrorCategory::Protocol, e.what(), "unexpected_exception"});
            }
        }
    };

    const std::size_t workers = std::min(options_.max_in_flight, calls.size());
    std::vector<std::future<void>> running;
    running.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        running.push_back(std::async(std::launch::async, worker));
    }
    for (auto& future : running) {
        future.get();
    }

    std::vector<ToolResult> results;
    results.reserve(calls.size());
    for (std::size_t i = 0; i < calls.size(); ++i) {
        if (slots[i].has_value()) {
            results.push_back(std::move(slots[i].value()));
        } else {
            results.push_back(protocol::make_failed_result(calls[i], kCancelled));
        }
    }

    const auto failed = std::count_if(results.begin(), results.end(),
                                      [](const ToolResult& r) { return !r.success; });
    LOG_INFO("Dispatcher: batch of " + std::to_string(calls.size()) + " calls finished, " +
             std::to_string(failed) + " failed");
    return results;
}

}  // namespace fabric::mesh
