#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/fabric_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace fabric::protocol::rpc {

// Newline-delimited JSON-RPC 2.0, as spoken by stdio tool servers.
inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kMethodInitialize = "initialize";
inline constexpr const char* kMethodInitialized = "notifications/initialized";
inline constexpr const char* kMethodCancelled = "notifications/cancelled";
inline constexpr const char* kMethodListTools = "tools/list";
inline constexpr const char* kMethodCallTool = "tools/call";

enum class FrameKind {
    Response,
    Request,
    Notification
};

struct RpcError {
    std::int64_t code = 0;
    std::string message;
};

struct Frame {
    FrameKind kind = FrameKind::Notification;
    std::optional<std::int64_t> id;
    std::string method;
    nlohmann::json params;
    nlohmann::json result;
    std::optional<RpcError> error;
};

struct ToolPage {
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> next_cursor;
};

std::string encode_request(std::int64_t id, const std::string& method,
                           const nlohmann::json& params);
std::string encode_notification(const std::string& method,
                                const nlohmann::json& params);
std::string encode_result(std::int64_t id, const nlohmann::json& result);
std::string encode_error(std::int64_t id, std::int64_t code, const std::string& message);

// Parses one line. Anything that is not a JSON-RPC object is a Protocol error.
core::errors::Result<Frame> decode_frame(const std::string& line);

nlohmann::json make_initialize_params(const std::string& client_name,
                                      const std::string& client_version);

core::errors::Result<ToolPage> parse_tool_page(const nlohmann::json& result,
                                               const std::string& server_id);

// Folds a tools/call result into the text/structured/success fields of out.
void apply_call_result(const nlohmann::json& result, ToolResult& out);

}  // namespace fabric::protocol::rpc
