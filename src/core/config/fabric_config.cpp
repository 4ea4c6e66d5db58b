#include "core/config/fabric_config.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <utility>

namespace fabric::core::config {

using errors::ErrorCategory;
using errors::FabricError;
using nlohmann::json;

namespace {

FabricError invalid(const std::string& message, const std::string& code = "invalid_config") {
    return FabricError{ErrorCategory::Input, message, code};
}

// Reads an optional non-negative integer field into target.
std::optional<FabricError> read_limit(const json& limits, const char* key,
                                      std::uint32_t& target) {
    if (!limits.contains(key)) {
        return std::nullopt;
    }
    const auto& value = limits[key];
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0 ||
        value.get<std::int64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        return invalid(std::string("limits.") + key + " must be a non-negative integer.",
                       "invalid_limits");
    }
    target = value.get<std::uint32_t>();
    return std::nullopt;
}

errors::Result<protocol::ServerSpec> parse_server(const std::string& id, const json& entry,
                                                  const std::filesystem::path& base_dir) {
    if (!entry.is_object()) {
        return invalid("Server '" + id + "' must be an object.");
    }

    protocol::ServerSpec spec;
    spec.id = id;
    if (!entry.contains("command") || !entry["command"].is_string() ||
        entry["command"].get<std::string>().empty()) {
        return invalid("Server '" + id + "' needs a non-empty 'command'.", "missing_command");
    }
    spec.command = entry["command"].get<std::string>();

    if (entry.contains("args")) {
        if (!entry["args"].is_array()) {
            return invalid("Server '" + id + "': 'args' must be an array of strings.");
        }
        for (const auto& arg : entry["args"]) {
            if (!arg.is_string()) {
                return invalid("Server '" + id + "': 'args' must be an array of strings.");
            }
            spec.args.push_back(arg.get<std::string>());
        }
    }

    if (entry.contains("transport")) {
        if (!entry["transport"].is_string()) {
            return invalid("Server '" + id + "': 'transport' must be a string.");
        }
        spec.transport = entry["transport"].get<std::string>();
    }
    if (spec.transport != "stdio") {
        return FabricError{ErrorCategory::Input,
                           "Server '" + id + "' uses unsupported transport '" + spec.transport +
                               "'.",
                           "unsupported_transport", "Only \"stdio\" is supported."};
    }

    if (entry.contains("cwd")) {
        if (!entry["cwd"].is_string()) {
            return invalid("Server '" + id + "': 'cwd' must be a string.");
        }
        std::filesystem::path cwd = entry["cwd"].get<std::string>();
        spec.working_directory = cwd.is_relative() ? base_dir / cwd : cwd;
    }

    if (entry.contains("env")) {
        if (!entry["env"].is_object()) {
            return invalid("Server '" + id + "': 'env' must be an object of strings.");
        }
        for (const auto& [key, value] : entry["env"].items()) {
            if (!value.is_string()) {
                return invalid("Server '" + id + "': env value for '" + key +
                               "' must be a string.");
            }
            spec.env[key] = value.get<std::string>();
        }
    }
    return spec;
}

}  // namespace

errors::Result<Limits> validate_limits(const Limits& limits) {
    if (limits.call_timeout_ms == 0) {
        return invalid("call_timeout_ms must be greater than zero.", "invalid_limits");
    }
    if (limits.handshake_timeout_ms == 0) {
        return invalid("handshake_timeout_ms must be greater than zero.", "invalid_limits");
    }
    if (limits.handshake_timeout_ms > limits.call_timeout_ms) {
        return FabricError{ErrorCategory::Input,
                           "handshake_timeout_ms must not exceed call_timeout_ms.",
                           "invalid_limits",
                           "The handshake deadline is the shorter of the two."};
    }
    if (limits.max_in_flight == 0) {
        return invalid("max_in_flight must be greater than zero.", "invalid_limits");
    }
    return limits;
}

errors::Result<FabricConfig> parse_config(const json& document,
                                          const std::filesystem::path& base_dir) {
    if (!document.is_object()) {
        return invalid("Configuration must be a JSON object.");
    }

    const char* servers_key = document.contains("servers") ? "servers" : "mcpServers";
    if (!document.contains(servers_key) || !document[servers_key].is_object()) {
        return invalid("Configuration needs a 'servers' object.", "missing_servers");
    }

    FabricConfig config;
    // json objects iterate in key order, so servers come out sorted by id.
    for (const auto& [id, entry] : document[servers_key].items()) {
        auto spec = parse_server(id, entry, base_dir);
        if (errors::is_error(spec)) {
            return errors::get_error(spec);
        }
        config.servers.push_back(errors::get_value(spec));
    }

    if (document.contains("limits")) {
        const auto& limits = document["limits"];
        if (!limits.is_object()) {
            return invalid("'limits' must be an object.", "invalid_limits");
        }
        const std::pair<const char*, std::uint32_t*> fields[] = {
            {"call_timeout_ms", &config.limits.call_timeout_ms},
            {"handshake_timeout_ms", &config.limits.handshake_timeout_ms},
            {"max_in_flight", &config.limits.max_in_flight},
            {"max_iterations", &config.limits.max_iterations},
            {"shutdown_grace_ms", &config.limits.shutdown_grace_ms}};
        for (const auto& [key, target] : fields) {
            if (auto error = read_limit(limits, key, *target)) {
                return error.value();
            }
        }
    }

    auto validated = validate_limits(config.limits);
    if (errors::is_error(validated)) {
        return errors::get_error(validated);
    }
    return config;
}

errors::Result<FabricConfig> load_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return FabricError{ErrorCategory::Input, "Cannot open config file: " + path.string(),
                           "config_open_failed", "Pass an existing file with --config."};
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return invalid("Config file is not valid JSON: " + path.string(), "config_parse_failed");
    }

    std::error_code ec;
    std::filesystem::path base_dir = std::filesystem::absolute(path, ec).parent_path();
    if (ec) {
        base_dir = path.parent_path();
    }
    return parse_config(document, base_dir);
}

} // namespace fabric::core::config
