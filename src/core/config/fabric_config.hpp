#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/fabric_errors.hpp"
#include "protocol/server_spec.hpp"

namespace fabric::core::config {

    struct Limits {
        std::uint32_t call_timeout_ms = 30000;
        std::uint32_t handshake_timeout_ms = 5000;
        std::uint32_t max_in_flight = 4;
        std::uint32_t max_iterations = 25;  // 0 = unbounded
        std::uint32_t shutdown_grace_ms = 2000;
    };

    struct FabricConfig {
        std::vector<protocol::ServerSpec> servers;  // ordered by id
        Limits limits;
    };

    // Relative server working directories resolve against base_dir.
    errors::Result<FabricConfig> parse_config(const nlohmann::json& document,
                                              const std::filesystem::path& base_dir);

    errors::Result<FabricConfig> load_config(const std::filesystem::path& path);

    errors::Result<Limits> validate_limits(const Limits& limits);

} // namespace fabric::core::config
