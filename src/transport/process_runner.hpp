#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/fabric_errors.hpp"

namespace fabric::transport {

struct ProcessRequest {
    std::string command;  // run through /bin/sh -c
    std::string stdin_text;
    std::filesystem::path working_directory;  // empty: inherit
    std::uint32_t timeout_ms = 5000;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs a command to completion, feeding stdin_text and capturing both output
// streams. Timeouts and cancellation kill the child and are reported in the
// capture; only pipe/fork failures are errors.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

}  // namespace fabric::transport
