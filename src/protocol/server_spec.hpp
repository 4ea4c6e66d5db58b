#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fabric::protocol {

    // Declarative description of one worker process.
    struct ServerSpec {
        std::string id;
        std::string command;
        std::vector<std::string> args;
        std::string transport = "stdio";
        std::filesystem::path working_directory;  // empty: inherit
        std::map<std::string, std::string> env;   // added to the inherited environment
    };

} // namespace fabric::protocol
