#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/fabric_errors.hpp"
#include "mesh/tool_endpoint.hpp"
#include "protocol/tool_contract.hpp"

namespace fabric::mesh {

// Immutable, flat catalog over every endpoint's tools. Topology changes build
// a new registry; an existing one is never modified, so readers holding a
// snapshot always see a complete catalog.
class ToolRegistry {
public:
    struct Entry {
        protocol::ToolDescriptor descriptor;
        std::shared_ptr<ToolEndpoint> endpoint;
    };

    // Lists tools on every non-closed endpoint in parallel. Endpoints whose
    // listing fails are left out and reported through failures.
    static std::shared_ptr<const ToolRegistry> build(
        const std::vector<std::shared_ptr<ToolEndpoint>>& endpoints,
        std::vector<core::errors::FabricError>* failures = nullptr);

    static std::shared_ptr<const ToolRegistry> empty();

    // Accepts the exposed name or the "server.tool" form of any tool.
    core::errors::Result<Entry> resolve(const std::string& name) const;

    // Sorted by qualified name.
    std::vector<protocol::ToolDescriptor> describe_all() const;

    std::size_t size() const { return entries_.size(); }
    std::vector<std::string> server_ids() const;

    static std::string qualify(const std::string& server_id, const std::string& tool_name);

private:
    ToolRegistry() = default;

    std::map<std::string, Entry> entries_;
    std::map<std::string, std::string> aliases_;
};

}  // namespace fabric::mesh
