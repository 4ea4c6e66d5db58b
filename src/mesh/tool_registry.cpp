#include "mesh/tool_registry.hpp"

#include <algorithm>
#include <future>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"

namespace fabric::mesh {

using core::errors::ErrorCategory;
using core::errors::FabricError;

std::string ToolRegistry::qualify(const std::string& server_id, const std::string& tool_name) {
    return server_id + "." + tool_name;
}

std::shared_ptr<const ToolRegistry> ToolRegistry::empty() {
    return std::shared_ptr<const ToolRegistry>(new ToolRegistry());
}

std::shared_ptr<const ToolRegistry> ToolRegistry::build(
    const std::vector<std::shared_ptr<ToolEndpoint>>& endpoints,
    std::vector<FabricError>* failures) {
    using Listing = core::errors::Result<std::vector<protocol::ToolDescriptor>>;

    std::vector<std::pair<std::shared_ptr<ToolEndpoint>, std::future<Listing>>> listings;
    for (const auto& endpoint : endpoints) {
        if (!endpoint || endpoint->state() == ConnectionState::Closed) {
            continue;
        }
        listings.emplace_back(endpoint, std::async(std::launch::async, [endpoint]() {
                                  return endpoint->list_tools();
                              }));
    }

    std::vector<Entry> collected;
    for (auto& [endpoint, future] : listings) {
        auto listing = future.get();
        if (core::errors::is_error(listing)) {
            const auto& error = core::errors::get_error(listing);
            LOG_WARN("ToolRegistry: excluding server '" + endpoint->server_id() +
                     "': " + error.message);
            if (failures != nullptr) {
                failures->push_back(error);
            }
            continue;
        }

        std::set<std::string> seen;
        for (auto& descriptor : core::errors::get_value(listing)) {
            if (!seen.insert(descriptor.name).second) {
                LOG_WARN("ToolRegistry: server '" + endpoint->server_id() +
                         "' advertises '" + descriptor.name + "' twice; keeping the first");
                continue;
            }
            descriptor.server_id = endpoint->server_id();
            collected.push_back(Entry{std::move(descriptor), endpoint});
        }
    }

    // Independent of endpoint order: the merged set is sorted before naming.
    std::sort(collected.begin(), collected.end(), [](const Entry& a, const Entry& b) {
        if (a.descriptor.name != b.descriptor.name) {
            return a.descriptor.name < b.descriptor.name;
        }
        return a.descriptor.server_id < b.descriptor.server_id;
    });

    // A name offered by several servers is exposed as server.tool. A dotted
    // plain name can land on one of those, so repeat until no exposed name is
    // shared; already-qualified entries keep their name.
    std::vector<bool> qualified(collected.size(), false);
    for (auto& entry : collected) {
        entry.descriptor.qualified_name = entry.descriptor.name;
    }
    bool renamed = true;
    while (renamed) {
        renamed = false;
        std::map<std::string, std::vector<std::size_t>> claims;
        for (std::size_t i = 0; i < collected.size(); ++i) {
            claims[collected[i].descriptor.qualified_name].push_back(i);
        }
        for (const auto& [name, claimants] : claims) {
            if (claimants.size() < 2) {
                continue;
            }
            for (const std::size_t i : claimants) {
                if (qualified[i]) {
                    continue;
                }
                auto& descriptor = collected[i].descriptor;
                descriptor.qualified_name = qualify(descriptor.server_id, descriptor.name);
                qualified[i] = true;
                renamed = true;
                LOG_DEBUG("ToolRegistry: '" + name + "' is claimed by several tools; exposing " +
                          descriptor.qualified_name);
            }
        }
    }

    std::shared_ptr<ToolRegistry> registry(new ToolRegistry());
    for (auto& entry : collected) {
        const std::string exposed = entry.descriptor.qualified_name;
        if (registry->entries_.count(exposed) != 0) {
            // Only reachable when two server ids and tool names concatenate alike.
            LOG_ERROR("ToolRegistry: name '" + exposed + "' from server '" +
                      entry.descriptor.server_id + "' is ambiguous; skipping");
            continue;
        }
        registry->entries_.emplace(exposed, std::move(entry));
    }

    for (const auto& [exposed, entry] : registry->entries_) {
        const std::string alias = qualify(entry.descriptor.server_id, entry.descriptor.name);
        if (alias != exposed && registry->entries_.count(alias) == 0) {
            registry->aliases_.emplace(alias, exposed);
        }
    }

    LOG_INFO("ToolRegistry: built catalog with " + std::to_string(registry->entries_.size()) +
             " tools from " + std::to_string(listings.size()) + " servers");
    return registry;
}

core::errors::Result<ToolRegistry::Entry> ToolRegistry::resolve(const std::string& name) const {
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        return it->second;
    }

    auto alias = aliases_.find(name);
    if (alias != aliases_.end()) {
        return entries_.at(alias->second);
    }

    return FabricError{ErrorCategory::UnknownTool, "unknown tool: " + name, "unknown_tool",
                       "Use one of the names from the tool catalog."};
}

std::vector<protocol::ToolDescriptor> ToolRegistry::describe_all() const {
    std::vector<protocol::ToolDescriptor> catalog;
    catalog.reserve(entries_.size());
    for (const auto& [exposed, entry] : entries_) {
        catalog.push_back(entry.descriptor);
    }
    return catalog;
}

std::vector<std::string> ToolRegistry::server_ids() const {
    std::set<std::string> ids;
    for (const auto& [exposed, entry] : entries_) {
        ids.insert(entry.descriptor.server_id);
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

}  // namespace fabric::mesh
