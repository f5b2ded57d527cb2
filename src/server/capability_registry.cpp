#include "archmcp/server/capability_registry.hpp"

#include "archmcp/log/logger.hpp"

#include <mutex>
#include <unordered_set>

namespace archmcp {

Result<void> CapabilityRegistry::register_provider(std::unique_ptr<IProvider> provider) {
    if (provider == nullptr) {
        return tl::unexpected(Error::configuration("cannot register a null provider"));
    }

    // Declarations are captured before taking the lock
    Entry entry;
    entry.name = provider->name();
    entry.tools = provider->tools();
    entry.resources = provider->resources();
    entry.provider = std::move(provider);

    std::unique_lock lock(mutex_);

    for (const auto& existing : entries_) {
        if (existing.name == entry.name) {
            return tl::unexpected(Error::configuration(
                "provider '" + entry.name + "' is already registered"));
        }
    }

    // Validate everything first so a rejected provider leaves no trace
    std::unordered_set<std::string> seen_tools;
    for (const auto& tool : entry.tools) {
        if (const auto it = tool_owner_.find(tool.name); it != tool_owner_.end()) {
            return tl::unexpected(Error::configuration(
                "tool '" + tool.name + "' from provider '" + entry.name +
                "' is already provided by '" + entries_[it->second].name + "'"));
        }
        if (seen_tools.insert(tool.name).second == false) {
            return tl::unexpected(Error::configuration(
                "provider '" + entry.name + "' declares tool '" + tool.name + "' twice"));
        }
    }

    std::unordered_set<std::string> seen_resources;
    for (const auto& resource : entry.resources) {
        if (const auto it = resource_owner_.find(resource.uri); it != resource_owner_.end()) {
            return tl::unexpected(Error::configuration(
                "resource '" + resource.uri + "' from provider '" + entry.name +
                "' is already provided by '" + entries_[it->second].name + "'"));
        }
        if (seen_resources.insert(resource.uri).second == false) {
            return tl::unexpected(Error::configuration(
                "provider '" + entry.name + "' declares resource '" + resource.uri + "' twice"));
        }
    }

    const std::size_t index = entries_.size();
    for (const auto& tool : entry.tools) {
        tool_owner_.emplace(tool.name, index);
    }
    for (const auto& resource : entry.resources) {
        resource_owner_.emplace(resource.uri, index);
    }

    get_logger().logf(LogLevel::Info, "registered provider '{}' ({} tools, {} resources)",
                      entry.name, entry.tools.size(), entry.resources.size());
    entries_.push_back(std::move(entry));
    return {};
}

std::vector<Tool> CapabilityRegistry::list_tools() const {
    std::shared_lock lock(mutex_);
    std::vector<Tool> tools;
    tools.reserve(tool_owner_.size());
    for (const auto& entry : entries_) {
        tools.insert(tools.end(), entry.tools.begin(), entry.tools.end());
    }
    return tools;
}

std::vector<Resource> CapabilityRegistry::list_resources() const {
    std::shared_lock lock(mutex_);
    std::vector<Resource> resources;
    resources.reserve(resource_owner_.size());
    for (const auto& entry : entries_) {
        resources.insert(resources.end(), entry.resources.begin(), entry.resources.end());
    }
    return resources;
}

bool CapabilityRegistry::has_tool(const std::string& name) const {
    return find_tool_owner(name) != nullptr;
}

bool CapabilityRegistry::has_resource(const std::string& uri) const {
    return find_resource_owner(uri) != nullptr;
}

std::size_t CapabilityRegistry::provider_count() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

IProvider* CapabilityRegistry::find_tool_owner(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto it = tool_owner_.find(name);
    return (it == tool_owner_.end()) ? nullptr : entries_[it->second].provider.get();
}

IProvider* CapabilityRegistry::find_resource_owner(const std::string& uri) const {
    std::shared_lock lock(mutex_);
    const auto it = resource_owner_.find(uri);
    return (it == resource_owner_.end()) ? nullptr : entries_[it->second].provider.get();
}

asio::awaitable<Result<ToolResult>> CapabilityRegistry::execute_tool(const std::string& name, ToolArgs args) {
    IProvider* owner = find_tool_owner(name);
    if (owner == nullptr) {
        co_return tl::unexpected(Error::not_found("Tool not found: " + name));
    }
    co_return co_await owner->handle_tool_call(name, std::move(args));
}

asio::awaitable<Result<std::string>> CapabilityRegistry::read_resource(const std::string& uri) {
    IProvider* owner = find_resource_owner(uri);
    if (owner == nullptr) {
        co_return tl::unexpected(Error::not_found("Resource not found: " + uri));
    }
    co_return co_await owner->handle_resource_read(uri);
}

}  // namespace archmcp
