#pragma once

#include "archmcp/server/provider.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace archmcp {

// ─────────────────────────────────────────────────────────────────────────────
// CapabilityRegistry - tool name / resource URI to owning provider
// ─────────────────────────────────────────────────────────────────────────────
//
// Readers share the lock; registration is exclusive. The lock only guards
// lookups: it is released before a provider handler is awaited, so a slow
// tool never holds up registration or other lookups. Providers are never
// removed, which keeps the looked-up pointer valid.

class CapabilityRegistry {
public:
    CapabilityRegistry() = default;

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    /// Add a provider and all of its declarations, or nothing. Fails with a
    /// Configuration error on a duplicate provider name, or on a tool name or
    /// resource URI already claimed (including twice by the provider itself).
    [[nodiscard]] Result<void> register_provider(std::unique_ptr<IProvider> provider);

    /// All tools, in provider registration order
    [[nodiscard]] std::vector<Tool> list_tools() const;

    /// All resources, in provider registration order
    [[nodiscard]] std::vector<Resource> list_resources() const;

    [[nodiscard]] bool has_tool(const std::string& name) const;
    [[nodiscard]] bool has_resource(const std::string& uri) const;

    [[nodiscard]] std::size_t provider_count() const;

    /// Run a tool on its owning provider. NotFound if no provider claims it;
    /// provider errors pass through unchanged.
    [[nodiscard]] asio::awaitable<Result<ToolResult>> execute_tool(const std::string& name, ToolArgs args);

    [[nodiscard]] asio::awaitable<Result<std::string>> read_resource(const std::string& uri);

private:
    struct Entry {
        std::unique_ptr<IProvider> provider;
        std::string name;
        std::vector<Tool> tools;
        std::vector<Resource> resources;
    };

    [[nodiscard]] IProvider* find_tool_owner(const std::string& name) const;
    [[nodiscard]] IProvider* find_resource_owner(const std::string& uri) const;

    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> tool_owner_;
    std::unordered_map<std::string, std::size_t> resource_owner_;
};

}  // namespace archmcp
