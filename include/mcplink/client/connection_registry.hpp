#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection Registry
// ═══════════════════════════════════════════════════════════════════════════
// Named set of live connections. Owned by the application and passed to
// whoever needs lookups; there is no process-wide instance.
//
// Mutations happen under one lock. Connection::stop() and the change
// callback always run after the lock is released, so a callback may call
// back into the registry.
//
// Usage:
//   ConnectionRegistry registry;
//   registry.add(conn);
//   if (auto match = registry.find_tool("read_file")) {
//       invoke(*match->connection, match->tool.name, {"/etc/hosts"});
//   }
//   registry.stop_all();

#include "mcplink/client/client_error.hpp"
#include "mcplink/client/connection.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

/// A tool found in some registered connection's catalog
struct ToolMatch {
    std::shared_ptr<Connection> connection;
    Tool tool;
};

class ConnectionRegistry {
public:
    enum class Change { Added, Removed };

    using ChangeCallback = std::function<void(Change change, const std::string& name)>;

    ConnectionRegistry() = default;
    ~ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;
    ConnectionRegistry(ConnectionRegistry&&) = delete;
    ConnectionRegistry& operator=(ConnectionRegistry&&) = delete;

    /// Register under connection->name(). Fails if the name is taken.
    [[nodiscard]] ClientResult<void> add(std::shared_ptr<Connection> connection);

    [[nodiscard]] std::shared_ptr<Connection> find(std::string_view name) const;

    /// Unregister without stopping; returns the connection if there was one
    std::shared_ptr<Connection> remove(std::string_view name);

    /// Unregister and stop. Returns false if the name was unknown.
    bool stop(std::string_view name);

    /// Unregister and stop everything, in name order
    void stop_all();

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    /// First connected server, in name order, whose cached catalog has `tool_name`
    [[nodiscard]] std::optional<ToolMatch> find_tool(std::string_view tool_name) const;

    void on_change(ChangeCallback callback);

private:
    void notify(Change change, const std::string& name) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>, std::less<>> connections_;
    ChangeCallback on_change_;
};

}  // namespace mcplink
