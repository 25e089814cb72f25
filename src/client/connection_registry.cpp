#include "mcplink/client/connection_registry.hpp"
#include "mcplink/log/logger.hpp"

namespace mcplink {

ClientResult<void> ConnectionRegistry::add(std::shared_ptr<Connection> connection) {
    if (!connection) {
        return tl::unexpected(ClientError::protocol_error("Cannot register a null connection"));
    }

    const std::string name = connection->name();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = connections_.emplace(name, std::move(connection));
        if (!inserted) {
            return tl::unexpected(ClientError::protocol_error(
                "A connection named '" + name + "' is already registered"));
        }
    }

    MCPLINK_LOG_DEBUG("Registered connection '" + name + "'");
    notify(Change::Added, name);
    return {};
}

std::shared_ptr<Connection> ConnectionRegistry::find(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(name);
    return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<Connection> ConnectionRegistry::remove(std::string_view name) {
    std::shared_ptr<Connection> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end()) {
            return nullptr;
        }
        removed = std::move(it->second);
        connections_.erase(it);
    }

    MCPLINK_LOG_DEBUG("Unregistered connection '" + removed->name() + "'");
    notify(Change::Removed, removed->name());
    return removed;
}

bool ConnectionRegistry::stop(std::string_view name) {
    auto connection = remove(name);
    if (!connection) {
        return false;
    }
    connection->stop();
    return true;
}

void ConnectionRegistry::stop_all() {
    std::map<std::string, std::shared_ptr<Connection>, std::less<>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(connections_);
    }

    for (auto& [name, connection] : all) {
        connection->stop();
        notify(Change::Removed, name);
    }
}

std::vector<std::string> ConnectionRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(connections_.size());
    for (const auto& entry : connections_) {
        result.push_back(entry.first);
    }
    return result;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

bool ConnectionRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.empty();
}

std::optional<ToolMatch> ConnectionRegistry::find_tool(std::string_view tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, connection] : connections_) {
        if (!connection->is_connected()) {
            continue;
        }
        if (const Tool* tool = connection->catalog().find_tool(tool_name)) {
            return ToolMatch{connection, *tool};
        }
    }
    return std::nullopt;
}

void ConnectionRegistry::on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_change_ = std::move(callback);
}

void ConnectionRegistry::notify(Change change, const std::string& name) const {
    ChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_change_;
    }
    if (!callback) {
        return;
    }
    try {
        callback(change, name);
    } catch (const std::exception& e) {
        MCPLINK_LOG_ERROR("Registry change callback threw: " + std::string(e.what()));
    }
}

}  // namespace mcplink
