#include "mcplink/client/request_correlator.hpp"
#include "mcplink/log/logger.hpp"

#include <algorithm>
#include <exception>

namespace mcplink {

RequestCorrelator::RequestCorrelator(Dispatcher dispatch)
    : dispatch_(std::move(dispatch))
{}

std::int64_t RequestCorrelator::register_call(std::string method, Continuation on_complete) {
    const std::int64_t id = ++last_id_;
    pending_.emplace(id, PendingCall{
        id,
        std::move(method),
        std::move(on_complete),
        std::chrono::steady_clock::now()
    });
    return id;
}

bool RequestCorrelator::complete(std::int64_t id, ClientResult<Json> outcome) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        get_logger().warn_fmt("Discarding reply for unknown request id {}", id);
        return false;
    }

    PendingCall call = std::move(it->second);
    pending_.erase(it);
    deliver(std::move(call), std::move(outcome));
    return true;
}

bool RequestCorrelator::complete(const JsonRpcReply& reply) {
    if (!reply.id().has_value()) {
        if (reply.is_error()) {
            MCPLINK_LOG_WARN("Discarding error reply without id: " + reply.error().message);
        } else {
            MCPLINK_LOG_WARN("Discarding reply without id");
        }
        return false;
    }
    if (!reply.id()->is_integer()) {
        get_logger().warn_fmt("Discarding reply for unknown request id {}", reply.id()->to_string());
        return false;
    }

    const std::int64_t id = reply.id()->as_integer();
    if (reply.is_error()) {
        const auto& err = reply.error();
        return complete(id, tl::unexpected(ClientError::from_rpc_error(McpError{err.code, err.message, err.data})));
    }
    return complete(id, reply.result());
}

bool RequestCorrelator::cancel(std::int64_t id, std::string reason) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    PendingCall call = std::move(it->second);
    pending_.erase(it);
    deliver(std::move(call), tl::unexpected(ClientError::cancelled(std::move(reason))));
    return true;
}

bool RequestCorrelator::forget(std::int64_t id) {
    return pending_.erase(id) > 0;
}

std::size_t RequestCorrelator::fail_all(const ClientError& error) {
    // Deliver in id order so waiters see failures in the order they asked
    std::vector<PendingCall> calls;
    calls.reserve(pending_.size());
    for (auto& [id, call] : pending_) {
        calls.push_back(std::move(call));
    }
    pending_.clear();

    std::sort(calls.begin(), calls.end(),
              [](const PendingCall& a, const PendingCall& b) { return a.id < b.id; });

    for (auto& call : calls) {
        deliver(std::move(call), tl::unexpected(error));
    }
    return calls.size();
}

bool RequestCorrelator::is_pending(std::int64_t id) const {
    return pending_.find(id) != pending_.end();
}

std::vector<std::int64_t> RequestCorrelator::pending_ids() const {
    std::vector<std::int64_t> ids;
    ids.reserve(pending_.size());
    for (const auto& [id, call] : pending_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::string RequestCorrelator::method_of(std::int64_t id) const {
    auto it = pending_.find(id);
    return it == pending_.end() ? std::string{} : it->second.method;
}

void RequestCorrelator::deliver(PendingCall call, ClientResult<Json> outcome) {
    if (!call.on_complete) {
        return;
    }

    Task task = [continuation = std::move(call.on_complete),
                 result = std::move(outcome),
                 id = call.id,
                 method = std::move(call.method)]() mutable {
        try {
            continuation(std::move(result));
        } catch (const std::exception& e) {
            MCPLINK_LOG_ERROR("Continuation for " + method + " (id " + std::to_string(id) +
                              ") threw: " + e.what());
        }
    };

    if (dispatch_) {
        dispatch_(std::move(task));
    } else {
        task();
    }
}

}  // namespace mcplink
