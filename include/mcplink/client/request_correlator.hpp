#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Request Correlator
// ═══════════════════════════════════════════════════════════════════════════
// Pending-call table for one connection. Each outbound request is registered
// under a fresh id; the matching reply removes the entry and hands its result
// to the call's single continuation.
//
// Replies are matched by id only. They may complete in any order relative to
// the order the requests were sent.
//
// The correlator does not run continuations itself when a dispatcher is
// supplied: every completion becomes one posted unit of work, so a throwing
// or re-entrant continuation cannot disturb delivery of other replies.

#include "mcplink/client/client_error.hpp"
#include "mcplink/protocol/json_rpc.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcplink {

class RequestCorrelator {
public:
    using Continuation = std::function<void(ClientResult<Json>)>;
    using Task = std::function<void()>;
    using Dispatcher = std::function<void(Task)>;

    struct PendingCall {
        std::int64_t id{};
        std::string method;
        Continuation on_complete;
        std::chrono::steady_clock::time_point created;
    };

    /// With no dispatcher, continuations run inline inside complete().
    explicit RequestCorrelator(Dispatcher dispatch = {});

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    /// Mint an id and register the call under it
    [[nodiscard]] std::int64_t register_call(std::string method, Continuation on_complete);

    /// Deliver a result. Returns false (and logs) when the id is not pending.
    bool complete(std::int64_t id, ClientResult<Json> outcome);

    /// Deliver a decoded reply, translating an error object into RpcError
    bool complete(const JsonRpcReply& reply);

    /// Complete with Cancelled. Returns false when the id is not pending.
    bool cancel(std::int64_t id, std::string reason);

    /// Drop a registration without delivering anything; used when the
    /// request could not be written and the caller is told directly.
    bool forget(std::int64_t id);

    /// Complete every pending call with `error`; returns how many there were
    std::size_t fail_all(const ClientError& error);

    [[nodiscard]] bool is_pending(std::int64_t id) const;
    [[nodiscard]] std::size_t pending_count() const noexcept { return pending_.size(); }
    [[nodiscard]] std::vector<std::int64_t> pending_ids() const;

    /// Method of a pending call, empty when unknown
    [[nodiscard]] std::string method_of(std::int64_t id) const;

private:
    void deliver(PendingCall call, ClientResult<Json> outcome);

    Dispatcher dispatch_;
    std::unordered_map<std::int64_t, PendingCall> pending_;
    std::int64_t last_id_{0};
};

}  // namespace mcplink
