#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Single error type for everything above the message codec. Synchronous calls
// return it in the unexpected branch; asynchronous calls hand the same
// ClientResult to their continuation.

#include "mcplink/protocol/mcp_types.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcplink {

enum class ClientErrorCode {
    NotConnected,      ///< Connection is not in the connected state
    TransportError,    ///< Write failed or the stream broke
    ProtocolError,     ///< Malformed reply or negotiation failure
    RpcError,          ///< Server answered with an error object
    VersionMismatch,   ///< Server negotiated a different protocol version
    ArgumentMismatch,  ///< Positional arguments do not fit the tool schema
    NotFound,          ///< No tool/prompt/resource by that name in the catalog
    ConnectionClosed,  ///< Connection torn down while the call was pending
    Cancelled          ///< Caller cancelled the call
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::NotConnected:     return "NotConnected";
        case ClientErrorCode::TransportError:   return "TransportError";
        case ClientErrorCode::ProtocolError:    return "ProtocolError";
        case ClientErrorCode::RpcError:         return "RpcError";
        case ClientErrorCode::VersionMismatch:  return "VersionMismatch";
        case ClientErrorCode::ArgumentMismatch: return "ArgumentMismatch";
        case ClientErrorCode::NotFound:         return "NotFound";
        case ClientErrorCode::ConnectionClosed: return "ConnectionClosed";
        case ClientErrorCode::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<McpError> rpc_error;  ///< Server-provided error, when there is one

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError not_connected() {
        return {ClientErrorCode::NotConnected, "Connection is not established", std::nullopt};
    }

    [[nodiscard]] static ClientError transport_error(std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError version_mismatch(std::string_view expected, std::string_view actual) {
        return {
            ClientErrorCode::VersionMismatch,
            "Protocol version mismatch: expected " + std::string(expected) +
                ", server returned " + std::string(actual),
            std::nullopt
        };
    }

    [[nodiscard]] static ClientError argument_mismatch(std::string msg) {
        return {ClientErrorCode::ArgumentMismatch, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError not_found(std::string msg) {
        return {ClientErrorCode::NotFound, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static ClientError connection_closed() {
        return {ClientErrorCode::ConnectionClosed, "Connection closed before reply", std::nullopt};
    }

    [[nodiscard]] static ClientError cancelled(std::string reason = "Request was cancelled") {
        return {ClientErrorCode::Cancelled, std::move(reason), std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(const McpError& err) {
        return {ClientErrorCode::RpcError, err.message, err};
    }

    /// "message" or "[code] message" when the server supplied a code
    [[nodiscard]] std::string describe() const {
        if (rpc_error) {
            return "[" + std::to_string(rpc_error->code) + "] " + message;
        }
        return std::string(to_string(code)) + ": " + message;
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcplink
