#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stream Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// A duplex byte stream bound to an asio executor. The transport knows nothing
// about framing: inbound bytes are handed over in whatever chunks the OS
// delivers, and outbound writes are complete frames produced by the codec.
//
// Handlers are always invoked on the transport's executor.

#include "mcplink/transport.hpp"

#include <asio/any_io_executor.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mcplink {

class IStreamTransport {
public:
    /// Raw chunk of inbound bytes. The view is only valid during the call.
    using DataHandler = std::function<void(std::string_view)>;

    /// Fired once when the stream ends: EOF, read error, or child exit.
    using CloseHandler = std::function<void(const TransportError&)>;

    virtual ~IStreamTransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Open the stream and begin delivering data. Fails if already running.
    [[nodiscard]] virtual TransportResult<void> start(DataHandler on_data, CloseHandler on_close) = 0;

    /// Write one encoded frame. Blocks until the bytes are handed to the OS.
    [[nodiscard]] virtual TransportResult<void> write(std::string_view frame) = 0;

    /// Idempotent. No handler fires after stop() returns.
    virtual void stop() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

}  // namespace mcplink
