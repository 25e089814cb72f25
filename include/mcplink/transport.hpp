#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by the stream transports and everything layered on them.
//
// For the byte-stream interface, use: #include "mcplink/transport/stream_transport.hpp"
// For the child-process transport, use: #include "mcplink/transport/process_transport.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace mcplink {

/// Objects keep insertion order so tool schemas keep their declared
/// property order after a parse/serialize cycle.
using Json = nlohmann::ordered_json;

/// Error type for transport operations
struct TransportError {
    enum class Category { Network, Timeout, Protocol, Closed };

    Category category{};
    std::string message;
    std::optional<int> exit_code{};
};

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcplink
