#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tool Invoker
// ═══════════════════════════════════════════════════════════════════════════
// Turns positional arguments into the named `arguments` object a tool's input
// schema describes, calls "tools/call", and flattens the text content of the
// result.
//
//   Tool: read_file { path (required), encoding = "utf-8" }
//
//   invoke(conn, "read_file", {"/etc/hosts"})
//     ─▶ tools/call {"name":"read_file",
//                    "arguments":{"path":"/etc/hosts","encoding":"utf-8"}}
//     ◀─ {"content":[{"type":"text","text":"127.0.0.1 localhost"}]}
//     ─▶ "127.0.0.1 localhost"
//
// Marshaling failures are reported before anything is written to the server.

#include "mcplink/client/client_error.hpp"
#include "mcplink/client/connection.hpp"
#include "mcplink/protocol/mcp_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcplink {

// ─────────────────────────────────────────────────────────────────────────────
// Marshaling
// ─────────────────────────────────────────────────────────────────────────────

/// Zip `positional` against the schema's declared property order.
///
/// - fewer values than required properties, or a required property left
///   without a value or default: ArgumentMismatch
/// - more values than declared properties: ArgumentMismatch
/// - unsupplied properties take their default, or are left out entirely
[[nodiscard]] ClientResult<Json> build_call(const Tool& tool, const std::vector<Json>& positional);

/// Concatenate the `text` of every `type == "text"` content entry, in order,
/// separated by a single newline. Other entries are skipped.
[[nodiscard]] std::string extract_text(const Json& call_result);

// ─────────────────────────────────────────────────────────────────────────────
// Normalized descriptor
// ─────────────────────────────────────────────────────────────────────────────
// The shape an external tool registry consumes. An array parameter with an
// item schema always carries all three parts of `items`, even when empty.

struct ToolItemField {
    std::string name;
    std::string type;
    std::string description;
};

struct ToolItemShape {
    std::string type;
    std::vector<ToolItemField> properties;
    std::vector<std::string> required;

    [[nodiscard]] Json to_json() const;
};

struct ToolParameter {
    std::string name;
    std::string type;
    std::string description;
    bool required{false};
    std::optional<Json> default_value;
    std::optional<ToolItemShape> items;

    [[nodiscard]] Json to_json() const;
};

struct ToolSpec {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    [[nodiscard]] Json to_json() const;
};

[[nodiscard]] ToolSpec tool_spec(const Tool& tool);

// ─────────────────────────────────────────────────────────────────────────────
// Invocation
// ─────────────────────────────────────────────────────────────────────────────

/// Look the tool up in the connection's cached catalog, marshal, call and
/// extract text. Blocks by pumping the connection's io_context.
[[nodiscard]] ClientResult<std::string> invoke(Connection& connection,
                                               const std::string& tool_name,
                                               const std::vector<Json>& positional);

/// Non-blocking form. Local failures (unknown tool, argument mismatch, not
/// connected) are returned directly and `on_done` never runs; otherwise
/// `on_done` receives the text or the remote error.
[[nodiscard]] ClientResult<std::int64_t> invoke_async(Connection& connection,
                                                      const std::string& tool_name,
                                                      const std::vector<Json>& positional,
                                                      Connection::Callback<std::string> on_done);

}  // namespace mcplink
