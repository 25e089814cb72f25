#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════
// One live session with one named server over one stream transport.
//
// Usage:
//   asio::io_context io;
//   auto conn = Connection::create("fs", io,
//       make_process_transport(io.get_executor(), {"mcp-server-fs", {"/tmp"}}));
//   conn->connect();                        // negotiate, pumping `io`
//   auto tools = conn->list_tools();        // sync, pumping `io`
//   conn->request_async("ping", {}, [](ClientResult<Json> r) { ... });
//   io.run();
//
// Lifecycle:
//
//   ┌──────┐ version ok ┌───────────┐
//   │ Init │───────────▶│ Connected │
//   └──────┘            └───────────┘
//      │ mismatch,            │ transport lost
//      │ rpc error            ▼
//      └──────────────▶ ┌───────┐
//                       │ Error │          stop() from any state ──▶ Shutdown
//                       └───────┘
//
// Scheduling: everything runs on one io_context thread. Inbound chunks are
// only queued by the transport callback; a posted drain handler parses them
// and posts one unit of work per reply, request or notification, so delivery
// order is arrival order and no handler ever runs re-entrantly.

#include "mcplink/client/catalog_cache.hpp"
#include "mcplink/client/client_error.hpp"
#include "mcplink/client/request_correlator.hpp"
#include "mcplink/protocol/json_rpc.hpp"
#include "mcplink/protocol/mcp_types.hpp"
#include "mcplink/transport/frame_reader.hpp"
#include "mcplink/transport/stream_transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcplink {

// ═══════════════════════════════════════════════════════════════════════════
// Status
// ═══════════════════════════════════════════════════════════════════════════

enum class ConnectionStatus {
    Init,
    Connected,
    Error,
    Shutdown
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::Init:      return "init";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Error:     return "error";
        case ConnectionStatus::Shutdown:  return "shutdown";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct ConnectionConfig {
    /// Client identification sent in `initialize`
    std::string client_name = "mcplink";
    std::string client_version = "0.1.0";

    /// The server must answer with exactly this version
    std::string protocol_version = MCP_PROTOCOL_VERSION;

    /// Declared client capabilities; roots.listChanged by default
    ClientCapabilities capabilities{};

    /// Answer for server-initiated "roots/list"
    std::vector<Root> roots;

    /// Fetch advertised catalogs after negotiation and on list_changed
    bool auto_fetch_catalogs = true;

    /// Include resources/templates/list in the automatic fetches
    bool auto_fetch_resource_templates = false;

    /// Frames longer than this are dropped
    std::size_t max_message_size = FrameReader::kDefaultMaxFrameSize;
};

class Connection;

/// Negotiation-time callbacks. Every member is optional.
struct ConnectionCallbacks {
    std::function<void(Connection&)> on_ready;
    std::function<void(Connection&, const ClientError&)> on_error;

    std::function<void(Connection&, const std::vector<Tool>&)> on_tools;
    std::function<void(Connection&, const std::vector<Prompt>&)> on_prompts;
    std::function<void(Connection&, const std::vector<Resource>&)> on_resources;
    std::function<void(Connection&, const std::vector<ResourceTemplate>&)> on_resource_templates;
    std::function<void(Connection&, CatalogKind, const ClientError&)> on_catalog_error;
};

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════

class Connection : public std::enable_shared_from_this<Connection> {
    // Restricts construction to create() while still allowing make_shared
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    template <typename T>
    using Callback = std::function<void(ClientResult<T>)>;

    template <typename T>
    using CatalogCallback = std::function<void(Connection&, ClientResult<std::vector<T>>)>;

    using NotificationHandler = std::function<void(Connection&, const JsonRpcNotification&)>;

    [[nodiscard]] static std::shared_ptr<Connection> create(
        std::string name,
        asio::io_context& io,
        std::unique_ptr<IStreamTransport> transport,
        ConnectionConfig config = {}
    );

    Connection(PrivateTag,
               std::string name,
               asio::io_context& io,
               std::unique_ptr<IStreamTransport> transport,
               ConnectionConfig config);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start the transport and send `initialize`. Returns immediately; the
    /// outcome arrives through `callbacks`. A connection starts at most once.
    [[nodiscard]] ClientResult<void> start(ConnectionCallbacks callbacks = {});

    /// Pump the io_context until negotiation has finished either way
    [[nodiscard]] ClientResult<void> wait_until_ready();

    /// start() followed by wait_until_ready()
    [[nodiscard]] ClientResult<void> connect(ConnectionCallbacks callbacks = {});

    /// Terminal. Stops the transport and fails every pending call with
    /// ConnectionClosed. Safe to call repeatedly.
    void stop();

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] ConnectionStatus status() const noexcept { return status_; }
    [[nodiscard]] bool is_connected() const noexcept { return status_ == ConnectionStatus::Connected; }

    /// The error that moved the connection to Error, if any
    [[nodiscard]] const std::optional<ClientError>& last_error() const noexcept { return last_error_; }

    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept { return capabilities_; }
    [[nodiscard]] const Implementation& server_info() const noexcept { return server_info_; }
    [[nodiscard]] const std::optional<std::string>& instructions() const noexcept { return instructions_; }
    [[nodiscard]] const ConnectionConfig& config() const noexcept { return config_; }

    [[nodiscard]] const CatalogCache& catalog() const noexcept { return catalog_; }
    [[nodiscard]] std::size_t pending_count() const noexcept { return correlator_.pending_count(); }

    [[nodiscard]] asio::io_context& io() noexcept { return io_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Generic calls
    // ─────────────────────────────────────────────────────────────────────────

    /// Send and pump the io_context until this call completes. Must not be
    /// called from a handler running on the same io_context.
    [[nodiscard]] ClientResult<Json> request(const std::string& method, std::optional<Json> params = std::nullopt);

    /// Send and return the request id. `on_complete` runs later as its own
    /// posted unit of work, exactly once.
    [[nodiscard]] ClientResult<std::int64_t> request_async(
        const std::string& method,
        std::optional<Json> params,
        Callback<Json> on_complete
    );

    /// Coroutine form of request_async
    [[nodiscard]] asio::awaitable<ClientResult<Json>> async_request(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    /// Fire-and-forget notification
    [[nodiscard]] ClientResult<void> notify(const std::string& method, std::optional<Json> params = std::nullopt);

    /// Complete a pending call with Cancelled and tell the server with
    /// "notifications/cancelled". Returns false if the id is not pending.
    bool cancel(std::int64_t id, std::string reason = "Cancelled by client");

    // ─────────────────────────────────────────────────────────────────────────
    // Catalogs
    // ─────────────────────────────────────────────────────────────────────────
    // Explicit re-lists are allowed whatever the server advertised. Results
    // replace the cached catalog before the callback runs.

    [[nodiscard]] ClientResult<void> list_tools_async(CatalogCallback<Tool> on_done);
    [[nodiscard]] ClientResult<void> list_prompts_async(CatalogCallback<Prompt> on_done);
    [[nodiscard]] ClientResult<void> list_resources_async(CatalogCallback<Resource> on_done);
    [[nodiscard]] ClientResult<void> list_resource_templates_async(CatalogCallback<ResourceTemplate> on_done);

    [[nodiscard]] ClientResult<std::vector<Tool>> list_tools();
    [[nodiscard]] ClientResult<std::vector<Prompt>> list_prompts();
    [[nodiscard]] ClientResult<std::vector<Resource>> list_resources();
    [[nodiscard]] ClientResult<std::vector<ResourceTemplate>> list_resource_templates();

    // ─────────────────────────────────────────────────────────────────────────
    // Other operations
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ClientResult<void> ping();
    [[nodiscard]] ClientResult<std::int64_t> ping_async(Callback<void> on_done);

    [[nodiscard]] ClientResult<GetPromptResult> get_prompt(const std::string& name, Json arguments = Json::object());
    [[nodiscard]] ClientResult<std::int64_t> get_prompt_async(
        const std::string& name, Json arguments, Callback<GetPromptResult> on_done);

    [[nodiscard]] ClientResult<ReadResourceResult> read_resource(const std::string& uri);
    [[nodiscard]] ClientResult<std::int64_t> read_resource_async(
        const std::string& uri, Callback<ReadResourceResult> on_done);

    // ─────────────────────────────────────────────────────────────────────────
    // Inbound notifications
    // ─────────────────────────────────────────────────────────────────────────

    /// Receives every inbound notification, before built-in handling
    void on_notification(NotificationHandler handler);

private:
    // Outbound
    ClientResult<void> send_message(const JsonRpcMessage& message);
    ClientResult<std::int64_t> send_request(const std::string& method,
                                            std::optional<Json> params,
                                            RequestCorrelator::Continuation on_complete);

    // Inbound
    void on_transport_data(std::string_view chunk);
    void on_transport_closed(const TransportError& error);
    void handle_transport_lost(const TransportError& error);
    void schedule_drain();
    void drain_inbound();
    void handle_frame(const Json& frame);
    void handle_server_request(const JsonRpcRequest& request);
    void handle_notification(const JsonRpcNotification& notification);

    // Negotiation
    void handle_initialize_reply(ClientResult<Json> reply);
    void fail_negotiation(ClientError error);
    void fetch_advertised_catalogs();
    void refetch(CatalogKind kind);
    void teardown();

    // Catalog paging
    template <typename T>
    ClientResult<void> fetch_pages(CatalogKind kind,
                                   std::vector<T> accumulated,
                                   std::optional<std::string> cursor,
                                   std::set<std::string> seen_cursors,
                                   std::function<void(ClientResult<std::vector<T>>)> on_done);

    template <typename T>
    ClientResult<void> list_async(CatalogKind kind, CatalogCallback<T> on_done);

    template <typename T>
    ClientResult<std::vector<T>> list_sync(CatalogKind kind);

    void store(std::vector<Tool> items);
    void store(std::vector<Prompt> items);
    void store(std::vector<Resource> items);
    void store(std::vector<ResourceTemplate> items);

    // Sync pumping
    ClientResult<void> check_can_block() const;
    template <typename T>
    ClientResult<T> pump_until(const std::shared_ptr<std::optional<ClientResult<T>>>& slot,
                               const std::string& what);

    std::string name_;
    asio::io_context& io_;
    std::unique_ptr<IStreamTransport> transport_;
    ConnectionConfig config_;

    ConnectionStatus status_{ConnectionStatus::Init};
    bool started_{false};
    std::optional<ClientError> last_error_;

    ServerCapabilities capabilities_;
    Implementation server_info_;
    std::optional<std::string> instructions_;

    ConnectionCallbacks callbacks_;
    NotificationHandler notification_handler_;

    FrameReader reader_;
    RequestCorrelator correlator_;
    CatalogCache catalog_;

    std::deque<std::string> inbound_;
    bool drain_scheduled_{false};
    bool draining_{false};
};

}  // namespace mcplink
