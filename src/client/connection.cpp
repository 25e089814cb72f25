#include "mcplink/client/connection.hpp"
#include "mcplink/log/logger.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include <stdexcept>
#include <system_error>

namespace mcplink {

namespace {

// Caller-supplied handlers must not take the dispatch path down with them
template <typename Handler, typename... Args>
void safe_invoke(const Handler& handler, const char* what, Args&&... args) {
    if (!handler) {
        return;
    }
    try {
        handler(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        MCPLINK_LOG_ERROR(std::string("Exception in ") + what + " handler: " + e.what());
    }
}

template <typename T>
ClientResult<T> decode_result(const ClientResult<Json>& raw) {
    if (!raw) {
        return tl::unexpected(raw.error());
    }
    if (!raw->is_object()) {
        return tl::unexpected(ClientError::protocol_error("Expected an object result"));
    }
    try {
        return T::from_json(*raw);
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(ClientError::protocol_error(std::string("Malformed result: ") + e.what()));
    }
}

template <typename T>
ClientResult<CatalogPage<T>> parse_catalog_page(const Json& result);

template <>
ClientResult<CatalogPage<Tool>> parse_catalog_page<Tool>(const Json& result) {
    return parse_tool_page(result);
}

template <>
ClientResult<CatalogPage<Prompt>> parse_catalog_page<Prompt>(const Json& result) {
    return parse_prompt_page(result);
}

template <>
ClientResult<CatalogPage<Resource>> parse_catalog_page<Resource>(const Json& result) {
    return parse_resource_page(result);
}

template <>
ClientResult<CatalogPage<ResourceTemplate>> parse_catalog_page<ResourceTemplate>(const Json& result) {
    return parse_resource_template_page(result);
}

// Routes an automatic catalog fetch to the negotiation callbacks
template <typename T>
Connection::CatalogCallback<T> catalog_reporter(
    CatalogKind kind,
    std::function<void(Connection&, const std::vector<T>&)> on_items,
    std::function<void(Connection&, CatalogKind, const ClientError&)> on_error
) {
    return [kind, on_items = std::move(on_items), on_error = std::move(on_error)](
               Connection& self, ClientResult<std::vector<T>> result) {
        if (!result) {
            MCPLINK_LOG_WARN("Fetching " + std::string(to_string(kind)) + " from '" + self.name() +
                             "' failed: " + result.error().describe());
            safe_invoke(on_error, "catalog error", self, kind, result.error());
            return;
        }
        get_logger().debug_fmt("Fetched {} {} from '{}'", result->size(), to_string(kind), self.name());
        safe_invoke(on_items, "catalog", self, *result);
    };
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<Connection> Connection::create(
    std::string name,
    asio::io_context& io,
    std::unique_ptr<IStreamTransport> transport,
    ConnectionConfig config
) {
    return std::make_shared<Connection>(
        PrivateTag(), std::move(name), io, std::move(transport), std::move(config));
}

Connection::Connection(PrivateTag,
                       std::string name,
                       asio::io_context& io,
                       std::unique_ptr<IStreamTransport> transport,
                       ConnectionConfig config)
    : name_(std::move(name))
    , io_(io)
    , transport_(std::move(transport))
    , config_(std::move(config))
    , reader_(config_.max_message_size)
    , correlator_([&io](RequestCorrelator::Task task) { asio::post(io, std::move(task)); })
{
    if (!transport_) {
        throw std::invalid_argument("Connection: transport cannot be null");
    }
}

Connection::~Connection() {
    if (status_ != ConnectionStatus::Shutdown) {
        status_ = ConnectionStatus::Shutdown;
        teardown();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<void> Connection::start(ConnectionCallbacks callbacks) {
    if (started_ || status_ != ConnectionStatus::Init) {
        return tl::unexpected(ClientError::protocol_error(
            "Connection '" + name_ + "' was already started"));
    }
    started_ = true;
    callbacks_ = std::move(callbacks);

    std::weak_ptr<Connection> weak = weak_from_this();
    auto started = transport_->start(
        [weak](std::string_view chunk) {
            if (auto self = weak.lock()) {
                self->on_transport_data(chunk);
            }
        },
        [weak](const TransportError& error) {
            if (auto self = weak.lock()) {
                self->on_transport_closed(error);
            }
        });
    if (!started) {
        auto error = ClientError::transport_error("Failed to start transport: " + started.error().message);
        MCPLINK_LOG_ERROR("Connection '" + name_ + "': " + error.message);
        status_ = ConnectionStatus::Error;
        last_error_ = error;
        return tl::unexpected(std::move(error));
    }

    InitializeParams params;
    params.protocol_version = config_.protocol_version;
    params.capabilities = config_.capabilities;
    params.client_info = Implementation{config_.client_name, config_.client_version};

    auto sent = send_request(method::Initialize, params.to_json(),
        [weak](ClientResult<Json> reply) {
            if (auto self = weak.lock()) {
                self->handle_initialize_reply(std::move(reply));
            }
        });
    if (!sent) {
        MCPLINK_LOG_ERROR("Connection '" + name_ + "': " + sent.error().message);
        status_ = ConnectionStatus::Error;
        last_error_ = sent.error();
        teardown();
        return tl::unexpected(sent.error());
    }

    MCPLINK_LOG_DEBUG("Sent initialize to '" + name_ + "'");
    return {};
}

ClientResult<void> Connection::wait_until_ready() {
    if (!started_) {
        return tl::unexpected(ClientError::protocol_error("Connection '" + name_ + "' was not started"));
    }
    if (auto can_block = check_can_block(); !can_block) {
        return can_block;
    }

    while (status_ == ConnectionStatus::Init) {
        if (io_.stopped()) {
            io_.restart();
        }
        if (io_.run_one() == 0 && status_ == ConnectionStatus::Init) {
            return tl::unexpected(ClientError::transport_error(
                "Event loop ran out of work during negotiation"));
        }
    }

    if (status_ == ConnectionStatus::Connected) {
        return {};
    }
    if (last_error_) {
        return tl::unexpected(*last_error_);
    }
    return tl::unexpected(ClientError::not_connected());
}

ClientResult<void> Connection::connect(ConnectionCallbacks callbacks) {
    auto started = start(std::move(callbacks));
    if (!started) {
        return started;
    }
    return wait_until_ready();
}

void Connection::stop() {
    if (status_ == ConnectionStatus::Shutdown) {
        return;
    }
    status_ = ConnectionStatus::Shutdown;
    teardown();
    MCPLINK_LOG_INFO("Connection '" + name_ + "' shut down");
}

void Connection::teardown() {
    inbound_.clear();
    reader_.reset();
    transport_->stop();

    const std::size_t failed = correlator_.fail_all(ClientError::connection_closed());
    if (failed > 0) {
        get_logger().debug_fmt("Connection '{}': failed {} pending call(s) on teardown", name_, failed);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Generic Calls
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<Json> Connection::request(const std::string& method, std::optional<Json> params) {
    if (auto can_block = check_can_block(); !can_block) {
        return tl::unexpected(can_block.error());
    }

    auto slot = std::make_shared<std::optional<ClientResult<Json>>>();
    auto id = request_async(method, std::move(params),
        [slot](ClientResult<Json> result) { *slot = std::move(result); });
    if (!id) {
        return tl::unexpected(id.error());
    }
    return pump_until(slot, method);
}

ClientResult<std::int64_t> Connection::request_async(
    const std::string& method,
    std::optional<Json> params,
    Callback<Json> on_complete
) {
    if (status_ != ConnectionStatus::Connected) {
        return tl::unexpected(ClientError::not_connected());
    }
    return send_request(method, std::move(params), std::move(on_complete));
}

asio::awaitable<ClientResult<Json>> Connection::async_request(
    std::string method,
    std::optional<Json> params
) {
    using ReplyChannel = asio::experimental::channel<void(asio::error_code, ClientResult<Json>)>;

    auto self = shared_from_this();
    auto channel = std::make_shared<ReplyChannel>(io_.get_executor(), 1);

    auto sent = request_async(method, std::move(params),
        [channel](ClientResult<Json> result) {
            if (!channel->try_send(asio::error_code{}, std::move(result))) {
                MCPLINK_LOG_WARN("Reply channel closed before completion was delivered");
            }
        });
    if (!sent) {
        co_return tl::unexpected(sent.error());
    }

    try {
        co_return co_await channel->async_receive(asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(ClientError::transport_error(
            std::string("Receive failed: ") + e.what()));
    }
}

ClientResult<void> Connection::notify(const std::string& method, std::optional<Json> params) {
    if (status_ != ConnectionStatus::Connected) {
        return tl::unexpected(ClientError::not_connected());
    }
    return send_message(JsonRpcNotification(method, std::move(params)));
}

bool Connection::cancel(std::int64_t id, std::string reason) {
    const std::string method = correlator_.method_of(id);
    if (!correlator_.cancel(id, reason)) {
        return false;
    }
    get_logger().debug_fmt("Cancelled {} (id {}) on '{}'", method, id, name_);

    if (transport_->is_running()) {
        CancelledNotification notification;
        notification.request_id = id;
        notification.reason = std::move(reason);
        auto sent = send_message(JsonRpcNotification(method::Cancelled, notification.to_json()));
        if (!sent) {
            get_logger().warn_fmt("Failed to send cancellation for id {}: {}", id, sent.error().message);
        }
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Catalogs
// ═══════════════════════════════════════════════════════════════════════════

template <typename T>
ClientResult<void> Connection::fetch_pages(CatalogKind kind,
                                           std::vector<T> accumulated,
                                           std::optional<std::string> cursor,
                                           std::set<std::string> seen_cursors,
                                           std::function<void(ClientResult<std::vector<T>>)> on_done) {
    Json params = Json::object();
    params["cursor"] = cursor ? Json(*cursor) : Json(nullptr);

    std::weak_ptr<Connection> weak = weak_from_this();
    auto sent = send_request(list_method(kind), std::move(params),
        [weak, kind, acc = std::move(accumulated), seen = std::move(seen_cursors), on_done](ClientResult<Json> reply) mutable {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            if (!reply) {
                on_done(tl::unexpected(reply.error()));
                return;
            }

            auto page = parse_catalog_page<T>(*reply);
            if (!page) {
                on_done(tl::unexpected(page.error()));
                return;
            }
            for (auto& item : page->items) {
                acc.push_back(std::move(item));
            }

            if (page->next_cursor && !page->next_cursor->empty()) {
                // A cursor seen earlier in this listing would page forever
                if (!seen.insert(*page->next_cursor).second) {
                    on_done(tl::unexpected(ClientError::protocol_error(
                        std::string(list_method(kind)) + " repeated cursor '" + *page->next_cursor + "'")));
                    return;
                }
                auto next = self->fetch_pages<T>(kind, std::move(acc), page->next_cursor, std::move(seen), on_done);
                if (!next) {
                    on_done(tl::unexpected(next.error()));
                }
                return;
            }

            self->store(acc);
            on_done(std::move(acc));
        });
    if (!sent) {
        return tl::unexpected(sent.error());
    }
    return {};
}

template <typename T>
ClientResult<void> Connection::list_async(CatalogKind kind, CatalogCallback<T> on_done) {
    if (status_ != ConnectionStatus::Connected) {
        return tl::unexpected(ClientError::not_connected());
    }

    std::weak_ptr<Connection> weak = weak_from_this();
    return fetch_pages<T>(kind, {}, std::nullopt, {},
        [weak, on_done = std::move(on_done)](ClientResult<std::vector<T>> result) {
            auto self = weak.lock();
            if (self && on_done) {
                on_done(*self, std::move(result));
            }
        });
}

template <typename T>
ClientResult<std::vector<T>> Connection::list_sync(CatalogKind kind) {
    if (auto can_block = check_can_block(); !can_block) {
        return tl::unexpected(can_block.error());
    }

    auto slot = std::make_shared<std::optional<ClientResult<std::vector<T>>>>();
    auto sent = list_async<T>(kind,
        [slot](Connection&, ClientResult<std::vector<T>> result) { *slot = std::move(result); });
    if (!sent) {
        return tl::unexpected(sent.error());
    }
    return pump_until(slot, list_method(kind));
}

void Connection::store(std::vector<Tool> items) {
    catalog_.replace_tools(std::move(items));
}

void Connection::store(std::vector<Prompt> items) {
    catalog_.replace_prompts(std::move(items));
}

void Connection::store(std::vector<Resource> items) {
    catalog_.replace_resources(std::move(items));
}

void Connection::store(std::vector<ResourceTemplate> items) {
    catalog_.replace_resource_templates(std::move(items));
}

ClientResult<void> Connection::list_tools_async(CatalogCallback<Tool> on_done) {
    return list_async<Tool>(CatalogKind::Tools, std::move(on_done));
}

ClientResult<void> Connection::list_prompts_async(CatalogCallback<Prompt> on_done) {
    return list_async<Prompt>(CatalogKind::Prompts, std::move(on_done));
}

ClientResult<void> Connection::list_resources_async(CatalogCallback<Resource> on_done) {
    return list_async<Resource>(CatalogKind::Resources, std::move(on_done));
}

ClientResult<void> Connection::list_resource_templates_async(CatalogCallback<ResourceTemplate> on_done) {
    return list_async<ResourceTemplate>(CatalogKind::ResourceTemplates, std::move(on_done));
}

ClientResult<std::vector<Tool>> Connection::list_tools() {
    return list_sync<Tool>(CatalogKind::Tools);
}

ClientResult<std::vector<Prompt>> Connection::list_prompts() {
    return list_sync<Prompt>(CatalogKind::Prompts);
}

ClientResult<std::vector<Resource>> Connection::list_resources() {
    return list_sync<Resource>(CatalogKind::Resources);
}

ClientResult<std::vector<ResourceTemplate>> Connection::list_resource_templates() {
    return list_sync<ResourceTemplate>(CatalogKind::ResourceTemplates);
}

void Connection::fetch_advertised_catalogs() {
    if (capabilities_.has_tools()) {
        refetch(CatalogKind::Tools);
    } else {
        MCPLINK_LOG_DEBUG("'" + name_ + "' does not advertise tools");
    }
    if (capabilities_.has_prompts()) {
        refetch(CatalogKind::Prompts);
    } else {
        MCPLINK_LOG_DEBUG("'" + name_ + "' does not advertise prompts");
    }
    if (capabilities_.has_resources()) {
        refetch(CatalogKind::Resources);
        if (config_.auto_fetch_resource_templates) {
            refetch(CatalogKind::ResourceTemplates);
        }
    } else {
        MCPLINK_LOG_DEBUG("'" + name_ + "' does not advertise resources");
    }
}

void Connection::refetch(CatalogKind kind) {
    if (status_ != ConnectionStatus::Connected) {
        return;
    }

    ClientResult<void> sent;
    switch (kind) {
        case CatalogKind::Tools:
            sent = list_tools_async(catalog_reporter<Tool>(
                kind, callbacks_.on_tools, callbacks_.on_catalog_error));
            break;
        case CatalogKind::Prompts:
            sent = list_prompts_async(catalog_reporter<Prompt>(
                kind, callbacks_.on_prompts, callbacks_.on_catalog_error));
            break;
        case CatalogKind::Resources:
            sent = list_resources_async(catalog_reporter<Resource>(
                kind, callbacks_.on_resources, callbacks_.on_catalog_error));
            break;
        case CatalogKind::ResourceTemplates:
            sent = list_resource_templates_async(catalog_reporter<ResourceTemplate>(
                kind, callbacks_.on_resource_templates, callbacks_.on_catalog_error));
            break;
    }

    if (!sent) {
        MCPLINK_LOG_WARN("Could not request " + std::string(to_string(kind)) + " from '" + name_ +
                         "': " + sent.error().message);
        safe_invoke(callbacks_.on_catalog_error, "catalog error", *this, kind, sent.error());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Other Operations
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<void> Connection::ping() {
    auto result = request(method::Ping);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

ClientResult<std::int64_t> Connection::ping_async(Callback<void> on_done) {
    return request_async(method::Ping, std::nullopt,
        [on_done = std::move(on_done)](ClientResult<Json> result) {
            if (!on_done) {
                return;
            }
            if (!result) {
                on_done(tl::unexpected(result.error()));
                return;
            }
            on_done(ClientResult<void>{});
        });
}

ClientResult<GetPromptResult> Connection::get_prompt(const std::string& name, Json arguments) {
    Json params = {{"name", name}, {"arguments", std::move(arguments)}};
    return decode_result<GetPromptResult>(request(method::PromptsGet, std::move(params)));
}

ClientResult<std::int64_t> Connection::get_prompt_async(
    const std::string& name, Json arguments, Callback<GetPromptResult> on_done
) {
    Json params = {{"name", name}, {"arguments", std::move(arguments)}};
    return request_async(method::PromptsGet, std::move(params),
        [on_done = std::move(on_done)](ClientResult<Json> result) {
            if (on_done) {
                on_done(decode_result<GetPromptResult>(result));
            }
        });
}

ClientResult<ReadResourceResult> Connection::read_resource(const std::string& uri) {
    return decode_result<ReadResourceResult>(request(method::ResourcesRead, Json{{"uri", uri}}));
}

ClientResult<std::int64_t> Connection::read_resource_async(
    const std::string& uri, Callback<ReadResourceResult> on_done
) {
    return request_async(method::ResourcesRead, Json{{"uri", uri}},
        [on_done = std::move(on_done)](ClientResult<Json> result) {
            if (on_done) {
                on_done(decode_result<ReadResourceResult>(result));
            }
        });
}

void Connection::on_notification(NotificationHandler handler) {
    notification_handler_ = std::move(handler);
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<void> Connection::send_message(const JsonRpcMessage& message) {
    if (!transport_->is_running()) {
        return tl::unexpected(ClientError::transport_error("Transport is not running"));
    }

    std::string frame;
    try {
        frame = encode_frame(message);
    } catch (const nlohmann::json::exception& e) {
        // Strings that are not valid UTF-8 cannot be serialized
        return tl::unexpected(ClientError::protocol_error(std::string("Cannot encode message: ") + e.what()));
    }
    MCPLINK_LOG_TRACE(">> " + frame.substr(0, frame.size() - 2));

    auto written = transport_->write(frame);
    if (!written) {
        return tl::unexpected(ClientError::transport_error("Write failed: " + written.error().message));
    }
    return {};
}

ClientResult<std::int64_t> Connection::send_request(
    const std::string& method,
    std::optional<Json> params,
    RequestCorrelator::Continuation on_complete
) {
    const std::int64_t id = correlator_.register_call(method, std::move(on_complete));
    auto sent = send_message(JsonRpcRequest(method, id, std::move(params)));
    if (!sent) {
        correlator_.forget(id);
        return tl::unexpected(sent.error());
    }
    return id;
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound
// ═══════════════════════════════════════════════════════════════════════════

void Connection::on_transport_data(std::string_view chunk) {
    if (status_ == ConnectionStatus::Shutdown) {
        return;
    }
    inbound_.emplace_back(chunk);
    schedule_drain();
}

void Connection::on_transport_closed(const TransportError& error) {
    // Queued after any drain already scheduled, so replies that arrived
    // before the stream ended are still delivered
    std::weak_ptr<Connection> weak = weak_from_this();
    asio::post(io_, [weak, error]() {
        if (auto self = weak.lock()) {
            self->handle_transport_lost(error);
        }
    });
}

void Connection::handle_transport_lost(const TransportError& error) {
    if (status_ == ConnectionStatus::Shutdown || status_ == ConnectionStatus::Error) {
        return;
    }

    auto client_error = ClientError::transport_error("Transport closed: " + error.message);
    MCPLINK_LOG_ERROR("Connection '" + name_ + "' lost: " + error.message);
    status_ = ConnectionStatus::Error;
    last_error_ = client_error;
    teardown();
    safe_invoke(callbacks_.on_error, "error", *this, client_error);
}

void Connection::schedule_drain() {
    if (drain_scheduled_) {
        return;
    }
    drain_scheduled_ = true;

    std::weak_ptr<Connection> weak = weak_from_this();
    asio::post(io_, [weak]() {
        if (auto self = weak.lock()) {
            self->drain_inbound();
        }
    });
}

void Connection::drain_inbound() {
    drain_scheduled_ = false;
    if (draining_) {
        // Re-entered from inside a pass: run again once it has unwound
        schedule_drain();
        return;
    }

    draining_ = true;
    while (!inbound_.empty() && status_ != ConnectionStatus::Shutdown) {
        std::string chunk = std::move(inbound_.front());
        inbound_.pop_front();
        for (const auto& frame : reader_.feed(chunk)) {
            handle_frame(frame);
        }
    }
    draining_ = false;
}

void Connection::handle_frame(const Json& frame) {
    auto message = parse_message(frame);
    if (!message) {
        MCPLINK_LOG_WARN("Dropping malformed message from '" + name_ + "': " + message.error().message);
        return;
    }

    if (const auto* reply = std::get_if<JsonRpcReply>(&*message)) {
        correlator_.complete(*reply);
        return;
    }

    std::weak_ptr<Connection> weak = weak_from_this();
    if (const auto* request = std::get_if<JsonRpcRequest>(&*message)) {
        asio::post(io_, [weak, req = *request]() {
            if (auto self = weak.lock()) {
                self->handle_server_request(req);
            }
        });
        return;
    }
    if (const auto* notification = std::get_if<JsonRpcNotification>(&*message)) {
        asio::post(io_, [weak, note = *notification]() {
            if (auto self = weak.lock()) {
                self->handle_notification(note);
            }
        });
    }
}

void Connection::handle_server_request(const JsonRpcRequest& request) {
    if (status_ == ConnectionStatus::Shutdown) {
        return;
    }

    const std::string& m = request.method();
    MCPLINK_LOG_DEBUG("Server request '" + m + "' on '" + name_ + "'");

    const JsonRpcReply reply = [&]() {
        if (m == method::Ping) {
            return JsonRpcReply::success(request.id(), Json::object());
        }
        if (m == method::RootsList) {
            return JsonRpcReply::success(request.id(), ListRootsResult{config_.roots}.to_json());
        }
        return JsonRpcReply::failure(request.id(), JsonRpcError{
            ErrorCode::MethodNotFound,
            "Method not found: " + m
        });
    }();

    auto sent = send_message(reply);
    if (!sent) {
        MCPLINK_LOG_ERROR("Failed to answer '" + m + "' on '" + name_ + "': " + sent.error().message);
    }
}

void Connection::handle_notification(const JsonRpcNotification& notification) {
    if (status_ == ConnectionStatus::Shutdown) {
        return;
    }

    safe_invoke(notification_handler_, "notification", *this, notification);

    const std::string& m = notification.method();
    const Json params = notification.params().value_or(Json::object());

    if (m == method::ToolsListChanged || m == method::PromptsListChanged ||
        m == method::ResourcesListChanged) {
        if (!config_.auto_fetch_catalogs) {
            return;
        }
        if (m == method::ToolsListChanged) {
            refetch(CatalogKind::Tools);
        } else if (m == method::PromptsListChanged) {
            refetch(CatalogKind::Prompts);
        } else {
            refetch(CatalogKind::Resources);
            if (config_.auto_fetch_resource_templates) {
                refetch(CatalogKind::ResourceTemplates);
            }
        }
        return;
    }

    if (m == method::Message) {
        const auto log = LoggingMessageNotification::from_json(params);
        std::string source = name_;
        if (log.logger) {
            source += "/" + *log.logger;
        }
        get_logger().write(log_level_from_string(log.level), "[" + source + "] " + log.text());
        return;
    }

    if (m == method::Cancelled) {
        const auto cancelled = CancelledNotification::from_json(params);
        MCPLINK_LOG_DEBUG("'" + name_ + "' cancelled a request" +
                          (cancelled.reason ? ": " + *cancelled.reason : std::string{}));
        return;
    }

    MCPLINK_LOG_DEBUG("Unhandled notification '" + m + "' from '" + name_ + "'");
}

// ═══════════════════════════════════════════════════════════════════════════
// Negotiation
// ═══════════════════════════════════════════════════════════════════════════

void Connection::handle_initialize_reply(ClientResult<Json> reply) {
    if (status_ != ConnectionStatus::Init) {
        return;
    }

    if (!reply) {
        MCPLINK_LOG_ERROR("Negotiation with '" + name_ + "' failed: " + reply.error().describe());
        fail_negotiation(reply.error());
        return;
    }
    if (!reply->is_object()) {
        fail_negotiation(ClientError::protocol_error("initialize result is not an object"));
        return;
    }

    InitializeResult result;
    try {
        result = InitializeResult::from_json(*reply);
    } catch (const nlohmann::json::exception& e) {
        fail_negotiation(ClientError::protocol_error(std::string("Malformed initialize result: ") + e.what()));
        return;
    }

    if (result.protocol_version != config_.protocol_version) {
        auto error = ClientError::version_mismatch(config_.protocol_version, result.protocol_version);
        MCPLINK_LOG_ERROR("Connection '" + name_ + "': " + error.message);
        fail_negotiation(std::move(error));
        return;
    }

    capabilities_ = std::move(result.capabilities);
    server_info_ = std::move(result.server_info);
    instructions_ = std::move(result.instructions);
    status_ = ConnectionStatus::Connected;

    MCPLINK_LOG_INFO("Connected to '" + name_ + "' (" + server_info_.name + " " +
                     server_info_.version + ", protocol " + result.protocol_version + ")");

    auto sent = notify(method::Initialized);
    if (!sent) {
        MCPLINK_LOG_ERROR("Failed to send initialized notification to '" + name_ + "': " +
                          sent.error().message);
    }

    if (config_.auto_fetch_catalogs) {
        fetch_advertised_catalogs();
    }

    safe_invoke(callbacks_.on_ready, "ready", *this);
}

void Connection::fail_negotiation(ClientError error) {
    status_ = ConnectionStatus::Error;
    last_error_ = error;
    teardown();
    safe_invoke(callbacks_.on_error, "error", *this, error);
}

// ═══════════════════════════════════════════════════════════════════════════
// Sync Pumping
// ═══════════════════════════════════════════════════════════════════════════

ClientResult<void> Connection::check_can_block() const {
    if (io_.get_executor().running_in_this_thread()) {
        return tl::unexpected(ClientError::protocol_error(
            "Blocking call from inside the event loop; use the asynchronous form"));
    }
    return {};
}

template <typename T>
ClientResult<T> Connection::pump_until(const std::shared_ptr<std::optional<ClientResult<T>>>& slot,
                                       const std::string& what) {
    while (!slot->has_value()) {
        if (io_.stopped()) {
            io_.restart();
        }
        if (io_.run_one() == 0 && !slot->has_value()) {
            return tl::unexpected(ClientError::transport_error(
                "Event loop ran out of work waiting for " + what));
        }
    }
    return std::move(**slot);
}

}  // namespace mcplink
