#pragma once

#include "mcplink/transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace mcplink {

struct JsonError {
    enum class Code {
        ParseError,
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        UnknownShape
    };

    Code code{Code::ParseError};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] bool is_integer() const noexcept;
    [[nodiscard]] std::int64_t as_integer() const;
    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcNotification> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonRpcError from_json(const Json& payload);
};

/// A reply carries exactly one of result or error. The id is absent when a
/// peer answers a request it could not parse (JSON-RPC sends `"id": null`).
class JsonRpcReply {
public:
    static JsonRpcReply success(JsonRpcId id, Json result);
    static JsonRpcReply failure(std::optional<JsonRpcId> id, JsonRpcError error);

    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept;
    [[nodiscard]] bool is_error() const noexcept;
    [[nodiscard]] const Json& result() const;
    [[nodiscard]] const JsonRpcError& error() const;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcReply> from_json(const Json& payload);

private:
    JsonRpcReply(std::optional<JsonRpcId> id, std::variant<Json, JsonRpcError> outcome);

    std::optional<JsonRpcId> id_;
    std::variant<Json, JsonRpcError> outcome_;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcReply, JsonRpcNotification>;

/// Classify a parsed JSON value as request, reply or notification.
[[nodiscard]] JsonResult<JsonRpcMessage> parse_message(const Json& payload);

/// Parse the source text of one frame and classify it.
[[nodiscard]] JsonResult<JsonRpcMessage> decode_message(std::string_view text);

[[nodiscard]] Json to_json(const JsonRpcMessage& message);

/// Serialized message followed by the CRLF terminator written to the wire.
[[nodiscard]] std::string encode_frame(const JsonRpcMessage& message);

}  // namespace mcplink
