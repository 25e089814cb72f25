#include "mcplink/protocol/json_rpc.hpp"

#include <stdexcept>

namespace mcplink {
namespace {
const std::string kJsonRpcVersion{"2.0"};
constexpr std::string_view kFrameTerminator{"\r\n"};

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

// Shared envelope checks: object shape and the "2.0" version tag.
std::optional<JsonError> check_envelope(const Json& payload) {
    if (payload.is_object() == false) {
        return JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"};
    }

    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"};
    }

    const Json& version_node = payload.at("jsonrpc");
    const bool version_is_string = version_node.is_string();
    if ((version_is_string == false) ||
        (version_node.get<std::string>() != kJsonRpcVersion)) {
        return JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""};
    }
    return std::nullopt;
}

JsonResult<std::string> parse_method_field(const Json& payload) {
    const bool has_method_field = payload.contains("method");
    if (has_method_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }

    const Json& method_node = payload.at("method");
    if (method_node.is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "method must be a string"});
    }
    return method_node.get<std::string>();
}

JsonResult<std::optional<Json>> parse_params_field(const Json& payload) {
    const bool has_params_field = payload.contains("params");
    if (has_params_field == false) {
        return std::optional<Json>{};
    }

    const Json& params_node = payload.at("params");
    if (is_valid_params_type(params_node) == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "params must be an object or array"});
    }
    return std::optional<Json>{params_node};
}
}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t v) {
    return JsonRpcId{v};
}

JsonRpcId JsonRpcId::string(std::string v) {
    return JsonRpcId{std::move(v)};
}

bool JsonRpcId::is_integer() const noexcept {
    return std::holds_alternative<std::int64_t>(value);
}

std::int64_t JsonRpcId::as_integer() const {
    return std::get<std::int64_t>(value);
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

std::string JsonRpcId::to_string() const {
    if (is_integer()) {
        return std::to_string(as_integer());
    }
    return std::get<std::string>(value);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (auto envelope_error = check_envelope(payload)) {
        return tl::unexpected(*envelope_error);
    }

    auto method = parse_method_field(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    const bool has_id_field = payload.contains("id");
    if (has_id_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    auto params = parse_params_field(payload);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    return JsonRpcRequest(std::move(*method), std::move(*parsed_id), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& payload) {
    if (auto envelope_error = check_envelope(payload)) {
        return tl::unexpected(*envelope_error);
    }

    auto method = parse_method_field(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    auto params = parse_params_field(payload);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    return JsonRpcNotification(std::move(*method), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& payload) {
    JsonRpcError error;
    if (payload.is_object() == false) {
        error.code = -32603;
        error.message = "malformed error object";
        error.data = payload;
        return error;
    }
    if (payload.contains("code") && payload["code"].is_number_integer()) {
        error.code = payload["code"].get<std::int64_t>();
    }
    if (payload.contains("message") && payload["message"].is_string()) {
        error.message = payload["message"].get<std::string>();
    }
    if (payload.contains("data")) {
        error.data = payload["data"];
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcReply
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcReply::JsonRpcReply(std::optional<JsonRpcId> id, std::variant<Json, JsonRpcError> outcome)
    : id_(std::move(id)),
      outcome_(std::move(outcome)) {}

JsonRpcReply JsonRpcReply::success(JsonRpcId id, Json result) {
    return JsonRpcReply(std::move(id), std::variant<Json, JsonRpcError>{std::in_place_index<0>, std::move(result)});
}

JsonRpcReply JsonRpcReply::failure(std::optional<JsonRpcId> id, JsonRpcError error) {
    return JsonRpcReply(std::move(id), std::variant<Json, JsonRpcError>{std::in_place_index<1>, std::move(error)});
}

const std::optional<JsonRpcId>& JsonRpcReply::id() const noexcept {
    return id_;
}

bool JsonRpcReply::is_error() const noexcept {
    return outcome_.index() == 1;
}

const Json& JsonRpcReply::result() const {
    if (is_error()) {
        throw std::logic_error("JsonRpcReply::result called on an error reply");
    }
    return std::get<0>(outcome_);
}

const JsonRpcError& JsonRpcReply::error() const {
    if (is_error() == false) {
        throw std::logic_error("JsonRpcReply::error called on a success reply");
    }
    return std::get<1>(outcome_);
}

Json JsonRpcReply::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.has_value() ? id_->to_json() : Json(nullptr);
    if (is_error()) {
        payload["error"] = error().to_json();
    } else {
        payload["result"] = result();
    }
    return payload;
}

JsonResult<JsonRpcReply> JsonRpcReply::from_json(const Json& payload) {
    if (auto envelope_error = check_envelope(payload)) {
        return tl::unexpected(*envelope_error);
    }

    const bool has_id_field = payload.contains("id");
    if (has_id_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }

    std::optional<JsonRpcId> id;
    const Json& id_node = payload.at("id");
    if (id_node.is_null() == false) {
        auto parsed_id = parse_id_field(id_node);
        if (parsed_id.has_value() == false) {
            return tl::unexpected(parsed_id.error());
        }
        id = std::move(*parsed_id);
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::UnknownShape,
            "reply must carry exactly one of result or error"});
    }

    if (has_error == true) {
        return JsonRpcReply::failure(std::move(id), JsonRpcError::from_json(payload.at("error")));
    }
    if (id.has_value() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "success reply requires an id"});
    }
    return JsonRpcReply::success(std::move(*id), payload.at("result"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Message classification
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<JsonRpcMessage> parse_message(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    const bool has_method = payload.contains("method");
    const bool has_id = payload.contains("id");

    if (has_method == true && has_id == true) {
        return JsonRpcRequest::from_json(payload).map(
            [](JsonRpcRequest request) { return JsonRpcMessage{std::move(request)}; });
    }
    if (has_method == true) {
        return JsonRpcNotification::from_json(payload).map(
            [](JsonRpcNotification notification) { return JsonRpcMessage{std::move(notification)}; });
    }
    if (has_id == true) {
        return JsonRpcReply::from_json(payload).map(
            [](JsonRpcReply reply) { return JsonRpcMessage{std::move(reply)}; });
    }

    return tl::unexpected(JsonError{
        JsonError::Code::UnknownShape,
        "message has neither method nor id"});
}

JsonResult<JsonRpcMessage> decode_message(std::string_view text) {
    Json payload = Json::parse(text.begin(), text.end(), nullptr, false);
    if (payload.is_discarded()) {
        return tl::unexpected(JsonError{
            JsonError::Code::ParseError,
            "frame is not valid JSON"});
    }
    return parse_message(payload);
}

Json to_json(const JsonRpcMessage& message) {
    return std::visit([](const auto& m) { return m.to_json(); }, message);
}

std::string encode_frame(const JsonRpcMessage& message) {
    std::string frame = to_json(message).dump();
    frame.append(kFrameTerminator);
    return frame;
}

}  // namespace mcplink
