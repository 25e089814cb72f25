#include <catch2/catch_test_macros.hpp>

#include "mcplink/protocol/json_rpc.hpp"

#include <stdexcept>

using namespace mcplink;

TEST_CASE("JsonRpcRequest serializes ids and params deterministically", "[json-rpc][request]") {
    SECTION("Integer id with params") {
        Json params = {{"cursor", nullptr}};
        JsonRpcRequest request("tools/list", 42, params);

        auto j = request.to_json();
        REQUIRE(j["jsonrpc"] == "2.0");
        REQUIRE(j["method"] == "tools/list");
        REQUIRE(j["id"] == 42);
        REQUIRE(j["params"] == params);
    }

    SECTION("Params are omitted when not provided") {
        JsonRpcRequest request("ping", 1);
        REQUIRE_FALSE(request.to_json().contains("params"));
    }

    SECTION("String id") {
        JsonRpcRequest request("roots/list", JsonRpcId::string("srv-1"));
        REQUIRE(request.to_json()["id"] == "srv-1");
    }
}

TEST_CASE("JsonRpcNotification omits id", "[json-rpc][notification]") {
    JsonRpcNotification notification("notifications/initialized");

    auto j = notification.to_json();
    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["method"] == "notifications/initialized");
    REQUIRE_FALSE(j.contains("id"));
    REQUIRE_FALSE(j.contains("params"));
}

TEST_CASE("encode_frame terminates with CRLF", "[json-rpc][framing]") {
    auto frame = encode_frame(JsonRpcRequest("ping", 7));

    REQUIRE(frame.size() > 2);
    REQUIRE(frame.substr(frame.size() - 2) == "\r\n");
    REQUIRE(frame.find('\n') == frame.size() - 1);
    REQUIRE(Json::parse(frame.substr(0, frame.size() - 2))["id"] == 7);
}

TEST_CASE("parse_message classifies by method and id", "[json-rpc][classify]") {
    SECTION("method and id is a request") {
        auto msg = parse_message(Json{{"jsonrpc", "2.0"}, {"id", "a"}, {"method", "ping"}});
        REQUIRE(msg.has_value());
        const auto* request = std::get_if<JsonRpcRequest>(&*msg);
        REQUIRE(request != nullptr);
        REQUIRE(request->method() == "ping");
        REQUIRE(request->id() == JsonRpcId::string("a"));
    }

    SECTION("method alone is a notification") {
        auto msg = parse_message(Json{
            {"jsonrpc", "2.0"},
            {"method", "notifications/tools/list_changed"}
        });
        REQUIRE(msg.has_value());
        REQUIRE(std::holds_alternative<JsonRpcNotification>(*msg));
    }

    SECTION("id alone is a reply") {
        auto msg = parse_message(Json{{"jsonrpc", "2.0"}, {"id", 3}, {"result", {{"ok", true}}}});
        REQUIRE(msg.has_value());
        const auto* reply = std::get_if<JsonRpcReply>(&*msg);
        REQUIRE(reply != nullptr);
        REQUIRE(reply->id()->as_integer() == 3);
        REQUIRE_FALSE(reply->is_error());
        REQUIRE(reply->result()["ok"] == true);
    }

    SECTION("neither method nor id is rejected") {
        auto msg = parse_message(Json{{"jsonrpc", "2.0"}, {"result", 1}});
        REQUIRE_FALSE(msg.has_value());
        REQUIRE(msg.error().code == JsonError::Code::UnknownShape);
    }

    SECTION("non-object payload is rejected") {
        auto msg = parse_message(Json::array({1, 2}));
        REQUIRE_FALSE(msg.has_value());
    }
}

TEST_CASE("JsonRpcReply error shapes", "[json-rpc][reply]") {
    SECTION("Error reply carries code, message and data") {
        auto msg = parse_message(Json{
            {"jsonrpc", "2.0"},
            {"id", 9},
            {"error", {{"code", -32602}, {"message", "bad params"}, {"data", {{"field", "a"}}}}}
        });
        REQUIRE(msg.has_value());
        const auto& reply = std::get<JsonRpcReply>(*msg);
        REQUIRE(reply.is_error());
        REQUIRE(reply.error().code == -32602);
        REQUIRE(reply.error().message == "bad params");
        REQUIRE(reply.error().data.has_value());
        REQUIRE_THROWS_AS(reply.result(), std::logic_error);
    }

    SECTION("Error reply may have a null id") {
        auto reply = JsonRpcReply::from_json(Json{
            {"jsonrpc", "2.0"},
            {"id", nullptr},
            {"error", {{"code", -32700}, {"message", "Parse error"}}}
        });
        REQUIRE(reply.has_value());
        REQUIRE_FALSE(reply->id().has_value());
    }

    SECTION("Success reply requires an id") {
        auto reply = JsonRpcReply::from_json(Json{{"jsonrpc", "2.0"}, {"id", nullptr}, {"result", 1}});
        REQUIRE_FALSE(reply.has_value());
        REQUIRE(reply.error().code == JsonError::Code::InvalidId);
    }

    SECTION("Both result and error is rejected") {
        auto reply = JsonRpcReply::from_json(Json{
            {"jsonrpc", "2.0"}, {"id", 1}, {"result", 1}, {"error", {{"code", 1}, {"message", "x"}}}
        });
        REQUIRE_FALSE(reply.has_value());
        REQUIRE(reply.error().code == JsonError::Code::UnknownShape);
    }

    SECTION("Serialized failure keeps null id") {
        auto j = JsonRpcReply::failure(std::nullopt, JsonRpcError{-32601, "Method not found: x"}).to_json();
        REQUIRE(j["id"].is_null());
        REQUIRE(j["error"]["code"] == -32601);
    }
}

TEST_CASE("JsonRpcRequest parsing surfaces detailed errors", "[json-rpc][request][error]") {
    SECTION("Wrong version") {
        auto parsed = JsonRpcRequest::from_json(Json{{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == JsonError::Code::InvalidVersion);
    }

    SECTION("Missing version") {
        auto parsed = JsonRpcRequest::from_json(Json{{"id", 1}, {"method", "ping"}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == JsonError::Code::MissingField);
    }

    SECTION("Fractional id") {
        auto parsed = JsonRpcRequest::from_json(Json{{"jsonrpc", "2.0"}, {"id", 1.5}, {"method", "ping"}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == JsonError::Code::InvalidId);
    }

    SECTION("Scalar params") {
        auto parsed = JsonRpcRequest::from_json(Json{
            {"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}, {"params", 5}
        });
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == JsonError::Code::InvalidParams);
    }
}

TEST_CASE("decode_message rejects text that is not JSON", "[json-rpc][framing]") {
    auto msg = decode_message("{not json");
    REQUIRE_FALSE(msg.has_value());
    REQUIRE(msg.error().code == JsonError::Code::ParseError);

    auto ok = decode_message("{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\r\n");
    REQUIRE(ok.has_value());
}
