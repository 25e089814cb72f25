// ─────────────────────────────────────────────────────────────────────────────
// Tool Invoker Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcplink/client/tool_invoker.hpp"
#include "mocks/mock_stream_transport.hpp"

#include <asio/io_context.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace mcplink;
using mcplink::testing::MockStreamTransport;

namespace {

const char* kSearchTool = R"({
    "name": "search",
    "description": "Search documents",
    "inputSchema": {
        "type": "object",
        "properties": {
            "a": {"type": "string", "description": "query"},
            "b": {"type": "integer", "description": "limit"},
            "c": {"type": "boolean", "default": false},
            "d": {"type": "string"}
        },
        "required": ["a", "b"]
    }
})";

Tool search_tool() {
    return Tool::from_json(Json::parse(kSearchTool));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// build_call
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("build_call zips positional values against property order", "[tool][marshal]") {
    const Tool tool = search_tool();

    SECTION("Required values only") {
        auto args = build_call(tool, {Json("x"), Json(5)});
        REQUIRE(args.has_value());
        REQUIRE(*args == Json{{"a", "x"}, {"b", 5}, {"c", false}});
        REQUIRE(args->dump() == R"({"a":"x","b":5,"c":false})");
    }

    SECTION("Supplied values override defaults") {
        auto args = build_call(tool, {Json("x"), Json(5), Json(true), Json("extra")});
        REQUIRE(args.has_value());
        REQUIRE((*args)["c"] == true);
        REQUIRE((*args)["d"] == "extra");
    }

    SECTION("Too few values") {
        auto args = build_call(tool, {});
        REQUIRE_FALSE(args.has_value());
        REQUIRE(args.error().code == ClientErrorCode::ArgumentMismatch);
        REQUIRE(args.error().message.find("search") != std::string::npos);
        REQUIRE(args.error().message.find("[a, b]") != std::string::npos);
        REQUIRE(args.error().message.find("got []") != std::string::npos);
    }

    SECTION("Too many values") {
        auto args = build_call(tool, {Json(1), Json(2), Json(3), Json(4), Json(5)});
        REQUIRE_FALSE(args.has_value());
        REQUIRE(args.error().code == ClientErrorCode::ArgumentMismatch);
        REQUIRE(args.error().message.find("at most 4") != std::string::npos);
    }

    SECTION("Values that are not valid UTF-8 still produce a message") {
        auto args = build_call(tool, {Json(std::string("\xff")), Json(2), Json(3), Json(4), Json(5)});
        REQUIRE_FALSE(args.has_value());
        REQUIRE(args.error().code == ClientErrorCode::ArgumentMismatch);
        REQUIRE(args.error().message.find("at most 4") != std::string::npos);
    }
}

TEST_CASE("build_call treats required as set membership", "[tool][marshal]") {
    // Required property declared last: one positional value lands on "first"
    auto tool = Tool::from_json(Json::parse(R"({
        "name": "t",
        "inputSchema": {
            "type": "object",
            "properties": {"first": {"type": "string"}, "second": {"type": "string"}},
            "required": ["second"]
        }
    })"));

    auto one = build_call(tool, {Json("v")});
    REQUIRE_FALSE(one.has_value());
    REQUIRE(one.error().message.find("missing required argument 'second'") != std::string::npos);

    auto two = build_call(tool, {Json("v"), Json("w")});
    REQUIRE(two.has_value());
    REQUIRE((*two)["second"] == "w");
}

TEST_CASE("build_call on a tool without parameters", "[tool][marshal]") {
    auto tool = Tool::from_json(Json{{"name", "now"}});
    auto args = build_call(tool, {});
    REQUIRE(args.has_value());
    REQUIRE(args->is_object());
    REQUIRE(args->empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// extract_text
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("extract_text joins text entries", "[tool][result]") {
    auto result = Json::parse(R"({
        "content": [
            {"type": "text", "text": "foo"},
            {"type": "image", "data": "AAAA", "mimeType": "image/png"},
            {"type": "text", "text": "bar"}
        ]
    })");
    REQUIRE(extract_text(result) == "foo\nbar");

    REQUIRE(extract_text(Json{{"content", Json::array()}}).empty());
    REQUIRE(extract_text(Json::object()).empty());
    REQUIRE(extract_text(Json{{"content", Json::array({Json{{"type", "text"}, {"text", ""}}})}}).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// tool_spec
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("tool_spec normalizes the descriptor", "[tool][spec]") {
    auto tool = Tool::from_json(Json::parse(R"({
        "name": "batch",
        "description": "Run a batch",
        "inputSchema": {
            "type": "object",
            "properties": {
                "jobs": {
                    "type": "array",
                    "description": "Jobs to run",
                    "items": {
                        "type": "object",
                        "properties": {
                            "id": {"type": "string", "description": "job id"},
                            "weight": {"type": "number"}
                        },
                        "required": ["id"]
                    }
                },
                "tags": {"type": "array", "items": {"type": "string"}},
                "dry_run": {"type": "boolean", "default": true}
            },
            "required": ["jobs"]
        }
    })"));

    auto spec = tool_spec(tool);
    REQUIRE(spec.name == "batch");
    REQUIRE(spec.description == "Run a batch");
    REQUIRE(spec.parameters.size() == 3);

    const auto& jobs = spec.parameters[0];
    REQUIRE(jobs.name == "jobs");
    REQUIRE(jobs.required);
    REQUIRE(jobs.items.has_value());
    REQUIRE(jobs.items->type == "object");
    REQUIRE(jobs.items->properties.size() == 2);
    REQUIRE(jobs.items->properties[0].description == "job id");
    REQUIRE(jobs.items->required == std::vector<std::string>{"id"});

    const auto& tags = spec.parameters[1];
    REQUIRE(tags.items.has_value());
    REQUIRE(tags.items->type == "string");

    auto tags_json = tags.to_json();
    REQUIRE(tags_json["items"]["properties"] == Json::object());
    REQUIRE(tags_json["items"]["required"] == Json::array());

    const auto& dry_run = spec.parameters[2];
    REQUIRE_FALSE(dry_run.required);
    REQUIRE_FALSE(dry_run.items.has_value());
    REQUIRE(dry_run.to_json()["default"] == true);

    auto j = spec.to_json();
    REQUIRE(j["parameters"].size() == 3);
    REQUIRE(j["parameters"][0]["name"] == "jobs");
}

// ═══════════════════════════════════════════════════════════════════════════
// invoke / invoke_async
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("invoke calls the tool and flattens the text", "[tool][invoke]") {
    asio::io_context io;
    auto transport = std::make_unique<MockStreamTransport>(io);
    auto* server = transport.get();
    server->add_tool(Json::parse(kSearchTool));
    server->on_request("tools/call", [](const Json& params) {
        const auto& args = params["arguments"];
        return Json{{"content", Json::array({
            Json{{"type", "text"}, {"text", "query=" + args["a"].get<std::string>()}},
            Json{{"type", "text"}, {"text", "limit=" + std::to_string(args["b"].get<int>())}}
        })}};
    });

    auto conn = Connection::create("docs", io, std::move(transport));
    REQUIRE(conn->connect().has_value());
    REQUIRE(conn->list_tools().has_value());

    SECTION("Synchronous") {
        auto text = invoke(*conn, "search", {Json("x"), Json(5)});
        REQUIRE(text.has_value());
        REQUIRE(*text == "query=x\nlimit=5");

        auto call = server->last_written("tools/call");
        REQUIRE(call.has_value());
        REQUIRE((*call)["params"]["name"] == "search");
        REQUIRE((*call)["params"]["arguments"] == Json{{"a", "x"}, {"b", 5}, {"c", false}});
    }

    SECTION("Unknown tool") {
        auto text = invoke(*conn, "missing", {});
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().code == ClientErrorCode::NotFound);
        REQUIRE(text.error().message.find("'docs'") != std::string::npos);
    }

    SECTION("Argument mismatch is caught before anything is sent") {
        auto text = invoke(*conn, "search", {});
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().code == ClientErrorCode::ArgumentMismatch);
        REQUIRE(server->count_written("tools/call") == 0);
    }

    SECTION("Remote error names the tool and the code") {
        server->fail_request("tools/call", -32603, "backend down");
        auto text = invoke(*conn, "search", {Json("x"), Json(5)});
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().code == ClientErrorCode::RpcError);
        REQUIRE(text.error().message == "Tool 'search' failed with error -32603: backend down");
    }

    SECTION("Asynchronous") {
        std::optional<ClientResult<std::string>> got;
        auto id = invoke_async(*conn, "search", {Json("y"), Json(1)},
            [&got](ClientResult<std::string> r) { got = std::move(r); });
        REQUIRE(id.has_value());
        io.restart();
        io.run();
        REQUIRE(got.has_value());
        REQUIRE(**got == "query=y\nlimit=1");
    }

    SECTION("Arguments that cannot be encoded fail without a pending call") {
        auto text = invoke(*conn, "search", {Json(std::string("\xff")), Json(5)});
        REQUIRE_FALSE(text.has_value());
        REQUIRE(text.error().code == ClientErrorCode::ProtocolError);
        REQUIRE(text.error().message.find("Tool 'search' failed") != std::string::npos);

        auto id = invoke_async(*conn, "search", {Json(std::string("\xff")), Json(5)},
            [](ClientResult<std::string>) { FAIL("callback must not run"); });
        REQUIRE_FALSE(id.has_value());
        REQUIRE(id.error().code == ClientErrorCode::ProtocolError);
        io.restart();
        io.run();

        REQUIRE(conn->pending_count() == 0);
        REQUIRE(server->count_written("tools/call") == 0);
    }

    SECTION("Asynchronous local failure skips the callback") {
        bool called = false;
        auto id = invoke_async(*conn, "search", {Json("only")},
            [&called](ClientResult<std::string>) { called = true; });
        REQUIRE_FALSE(id.has_value());
        io.restart();
        io.run();
        REQUIRE_FALSE(called);
    }
}
