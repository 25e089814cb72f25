// ─────────────────────────────────────────────────────────────────────────────
// MCP Types Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcplink/protocol/mcp_types.hpp"

using namespace mcplink;

// ═══════════════════════════════════════════════════════════════════════════
// Negotiation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("InitializeParams declares roots and client info", "[mcp][types]") {
    InitializeParams params;
    params.client_info = {"mcplink", "0.1.0"};

    auto json = params.to_json();

    REQUIRE(json["protocolVersion"] == "2024-11-05");
    REQUIRE(json["capabilities"]["roots"]["listChanged"] == true);
    REQUIRE(json["clientInfo"]["name"] == "mcplink");
    REQUIRE(json["clientInfo"]["version"] == "0.1.0");
}

TEST_CASE("ServerCapabilities records which catalogs were advertised", "[mcp][types]") {
    SECTION("All present") {
        auto caps = ServerCapabilities::from_json(Json{
            {"tools", {{"listChanged", true}}},
            {"resources", {{"subscribe", true}}},
            {"prompts", Json::object()},
            {"logging", Json::object()}
        });
        REQUIRE(caps.has_tools());
        REQUIRE(caps.tools->list_changed);
        REQUIRE(caps.has_resources());
        REQUIRE(caps.resources->subscribe);
        REQUIRE(caps.has_prompts());
        REQUIRE(caps.logging.has_value());
    }

    SECTION("Absent members stay absent") {
        auto caps = ServerCapabilities::from_json(Json{{"tools", Json::object()}});
        REQUIRE(caps.has_tools());
        REQUIRE_FALSE(caps.has_prompts());
        REQUIRE_FALSE(caps.has_resources());
    }

    SECTION("Non-object input gives empty capabilities") {
        auto caps = ServerCapabilities::from_json(Json("nope"));
        REQUIRE_FALSE(caps.has_tools());
    }
}

TEST_CASE("InitializeResult deserialization", "[mcp][types]") {
    auto result = InitializeResult::from_json(Json{
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"tools", Json::object()}}},
        {"serverInfo", {{"name", "fs-server"}, {"version", "3.1.0"}}},
        {"instructions", "Paths are absolute"}
    });

    REQUIRE(result.protocol_version == "2024-11-05");
    REQUIRE(result.server_info.name == "fs-server");
    REQUIRE(result.capabilities.has_tools());
    REQUIRE(result.instructions == "Paths are absolute");
}

// ═══════════════════════════════════════════════════════════════════════════
// Input schema
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("InputSchema keeps declared property order", "[mcp][types][schema]") {
    auto tool = Tool::from_json(Json::parse(R"({
        "name": "search",
        "inputSchema": {
            "type": "object",
            "properties": {
                "zeta":  {"type": "string"},
                "alpha": {"type": "integer", "default": 10},
                "mid":   {"type": ["string", "null"], "description": "optional"}
            },
            "required": ["zeta"]
        }
    })"));

    const auto& props = tool.input_schema.properties;
    REQUIRE(props.size() == 3);
    REQUIRE(props[0].name == "zeta");
    REQUIRE(props[1].name == "alpha");
    REQUIRE(props[2].name == "mid");

    REQUIRE(props[1].has_default());
    REQUIRE(*props[1].default_value == 10);
    REQUIRE(props[2].type == "string");
    REQUIRE(props[2].description == "optional");

    SECTION("Serializing keeps the order too") {
        auto j = tool.to_json();
        auto it = j["inputSchema"]["properties"].begin();
        REQUIRE(it.key() == "zeta");
        ++it;
        REQUIRE(it.key() == "alpha");
    }
}

TEST_CASE("InputSchema required-ness is set membership", "[mcp][types][schema]") {
    auto schema = InputSchema::from_json(Json::parse(R"({
        "type": "object",
        "properties": {"a": {}, "b": {}, "c": {}},
        "required": ["c", "a"]
    })"));

    REQUIRE(schema.is_required("a"));
    REQUIRE_FALSE(schema.is_required("b"));
    REQUIRE(schema.is_required("c"));
    REQUIRE(schema.required_count() == 2);
    REQUIRE(schema.find("b") != nullptr);
    REQUIRE(schema.find("missing") == nullptr);
}

TEST_CASE("InputSchema parses nested array item schemas", "[mcp][types][schema]") {
    auto schema = InputSchema::from_json(Json::parse(R"({
        "type": "object",
        "properties": {
            "edits": {
                "type": "array",
                "items": {
                    "type": "object",
                    "properties": {
                        "oldText": {"type": "string", "description": "Text to replace"},
                        "newText": {"type": "string"}
                    },
                    "required": ["oldText", "newText"]
                }
            },
            "tags": {"type": "array", "items": {"type": "string"}, "enum": [["a"], ["b"]]}
        }
    })"));

    const auto* edits = schema.find("edits");
    REQUIRE(edits != nullptr);
    REQUIRE(edits->is_array());
    REQUIRE(edits->items != nullptr);
    REQUIRE(edits->items->properties.size() == 2);
    REQUIRE(edits->items->properties[0].name == "oldText");
    REQUIRE(edits->items->is_required("newText"));

    const auto* tags = schema.find("tags");
    REQUIRE(tags->items->type == "string");
    REQUIRE(tags->enum_values->size() == 2);
}

TEST_CASE("InputSchema tolerates missing or malformed input", "[mcp][types][schema]") {
    auto empty = InputSchema::from_json(Json(nullptr));
    REQUIRE(empty.type == "object");
    REQUIRE(empty.properties.empty());

    auto tool = Tool::from_json(Json{{"name", "bare"}});
    REQUIRE(tool.input_schema.properties.empty());
    REQUIRE(tool.to_json()["inputSchema"]["type"] == "object");
}

// ═══════════════════════════════════════════════════════════════════════════
// Resources and prompts
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Resource types deserialize", "[mcp][types][resources]") {
    auto resource = Resource::from_json(Json{
        {"uri", "file:///etc/hosts"}, {"name", "hosts"}, {"mimeType", "text/plain"}
    });
    REQUIRE(resource.uri == "file:///etc/hosts");
    REQUIRE(resource.mime_type == "text/plain");

    auto tmpl = ResourceTemplate::from_json(Json{
        {"uriTemplate", "file:///logs/{date}"}, {"name", "daily-log"}
    });
    REQUIRE(tmpl.uri_template == "file:///logs/{date}");

    auto read = ReadResourceResult::from_json(Json{{"contents", Json::array({
        {{"uri", "file:///a"}, {"text", "hello"}},
        {{"uri", "file:///b"}, {"blob", "AAEC"}}
    })}});
    REQUIRE(read.contents.size() == 2);
    REQUIRE(read.contents[0].is_text());
    REQUIRE_FALSE(read.contents[1].is_text());
}

TEST_CASE("Prompt types deserialize", "[mcp][types][prompts]") {
    auto prompt = Prompt::from_json(Json{
        {"name", "review"},
        {"arguments", Json::array({{{"name", "code"}, {"required", true}}})}
    });
    REQUIRE(prompt.arguments.size() == 1);
    REQUIRE(prompt.arguments[0].required);

    auto result = GetPromptResult::from_json(Json{
        {"description", "Code review"},
        {"messages", Json::array({{{"role", "user"}, {"content", {{"type", "text"}, {"text", "hi"}}}}})}
    });
    REQUIRE(result.messages.size() == 1);
    REQUIRE(result.messages[0].role == "user");
    REQUIRE(result.messages[0].content["text"] == "hi");
}

// ═══════════════════════════════════════════════════════════════════════════
// Errors and notifications
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("McpError keeps code, message and data", "[mcp][types][error]") {
    auto err = McpError::from_json(Json{{"code", -32602}, {"message", "Invalid params"}, {"data", "x"}});
    REQUIRE(err.code == ErrorCode::InvalidParams);
    REQUIRE(err.message == "Invalid params");
    REQUIRE(err.to_json()["data"] == "x");
}

TEST_CASE("Notification payloads", "[mcp][types][notification]") {
    SECTION("Cancelled with integer id") {
        CancelledNotification cancelled;
        cancelled.request_id = std::int64_t{12};
        cancelled.reason = "user abort";
        auto j = cancelled.to_json();
        REQUIRE(j["requestId"] == 12);
        REQUIRE(j["reason"] == "user abort");

        auto back = CancelledNotification::from_json(j);
        REQUIRE(std::get<std::int64_t>(back.request_id) == 12);
    }

    SECTION("Logging message text") {
        auto text_msg = LoggingMessageNotification::from_json(Json{{"level", "warning"}, {"data", "disk low"}});
        REQUIRE(text_msg.level == "warning");
        REQUIRE(text_msg.text() == "disk low");

        auto structured = LoggingMessageNotification::from_json(Json{{"logger", "db"}, {"data", {{"rows", 3}}}});
        REQUIRE(structured.level == "info");
        REQUIRE(structured.logger == "db");
        REQUIRE(structured.text() == "{\"rows\":3}");
    }
}

TEST_CASE("ListRootsResult serializes configured roots", "[mcp][types][roots]") {
    ListRootsResult result{{Root{"file:///work", "work"}, Root{"file:///tmp", std::nullopt}}};
    auto j = result.to_json();
    REQUIRE(j["roots"].size() == 2);
    REQUIRE(j["roots"][0]["name"] == "work");
    REQUIRE_FALSE(j["roots"][1].contains("name"));
}
