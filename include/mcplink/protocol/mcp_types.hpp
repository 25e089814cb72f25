#ifndef MCPLINK_PROTOCOL_MCP_TYPES_HPP
#define MCPLINK_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcplink {

using Json = nlohmann::ordered_json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Method Names
// ═══════════════════════════════════════════════════════════════════════════

namespace method {
    inline constexpr const char* Initialize = "initialize";
    inline constexpr const char* Initialized = "notifications/initialized";
    inline constexpr const char* Ping = "ping";
    inline constexpr const char* ToolsList = "tools/list";
    inline constexpr const char* ToolsCall = "tools/call";
    inline constexpr const char* PromptsList = "prompts/list";
    inline constexpr const char* PromptsGet = "prompts/get";
    inline constexpr const char* ResourcesList = "resources/list";
    inline constexpr const char* ResourcesRead = "resources/read";
    inline constexpr const char* ResourceTemplatesList = "resources/templates/list";
    inline constexpr const char* RootsList = "roots/list";
    inline constexpr const char* Cancelled = "notifications/cancelled";
    inline constexpr const char* Message = "notifications/message";
    inline constexpr const char* ToolsListChanged = "notifications/tools/list_changed";
    inline constexpr const char* PromptsListChanged = "notifications/prompts/list_changed";
    inline constexpr const char* ResourcesListChanged = "notifications/resources/list_changed";
}

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

struct ClientCapabilities {
    struct Roots {
        bool list_changed = false;
    };

    std::optional<Roots> roots = Roots{true};
    Json experimental;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (roots) {
            j["roots"] = {{"listChanged", roots->list_changed}};
        }
        if (!experimental.empty()) {
            j["experimental"] = experimental;
        }
        return j;
    }
};

/// Advertised at negotiation and immutable afterwards. An absent member means
/// the server did not declare that capability at all.
struct ServerCapabilities {
    struct Prompts {
        bool list_changed = false;
    };
    struct Resources {
        bool subscribe = false;
        bool list_changed = false;
    };
    struct Tools {
        bool list_changed = false;
    };
    struct Logging {};

    std::optional<Prompts> prompts;
    std::optional<Resources> resources;
    std::optional<Tools> tools;
    std::optional<Logging> logging;
    Json experimental;
    Json raw = Json::object();

    [[nodiscard]] bool has_tools() const noexcept { return tools.has_value(); }
    [[nodiscard]] bool has_prompts() const noexcept { return prompts.has_value(); }
    [[nodiscard]] bool has_resources() const noexcept { return resources.has_value(); }

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (j.is_object() == false) {
            return caps;
        }
        caps.raw = j;
        if (j.contains("prompts")) {
            caps.prompts = Prompts{
                j["prompts"].value("listChanged", false)
            };
        }
        if (j.contains("resources")) {
            caps.resources = Resources{
                j["resources"].value("subscribe", false),
                j["resources"].value("listChanged", false)
            };
        }
        if (j.contains("tools")) {
            caps.tools = Tools{
                j["tools"].value("listChanged", false)
            };
        }
        if (j.contains("logging")) {
            caps.logging = Logging{};
        }
        if (j.contains("experimental")) {
            caps.experimental = j["experimental"];
        }
        return caps;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Request/Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = j.value("protocolVersion", "");
        if (j.contains("capabilities")) {
            result.capabilities = ServerCapabilities::from_json(j["capabilities"]);
        }
        if (j.contains("serverInfo")) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("instructions") && j["instructions"].is_string()) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Input Schema
// ═══════════════════════════════════════════════════════════════════════════
// The JSON-schema subset tools use to describe their arguments, parsed into
// value types once at the catalog boundary. Property order is the order the
// server declared them in.

struct InputSchema;

struct SchemaProperty {
    std::string name;
    std::string type;
    std::optional<std::string> description;
    std::optional<Json> default_value;
    std::optional<std::vector<Json>> enum_values;
    std::shared_ptr<const InputSchema> items;  // array element schema

    [[nodiscard]] bool has_default() const noexcept { return default_value.has_value(); }
    [[nodiscard]] bool is_array() const noexcept { return type == "array"; }

    [[nodiscard]] Json to_json() const;
};

struct InputSchema {
    std::string type{"object"};
    std::vector<SchemaProperty> properties;
    std::vector<std::string> required;

    /// Membership test, independent of where the name sits in `required`.
    [[nodiscard]] bool is_required(std::string_view property_name) const;

    [[nodiscard]] const SchemaProperty* find(std::string_view property_name) const;

    [[nodiscard]] std::size_t required_count() const;

    [[nodiscard]] Json to_json() const;

    /// Non-object input yields an empty object schema.
    static InputSchema from_json(const Json& j);
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::optional<std::string> description;
    InputSchema input_schema;

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema")) {
            tool.input_schema = InputSchema::from_json(j["inputSchema"]);
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) {
            j["description"] = *description;
        }
        j["inputSchema"] = input_schema.to_json();
        return j;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    static Resource from_json(const Json& j) {
        Resource res;
        res.uri = j.value("uri", "");
        res.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            res.description = j["description"].get<std::string>();
        }
        if (j.contains("mimeType") && j["mimeType"].is_string()) {
            res.mime_type = j["mimeType"].get<std::string>();
        }
        return res;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}, {"name", name}};
        if (description) j["description"] = *description;
        if (mime_type) j["mimeType"] = *mime_type;
        return j;
    }
};

// URI templates for dynamic resources (RFC 6570).
struct ResourceTemplate {
    std::string uri_template;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    [[nodiscard]] static ResourceTemplate from_json(const Json& j) {
        ResourceTemplate tmpl;
        tmpl.uri_template = j.value("uriTemplate", "");
        tmpl.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            tmpl.description = j["description"].get<std::string>();
        }
        if (j.contains("mimeType") && j["mimeType"].is_string()) {
            tmpl.mime_type = j["mimeType"].get<std::string>();
        }
        return tmpl;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"uriTemplate", uri_template},
            {"name", name}
        };
        if (description) j["description"] = *description;
        if (mime_type) j["mimeType"] = *mime_type;
        return j;
    }
};

struct ResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // Base64 encoded

    static ResourceContents from_json(const Json& j) {
        ResourceContents contents;
        contents.uri = j.value("uri", "");
        if (j.contains("mimeType") && j["mimeType"].is_string()) {
            contents.mime_type = j["mimeType"].get<std::string>();
        }
        if (j.contains("text") && j["text"].is_string()) {
            contents.text = j["text"].get<std::string>();
        }
        if (j.contains("blob") && j["blob"].is_string()) {
            contents.blob = j["blob"].get<std::string>();
        }
        return contents;
    }

    [[nodiscard]] bool is_text() const { return text.has_value(); }
};

struct ReadResourceResult {
    std::vector<ResourceContents> contents;

    static ReadResourceResult from_json(const Json& j) {
        ReadResourceResult result;
        if (j.contains("contents") && j["contents"].is_array()) {
            for (const auto& c : j["contents"]) {
                result.contents.push_back(ResourceContents::from_json(c));
            }
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Prompts
// ═══════════════════════════════════════════════════════════════════════════

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    static PromptArgument from_json(const Json& j) {
        PromptArgument arg;
        arg.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            arg.description = j["description"].get<std::string>();
        }
        arg.required = j.value("required", false);
        return arg;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        if (required) j["required"] = required;
        return j;
    }
};

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    static Prompt from_json(const Json& j) {
        Prompt prompt;
        prompt.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            prompt.description = j["description"].get<std::string>();
        }
        if (j.contains("arguments") && j["arguments"].is_array()) {
            for (const auto& a : j["arguments"]) {
                prompt.arguments.push_back(PromptArgument::from_json(a));
            }
        }
        return prompt;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        if (!arguments.empty()) {
            j["arguments"] = Json::array();
            for (const auto& arg : arguments) {
                j["arguments"].push_back(arg.to_json());
            }
        }
        return j;
    }
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    Json content;

    static PromptMessage from_json(const Json& j) {
        PromptMessage msg;
        msg.role = j.value("role", "");
        if (j.contains("content")) {
            msg.content = j["content"];
        }
        return msg;
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;

    static GetPromptResult from_json(const Json& j) {
        GetPromptResult result;
        if (j.contains("description") && j["description"].is_string()) {
            result.description = j["description"].get<std::string>();
        }
        if (j.contains("messages") && j["messages"].is_array()) {
            for (const auto& m : j["messages"]) {
                result.messages.push_back(PromptMessage::from_json(m));
            }
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Roots
// ═══════════════════════════════════════════════════════════════════════════
// Filesystem boundaries the client exposes; answered on "roots/list".

struct Root {
    std::string uri;
    std::optional<std::string> name;

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}};
        if (name) j["name"] = *name;
        return j;
    }
};

struct ListRootsResult {
    std::vector<Root> roots;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        j["roots"] = Json::array();
        for (const auto& r : roots) {
            j["roots"].push_back(r.to_json());
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

struct McpError {
    std::int64_t code = 0;
    std::string message;
    std::optional<Json> data;

    static McpError from_json(const Json& j) {
        McpError err;
        err.code = j.value("code", std::int64_t{0});
        err.message = j.value("message", "");
        if (j.contains("data")) {
            err.data = j["data"];
        }
        return err;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"code", code}, {"message", message}};
        if (data) j["data"] = *data;
        return j;
    }
};

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

// ═══════════════════════════════════════════════════════════════════════════
// Notifications
// ═══════════════════════════════════════════════════════════════════════════

struct CancelledNotification {
    std::variant<std::string, std::int64_t> request_id{std::int64_t{0}};
    std::optional<std::string> reason;

    [[nodiscard]] static CancelledNotification from_json(const Json& j) {
        CancelledNotification result;
        if (j.contains("requestId")) {
            if (j["requestId"].is_string()) {
                result.request_id = j["requestId"].get<std::string>();
            } else if (j["requestId"].is_number_integer()) {
                result.request_id = j["requestId"].get<std::int64_t>();
            }
        }
        if (j.contains("reason") && j["reason"].is_string()) {
            result.reason = j["reason"].get<std::string>();
        }
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        std::visit([&j](const auto& id) { j["requestId"] = id; }, request_id);
        if (reason) {
            j["reason"] = *reason;
        }
        return j;
    }
};

// Server log line: "notifications/message" { level, logger?, data }
struct LoggingMessageNotification {
    std::string level{"info"};
    std::optional<std::string> logger;
    Json data;

    [[nodiscard]] static LoggingMessageNotification from_json(const Json& j) {
        LoggingMessageNotification result;
        if (j.contains("level") && j["level"].is_string()) {
            result.level = j["level"].get<std::string>();
        }
        if (j.contains("logger") && j["logger"].is_string()) {
            result.logger = j["logger"].get<std::string>();
        }
        if (j.contains("data")) {
            result.data = j["data"];
        }
        return result;
    }

    /// Strings are shown verbatim, anything else as compact JSON.
    [[nodiscard]] std::string text() const {
        if (data.is_string()) {
            return data.get<std::string>();
        }
        return data.dump();
    }
};

}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_MCP_TYPES_HPP
