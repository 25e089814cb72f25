// ─────────────────────────────────────────────────────────────────────────────
// mcplink-cli - MCP Server Inspection Tool
// ─────────────────────────────────────────────────────────────────────────────
// Spawns an MCP server as a child process, negotiates, and runs one command
// against it.
//
// Usage:
//   mcplink-cli -c npx -a -y -a @modelcontextprotocol/server-filesystem -a /tmp --list-tools
//   mcplink-cli -c python -a server.py --call-tool read_file --arg /tmp/test.txt
//   mcplink-cli -c ./server --tool-specs --json
//
// Tool arguments are positional: each --arg is matched to the next property
// of the tool's input schema. A value that parses as JSON is sent as JSON,
// anything else as a string.

#include <cxxopts.hpp>

#include "mcplink/client/connection.hpp"
#include "mcplink/client/tool_invoker.hpp"
#include "mcplink/log/spdlog_logger.hpp"
#include "mcplink/transport/process_transport.hpp"

#include <asio/io_context.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace mcplink;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

void print_item(const std::string& name, const std::optional<std::string>& description) {
    std::cout << color::c(color::bold) << color::c(color::yellow)
              << "• " << name << color::c(color::reset);
    if (description) {
        std::cout << "\n  " << color::c(color::dim) << *description << color::c(color::reset);
    }
    std::cout << "\n\n";
}

void print_empty(const std::string& what) {
    std::cout << color::c(color::dim) << "(no " << what << " available)" << color::c(color::reset) << "\n";
}

int fail(const ClientError& error) {
    print_error(error.describe());
    return 1;
}

template <typename T>
Json to_json_array(const std::vector<T>& items) {
    Json out = Json::array();
    for (const auto& item : items) {
        out.push_back(item.to_json());
    }
    return out;
}

// A value that parses as JSON is taken as JSON; anything else is a string
Json parse_argument(const std::string& raw) {
    Json parsed = Json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return Json(raw);
    }
    return parsed;
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_info(Connection& conn, bool json_output) {
    const auto& caps = conn.capabilities();
    if (json_output) {
        Json output = {
            {"serverInfo", conn.server_info().to_json()},
            {"protocolVersion", conn.config().protocol_version},
            {"capabilities", {
                {"tools", caps.has_tools()},
                {"prompts", caps.has_prompts()},
                {"resources", caps.has_resources()},
                {"logging", caps.logging.has_value()}
            }}
        };
        if (conn.instructions()) {
            output["instructions"] = *conn.instructions();
        }
        print_json(output);
        return 0;
    }

    print_header("Server Info");
    std::cout << color::c(color::bold) << "Name:     " << color::c(color::reset)
              << conn.server_info().name << "\n";
    std::cout << color::c(color::bold) << "Version:  " << color::c(color::reset)
              << conn.server_info().version << "\n";
    std::cout << color::c(color::bold) << "Protocol: " << color::c(color::reset)
              << conn.config().protocol_version << "\n";

    std::cout << "\n" << color::c(color::bold) << "Capabilities:" << color::c(color::reset) << "\n";
    std::cout << "  • Tools:     " << (caps.has_tools() ? "✓" : "✗") << "\n";
    std::cout << "  • Resources: " << (caps.has_resources() ? "✓" : "✗") << "\n";
    std::cout << "  • Prompts:   " << (caps.has_prompts() ? "✓" : "✗") << "\n";
    std::cout << "  • Logging:   " << (caps.logging ? "✓" : "✗") << "\n";

    if (conn.instructions()) {
        std::cout << "\n" << color::c(color::bold) << "Instructions:" << color::c(color::reset) << "\n";
        std::cout << *conn.instructions() << "\n";
    }
    return 0;
}

int cmd_ping(Connection& conn, bool json_output) {
    auto result = conn.ping();
    if (!result) {
        return fail(result.error());
    }
    if (json_output) {
        print_json(Json{{"status", "ok"}});
    } else {
        print_success("Server responded to ping");
    }
    return 0;
}

int cmd_list_tools(Connection& conn, bool json_output) {
    auto tools = conn.list_tools();
    if (!tools) {
        return fail(tools.error());
    }
    if (json_output) {
        print_json(to_json_array(*tools));
        return 0;
    }

    print_header("Tools");
    if (tools->empty()) {
        print_empty("tools");
    }
    for (const auto& tool : *tools) {
        print_item(tool.name, tool.description);
    }
    return 0;
}

int cmd_tool_specs(Connection& conn) {
    auto tools = conn.list_tools();
    if (!tools) {
        return fail(tools.error());
    }
    Json output = Json::array();
    for (const auto& tool : *tools) {
        output.push_back(tool_spec(tool).to_json());
    }
    print_json(output);
    return 0;
}

int cmd_list_prompts(Connection& conn, bool json_output) {
    auto prompts = conn.list_prompts();
    if (!prompts) {
        return fail(prompts.error());
    }
    if (json_output) {
        print_json(to_json_array(*prompts));
        return 0;
    }

    print_header("Prompts");
    if (prompts->empty()) {
        print_empty("prompts");
    }
    for (const auto& prompt : *prompts) {
        print_item(prompt.name, prompt.description);
    }
    return 0;
}

int cmd_list_resources(Connection& conn, bool json_output) {
    auto resources = conn.list_resources();
    if (!resources) {
        return fail(resources.error());
    }
    if (json_output) {
        print_json(to_json_array(*resources));
        return 0;
    }

    print_header("Resources");
    if (resources->empty()) {
        print_empty("resources");
    }
    for (const auto& resource : *resources) {
        print_item(resource.name + " (" + resource.uri + ")", resource.description);
    }
    return 0;
}

int cmd_list_templates(Connection& conn, bool json_output) {
    auto templates = conn.list_resource_templates();
    if (!templates) {
        return fail(templates.error());
    }
    if (json_output) {
        print_json(to_json_array(*templates));
        return 0;
    }

    print_header("Resource Templates");
    if (templates->empty()) {
        print_empty("resource templates");
    }
    for (const auto& tmpl : *templates) {
        print_item(tmpl.name + " (" + tmpl.uri_template + ")", tmpl.description);
    }
    return 0;
}

int cmd_call_tool(Connection& conn, const std::string& tool_name,
                  const std::vector<std::string>& raw_args, bool json_output) {
    // invoke() looks the tool up in the cached catalog
    if (!conn.catalog().has(CatalogKind::Tools)) {
        auto listed = conn.list_tools();
        if (!listed) {
            return fail(listed.error());
        }
    }

    std::vector<Json> positional;
    for (const auto& raw : raw_args) {
        positional.push_back(parse_argument(raw));
    }

    auto text = invoke(conn, tool_name, positional);
    if (!text) {
        return fail(text.error());
    }
    if (json_output) {
        print_json(Json{{"tool", tool_name}, {"text", *text}});
    } else {
        std::cout << *text << "\n";
    }
    return 0;
}

int cmd_get_prompt(Connection& conn, const std::string& name, const std::string& raw_args, bool json_output) {
    Json arguments = Json::parse(raw_args, nullptr, false);
    if (arguments.is_discarded() || !arguments.is_object()) {
        print_error("--prompt-args must be a JSON object");
        return 1;
    }

    auto prompt = conn.get_prompt(name, std::move(arguments));
    if (!prompt) {
        return fail(prompt.error());
    }

    if (json_output) {
        Json messages = Json::array();
        for (const auto& message : prompt->messages) {
            messages.push_back({{"role", message.role}, {"content", message.content}});
        }
        Json output = {{"messages", messages}};
        if (prompt->description) {
            output["description"] = *prompt->description;
        }
        print_json(output);
        return 0;
    }

    print_header("Prompt: " + name);
    if (prompt->description) {
        std::cout << color::c(color::dim) << *prompt->description << color::c(color::reset) << "\n\n";
    }
    for (const auto& message : prompt->messages) {
        std::cout << color::c(color::bold) << message.role << ": " << color::c(color::reset);
        if (message.content.is_object() && message.content.value("type", "") == "text") {
            std::cout << message.content.value("text", "") << "\n";
        } else {
            std::cout << message.content.dump() << "\n";
        }
    }
    return 0;
}

int cmd_read_resource(Connection& conn, const std::string& uri, bool json_output) {
    auto read = conn.read_resource(uri);
    if (!read) {
        return fail(read.error());
    }

    if (json_output) {
        Json output = Json::array();
        for (const auto& content : read->contents) {
            Json entry = {{"uri", content.uri}};
            if (content.mime_type) {
                entry["mimeType"] = *content.mime_type;
            }
            if (content.text) {
                entry["text"] = *content.text;
            }
            if (content.blob) {
                entry["blob"] = *content.blob;
            }
            output.push_back(entry);
        }
        print_json(output);
        return 0;
    }

    print_header("Resource: " + uri);
    for (const auto& content : read->contents) {
        if (content.is_text()) {
            std::cout << *content.text << "\n";
        } else {
            std::cout << color::c(color::dim) << "(binary content, " << content.blob.value_or("").size()
                      << " base64 bytes)" << color::c(color::reset) << "\n";
        }
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcplink-cli", "MCP Server Inspection Tool");

    options.add_options()
        ("c,command", "Server command to execute", cxxopts::value<std::string>())
        ("a,args", "Argument for the server command (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("stderr", "Server stderr: discard, passthrough or capture", cxxopts::value<std::string>()->default_value("capture"))

        ("info", "Show server info")
        ("ping", "Ping the server")
        ("list-tools", "List available tools")
        ("list-prompts", "List available prompts")
        ("list-resources", "List available resources")
        ("list-templates", "List resource templates")
        ("tool-specs", "Print normalized tool descriptors as JSON")
        ("call-tool", "Call a tool by name", cxxopts::value<std::string>())
        ("arg", "Positional tool argument (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("get-prompt", "Render a prompt by name", cxxopts::value<std::string>())
        ("prompt-args", "JSON object of prompt arguments", cxxopts::value<std::string>()->default_value("{}"))
        ("read-resource", "Read a resource by URI", cxxopts::value<std::string>())

        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("v,verbose", "Enable verbose logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    mcplink-cli -c npx -a -y -a @modelcontextprotocol/server-everything --list-tools\n";
            std::cout << "    mcplink-cli -c python -a server.py --call-tool add --arg 2 --arg 3\n";
            std::cout << "    mcplink-cli -c ./server --get-prompt review --prompt-args '{\"file\":\"main.cpp\"}'\n";
            return 0;
        }

        if (!result.count("command")) {
            print_error("Must specify --command");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        const LogLevel level = result.count("verbose") ? LogLevel::Debug : LogLevel::Warn;
        if (result.count("log-file")) {
            set_logger(make_spdlog_stderr_file_logger(result["log-file"].as<std::string>(), level));
        } else {
            set_logger(make_spdlog_stderr_logger(level));
        }

        ProcessTransportConfig transport_config;
        transport_config.command = result["command"].as<std::string>();
        if (result.count("args")) {
            transport_config.args = result["args"].as<std::vector<std::string>>();
        }
        transport_config.skip_command_validation = true;  // CLI user controls the command

        const std::string stderr_mode = result["stderr"].as<std::string>();
        if (stderr_mode == "discard") {
            transport_config.stderr_handling = StderrHandling::Discard;
        } else if (stderr_mode == "passthrough") {
            transport_config.stderr_handling = StderrHandling::Passthrough;
        } else if (stderr_mode == "capture") {
            transport_config.stderr_handling = StderrHandling::Capture;
        } else {
            print_error("Unknown --stderr mode: " + stderr_mode);
            return 1;
        }

        ConnectionConfig config;
        config.client_name = "mcplink-cli";
        config.auto_fetch_catalogs = false;

        asio::io_context io;
        auto conn = Connection::create(
            transport_config.command,
            io,
            make_process_transport(io.get_executor(), transport_config),
            config
        );

        auto connected = conn->connect();
        if (!connected) {
            print_error("Failed to initialize: " + connected.error().describe());
            conn->stop();
            return 1;
        }

        int exit_code = 0;

        if (result.count("ping")) {
            exit_code = cmd_ping(*conn, json_output);
        } else if (result.count("list-tools")) {
            exit_code = cmd_list_tools(*conn, json_output);
        } else if (result.count("tool-specs")) {
            exit_code = cmd_tool_specs(*conn);
        } else if (result.count("list-prompts")) {
            exit_code = cmd_list_prompts(*conn, json_output);
        } else if (result.count("list-resources")) {
            exit_code = cmd_list_resources(*conn, json_output);
        } else if (result.count("list-templates")) {
            exit_code = cmd_list_templates(*conn, json_output);
        } else if (result.count("call-tool")) {
            std::vector<std::string> raw_args;
            if (result.count("arg")) {
                raw_args = result["arg"].as<std::vector<std::string>>();
            }
            exit_code = cmd_call_tool(*conn, result["call-tool"].as<std::string>(), raw_args, json_output);
        } else if (result.count("get-prompt")) {
            exit_code = cmd_get_prompt(*conn, result["get-prompt"].as<std::string>(),
                                       result["prompt-args"].as<std::string>(), json_output);
        } else if (result.count("read-resource")) {
            exit_code = cmd_read_resource(*conn, result["read-resource"].as<std::string>(), json_output);
        } else {
            exit_code = cmd_info(*conn, json_output);
        }

        conn->stop();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
