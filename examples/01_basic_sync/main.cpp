// Example 01: Basic Synchronous Connection
//
// Demonstrates the simplest usage pattern: blocking calls on a Connection
// backed by a child-process transport.

#include <mcplink/client/connection.hpp>
#include <mcplink/client/tool_invoker.hpp>
#include <mcplink/log/spdlog_logger.hpp>
#include <mcplink/transport/process_transport.hpp>

#include <asio/io_context.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace mcplink;

int main(int argc, char* argv[]) {
    // Default to the filesystem server; any arguments replace the command line
    std::string command = "npx";
    std::vector<std::string> args = {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"};
    if (argc > 1) {
        command = argv[1];
        args.assign(argv + 2, argv + argc);
    }

    set_logger(make_spdlog_stderr_logger(LogLevel::Warn));

    std::cout << "=== Basic Synchronous Connection Example ===\n\n";

    // 1. Configure transport
    ProcessTransportConfig transport_config;
    transport_config.command = command;
    transport_config.args = args;
    transport_config.stderr_handling = StderrHandling::Capture;

    std::cout << "Starting server: " << command;
    for (const auto& a : args) std::cout << " " << a;
    std::cout << "\n\n";

    // 2. Create the connection; connect() spawns, negotiates and waits
    asio::io_context io;
    auto conn = Connection::create("example", io, make_process_transport(io.get_executor(), transport_config));

    auto connected = conn->connect();
    if (!connected) {
        std::cerr << "ERROR: Failed to connect: " << connected.error().describe() << "\n";
        return 1;
    }

    std::cout << "Server: " << conn->server_info().name << " v" << conn->server_info().version << "\n";
    std::cout << "Protocol: " << conn->config().protocol_version << "\n\n";

    // 3. List available tools
    std::cout << "=== Available Tools ===\n";
    auto tools = conn->list_tools();
    if (tools) {
        if (tools->empty()) {
            std::cout << "  (no tools available)\n";
        }
        for (const auto& tool : *tools) {
            std::cout << "  - " << tool.name;
            if (tool.description) {
                std::cout << ": " << *tool.description;
            }
            std::cout << "\n";
        }
    } else {
        std::cerr << "  Failed to list tools: " << tools.error().describe() << "\n";
    }
    std::cout << "\n";

    // 4. List available resources
    std::cout << "=== Available Resources ===\n";
    auto resources = conn->list_resources();
    if (resources) {
        if (resources->empty()) {
            std::cout << "  (no resources available)\n";
        }
        for (const auto& res : *resources) {
            std::cout << "  - " << res.uri << " (" << res.name << ")\n";
        }
    } else {
        std::cerr << "  Failed to list resources: " << resources.error().describe() << "\n";
    }
    std::cout << "\n";

    // 5. Call a tool with positional arguments
    if (conn->catalog().find_tool("list_directory")) {
        std::cout << "=== Calling Tool: list_directory ===\n";
        auto text = invoke(*conn, "list_directory", {Json("/tmp")});
        if (text) {
            std::cout << *text << "\n";
        } else {
            std::cerr << "  Tool call failed: " << text.error().describe() << "\n";
        }
        std::cout << "\n";
    }

    // 6. Ping the server
    std::cout << "=== Ping ===\n";
    auto pinged = conn->ping();
    if (pinged) {
        std::cout << "  Pong! Server is responsive.\n";
    } else {
        std::cerr << "  Ping failed: " << pinged.error().describe() << "\n";
    }
    std::cout << "\n";

    // 7. Clean shutdown
    std::cout << "Disconnecting...\n";
    conn->stop();
    std::cout << "Done!\n";

    return 0;
}
