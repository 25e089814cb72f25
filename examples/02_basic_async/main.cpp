// Example 02: Event-Driven Connections
//
// Demonstrates the non-blocking API: two servers are started side by side
// on one io_context, catalogs arrive through callbacks, and a C++20
// coroutine issues calls once both are ready.

#include <mcplink/client/connection.hpp>
#include <mcplink/client/connection_registry.hpp>
#include <mcplink/client/tool_invoker.hpp>
#include <mcplink/log/spdlog_logger.hpp>
#include <mcplink/transport/process_transport.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <iostream>
#include <string>

using namespace mcplink;

std::shared_ptr<Connection> make_connection(asio::io_context& io, const std::string& name,
                                            const std::string& package, const std::string& arg) {
    ProcessTransportConfig config;
    config.command = "npx";
    config.args = {"-y", package};
    if (!arg.empty()) {
        config.args.push_back(arg);
    }
    config.stderr_handling = StderrHandling::Capture;
    return Connection::create(name, io, make_process_transport(io.get_executor(), config));
}

// Runs once every server has negotiated
asio::awaitable<void> run_calls(ConnectionRegistry& registry) {
    std::cout << "\n=== Pinging every server ===\n";
    for (const auto& name : registry.names()) {
        auto conn = registry.find(name);
        auto result = co_await conn->async_request("ping");
        std::cout << "  " << name << ": " << (result ? "pong" : result.error().describe()) << "\n";
    }

    if (auto match = registry.find_tool("list_directory")) {
        std::cout << "\n=== Calling list_directory on '" << match->connection->name() << "' ===\n";
        auto params = CallToolParams{"list_directory", Json{{"path", "/tmp"}}}.to_json();
        auto result = co_await match->connection->async_request("tools/call", params);
        if (result) {
            std::cout << extract_text(*result) << "\n";
        } else {
            std::cerr << "  Failed: " << result.error().describe() << "\n";
        }
    }

    std::cout << "\nDisconnecting...\n";
    registry.stop_all();
}

int main() {
    set_logger(make_spdlog_async_stderr_logger(LogLevel::Info));

    std::cout << "=== Event-Driven Connections Example ===\n\n";

    asio::io_context io;
    ConnectionRegistry registry;
    registry.on_change([](ConnectionRegistry::Change change, const std::string& name) {
        std::cout << "[registry] " << (change == ConnectionRegistry::Change::Added ? "+ " : "- ") << name << "\n";
    });

    auto files = make_connection(io, "files", "@modelcontextprotocol/server-filesystem", "/tmp");
    auto everything = make_connection(io, "everything", "@modelcontextprotocol/server-everything", "");

    int waiting = 2;
    ConnectionCallbacks callbacks;
    callbacks.on_ready = [&](Connection& conn) {
        std::cout << "[" << conn.name() << "] ready: " << conn.server_info().name << "\n";
        if (--waiting == 0) {
            asio::co_spawn(io, run_calls(registry), asio::detached);
        }
    };
    callbacks.on_error = [&](Connection& conn, const ClientError& error) {
        std::cerr << "[" << conn.name() << "] failed: " << error.describe() << "\n";
        registry.stop(conn.name());
        if (--waiting == 0 && registry.empty() == false) {
            asio::co_spawn(io, run_calls(registry), asio::detached);
        }
    };
    callbacks.on_tools = [](Connection& conn, const std::vector<Tool>& tools) {
        std::cout << "[" << conn.name() << "] " << tools.size() << " tool(s)\n";
    };

    for (const auto& conn : {files, everything}) {
        auto added = registry.add(conn);
        if (!added) {
            std::cerr << "ERROR: " << added.error().describe() << "\n";
            return 1;
        }
        auto started = conn->start(callbacks);
        if (!started) {
            std::cerr << "ERROR: Failed to start '" << conn->name() << "': " << started.error().describe() << "\n";
            registry.stop(conn->name());
            --waiting;
        }
    }

    if (registry.empty()) {
        return 1;
    }

    // Returns once every connection has been stopped
    io.run();

    std::cout << "Done!\n";
    return 0;
}
