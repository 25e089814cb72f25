// ─────────────────────────────────────────────────────────────────────────────
// Process Transport Unit Tests
// ─────────────────────────────────────────────────────────────────────────────
// Exercise ProcessTransport against small shell commands instead of a real
// MCP server. Tagged [!mayfail] where they depend on the host's /bin tools.

#include <catch2/catch_test_macros.hpp>

#include "mcplink/transport/process_transport.hpp"
#include "mocks/capture_logger.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <optional>
#include <string>

using namespace mcplink;
using mcplink::testing::ScopedCaptureLogger;
using namespace std::chrono_literals;

namespace {

ProcessTransportConfig shell(const std::string& script) {
    ProcessTransportConfig config;
    config.command = "sh";
    config.args = {"-c", script};
    config.skip_command_validation = true;
    return config;
}

/// Run the loop until `done` holds or the deadline passes
template <typename Pred>
void run_until(asio::io_context& io, Pred done, std::chrono::milliseconds limit = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        io.restart();
        io.run_for(20ms);
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport starts and stops cleanly", "[process][lifecycle][!mayfail]") {
    asio::io_context io;
    ProcessTransportConfig config;
    config.command = "cat";
    ProcessTransport transport(io.get_executor(), config);

    REQUIRE(transport.is_running() == false);
    REQUIRE(transport.child_pid() == -1);

    auto started = transport.start([](std::string_view) {}, [](const TransportError&) {});
    REQUIRE(started.has_value());
    REQUIRE(transport.is_running());
    REQUIRE(transport.child_pid() > 0);

    SECTION("Double start is refused") {
        auto again = transport.start([](std::string_view) {}, [](const TransportError&) {});
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().message.find("already running") != std::string::npos);
    }

    SECTION("Double stop is harmless") {
        transport.stop();
        transport.stop();
    }

    transport.stop();
    REQUIRE(transport.is_running() == false);
    REQUIRE(transport.child_pid() == -1);

    auto late = transport.write("{}\r\n");
    REQUIRE_FALSE(late.has_value());
    REQUIRE(late.error().category == TransportError::Category::Closed);
}

TEST_CASE("ProcessTransport screens unsafe commands", "[process][security]") {
    asio::io_context io;

    SECTION("Shell metacharacters in the command") {
        ProcessTransportConfig config;
        config.command = "cat; rm -rf /";
        ProcessTransport transport(io.get_executor(), config);
        auto started = transport.start([](std::string_view) {}, [](const TransportError&) {});
        REQUIRE_FALSE(started.has_value());
        REQUIRE(started.error().message.find("validation") != std::string::npos);
    }

    SECTION("Shell metacharacters in an argument") {
        ProcessTransportConfig config;
        config.command = "cat";
        config.args = {"$(whoami)"};
        ProcessTransport transport(io.get_executor(), config);
        REQUIRE_FALSE(transport.start([](std::string_view) {}, [](const TransportError&) {}).has_value());
    }

    SECTION("Absolute path outside the install prefixes") {
        ProcessTransportConfig config;
        config.command = "/tmp/server";
        ProcessTransport transport(io.get_executor(), config);
        REQUIRE_FALSE(transport.start([](std::string_view) {}, [](const TransportError&) {}).has_value());
    }

    SECTION("Empty command") {
        ProcessTransport transport(io.get_executor(), ProcessTransportConfig{});
        REQUIRE_FALSE(transport.start([](std::string_view) {}, [](const TransportError&) {}).has_value());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Data flow
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProcessTransport round-trips bytes through cat", "[process][io][!mayfail]") {
    asio::io_context io;
    ProcessTransportConfig config;
    config.command = "cat";
    config.read_chunk_size = 7;
    ProcessTransport transport(io.get_executor(), config);

    std::string received;
    REQUIRE(transport.start(
        [&received](std::string_view chunk) { received.append(chunk); },
        [](const TransportError&) {}).has_value());

    const std::string frame = R"({"jsonrpc":"2.0","method":"ping","id":1})" "\r\n";
    REQUIRE(transport.write(frame).has_value());

    run_until(io, [&] { return received.size() >= frame.size(); });
    REQUIRE(received == frame);

    transport.stop();
}

TEST_CASE("ProcessTransport reports the child closing its output", "[process][io][!mayfail]") {
    asio::io_context io;
    ProcessTransport transport(io.get_executor(), shell("printf 'hello\\n'; exit 3"));

    std::string received;
    std::optional<TransportError> closed;
    REQUIRE(transport.start(
        [&received](std::string_view chunk) { received.append(chunk); },
        [&closed](const TransportError& e) { closed = e; }).has_value());

    run_until(io, [&] { return closed.has_value(); });

    REQUIRE(received == "hello\n");
    REQUIRE(closed.has_value());
    REQUIRE(closed->category == TransportError::Category::Closed);
    REQUIRE(closed->exit_code == 3);
    REQUIRE(transport.is_running() == false);
    REQUIRE(transport.exit_code() == 3);
}

TEST_CASE("ProcessTransport surfaces a command that cannot be executed", "[process][io][!mayfail]") {
    asio::io_context io;
    ProcessTransportConfig config;
    config.command = "mcplink-no-such-server";
    ProcessTransport transport(io.get_executor(), config);

    std::optional<TransportError> closed;
    REQUIRE(transport.start([](std::string_view) {},
                            [&closed](const TransportError& e) { closed = e; }).has_value());

    run_until(io, [&] { return closed.has_value(); });

    REQUIRE(closed.has_value());
    REQUIRE(closed->exit_code == 127);
    REQUIRE(closed->message.find("exit code 127") != std::string::npos);
}

TEST_CASE("ProcessTransport captures stderr into the logger", "[process][stderr][!mayfail]") {
    ScopedCaptureLogger log(LogLevel::Info);
    asio::io_context io;
    auto config = shell("echo 'starting up' >&2; echo 'partial' >&2; sleep 0.2");
    config.stderr_handling = StderrHandling::Capture;
    ProcessTransport transport(io.get_executor(), config);

    std::optional<TransportError> closed;
    REQUIRE(transport.start([](std::string_view) {},
                            [&closed](const TransportError& e) { closed = e; }).has_value());

    run_until(io, [&] { return closed.has_value(); });

    REQUIRE(transport.captured_stderr().find("starting up\n") != std::string::npos);
    REQUIRE(log->contains(LogLevel::Info, "[sh stderr] starting up"));
    REQUIRE(log->contains(LogLevel::Info, "[sh stderr] partial"));
}

TEST_CASE("ProcessTransport keeps stderr written just before exit", "[process][stderr][!mayfail]") {
    ScopedCaptureLogger log(LogLevel::Info);
    asio::io_context io;
    auto config = shell("printf 'last words' >&2");
    config.stderr_handling = StderrHandling::Capture;
    ProcessTransport transport(io.get_executor(), config);

    std::optional<TransportError> closed;
    REQUIRE(transport.start([](std::string_view) {},
                            [&closed](const TransportError& e) { closed = e; }).has_value());

    run_until(io, [&] { return closed.has_value(); });

    // No trailing newline: the line is only flushed at stream end
    REQUIRE(transport.captured_stderr().find("last words") != std::string::npos);
    REQUIRE(log->contains(LogLevel::Info, "[sh stderr] last words"));
}

TEST_CASE("ProcessTransport write to an exited child fails without a signal", "[process][io][!mayfail]") {
    asio::io_context io;
    ProcessTransport transport(io.get_executor(), shell("exec 0<&-; sleep 0.1"));

    std::optional<TransportError> closed;
    REQUIRE(transport.start([](std::string_view) {},
                            [&closed](const TransportError& e) { closed = e; }).has_value());

    // Keep writing until the closed stdin is noticed; SIGPIPE must not kill us
    bool write_failed = false;
    for (int i = 0; i < 200 && !write_failed; ++i) {
        auto written = transport.write(std::string(1024, 'x'));
        write_failed = !written.has_value();
        io.restart();
        io.run_for(5ms);
    }

    REQUIRE((write_failed || closed.has_value()));
    transport.stop();
}
