#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Spawns a server as a child process and exchanges bytes over its stdin and
// stdout using asio's POSIX stream descriptors.
//
// - stdout is read with async_read_some, so chunk boundaries are whatever the
//   pipe delivers; framing is left to FrameReader
// - stdin writes are synchronous and complete before write() returns
// - stop() escalates SIGTERM to SIGKILL after a short grace period

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessTransport is only available on POSIX-compatible systems"
#endif

#include "mcplink/transport/stream_transport.hpp"

#include <asio/posix/stream_descriptor.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>  // pid_t

namespace mcplink {

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

/// What happens to the child's stderr
enum class StderrHandling {
    Discard,      // Redirect to /dev/null
    Passthrough,  // Inherit the parent's stderr
    Capture       // Read line by line into the logger, and keep a copy
};

struct ProcessTransportConfig {
    std::string command;
    std::vector<std::string> args;

    StderrHandling stderr_handling{StderrHandling::Discard};

    /// Upper bound on a single read from the child's stdout
    std::size_t read_chunk_size{4096};

    /// Upper bound on retained stderr text (Capture only); oldest text is dropped
    std::size_t max_stderr_buffer{64 * 1024};

    /// Security: skip the command/argument screening (trusted or test setups only)
    bool skip_command_validation{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// ProcessTransport
// ═══════════════════════════════════════════════════════════════════════════

class ProcessTransport final : public IStreamTransport {
public:
    ProcessTransport(asio::any_io_executor executor, ProcessTransportConfig config);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;
    ProcessTransport(ProcessTransport&&) = delete;
    ProcessTransport& operator=(ProcessTransport&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // IStreamTransport
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] TransportResult<void> start(DataHandler on_data, CloseHandler on_close) override;
    [[nodiscard]] TransportResult<void> write(std::string_view frame) override;
    void stop() override;
    [[nodiscard]] bool is_running() const override;

    // ─────────────────────────────────────────────────────────────────────────
    // Process-specific
    // ─────────────────────────────────────────────────────────────────────────

    /// -1 when no child is running
    [[nodiscard]] pid_t child_pid() const noexcept { return child_pid_; }

    /// Set once the child has been reaped
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }

    /// Captured stderr text (Capture only)
    [[nodiscard]] const std::string& captured_stderr() const noexcept { return stderr_buffer_; }

private:
    TransportResult<void> spawn_process();
    void read_stdout();
    void read_stderr();
    void handle_stream_end(const asio::error_code& ec);
    void emit_stderr_lines(bool flush_partial);
    void drain_stderr();
    void close_stream(std::unique_ptr<asio::posix::stream_descriptor>& stream);
    void close_streams();
    void terminate_process();
    void record_exit_status(int status);

    ProcessTransportConfig config_;
    asio::any_io_executor executor_;

    std::unique_ptr<asio::posix::stream_descriptor> stdin_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stdout_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stderr_stream_;

    std::vector<char> read_buffer_;
    std::vector<char> stderr_read_buffer_;
    std::string stderr_pending_line_;
    std::string stderr_buffer_;

    DataHandler on_data_;
    CloseHandler on_close_;

    // Outstanding handlers hold a weak reference; stop() drops the token so
    // late completions return without touching this object.
    std::shared_ptr<int> alive_;

    pid_t child_pid_{-1};
    bool running_{false};
    std::optional<int> exit_code_;
};

/// Convenience factory for callers that hold transports by base pointer
[[nodiscard]] inline std::unique_ptr<IStreamTransport> make_process_transport(
    asio::any_io_executor executor,
    ProcessTransportConfig config
) {
    return std::make_unique<ProcessTransport>(std::move(executor), std::move(config));
}

}  // namespace mcplink
