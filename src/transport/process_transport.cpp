#include "mcplink/transport/process_transport.hpp"
#include "mcplink/log/logger.hpp"

#include <asio/write.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

namespace mcplink {

namespace {

constexpr useconds_t kProcessTerminationWaitUs = 100'000;  // 100ms before SIGKILL
constexpr useconds_t kExitPollIntervalUs = 10'000;
constexpr int kExitPollAttempts = 10;

TransportError make_error(TransportError::Category cat, const std::string& msg) {
    return TransportError{cat, msg, std::nullopt};
}

// A write to a child that already exited must come back as EPIPE rather
// than terminate the host.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

const std::string kDangerousChars = ";|&$`\\\"'<>(){}[]!#";

#if defined(__APPLE__)
const std::vector<std::string> kAllowedCommandPrefixes = {
    "/usr/bin/", "/usr/local/bin/", "/bin/", "/opt/homebrew/bin/",
    "/usr/sbin/", "/sbin/"
};
#else
const std::vector<std::string> kAllowedCommandPrefixes = {
    "/usr/bin/", "/usr/local/bin/", "/bin/", "/usr/sbin/", "/sbin/",
    "/snap/bin/", "/opt/", "/home/"
};
#endif

// Screens for shell metacharacters and absolute paths outside the usual
// install prefixes. execvp never goes through a shell, but servers are often
// configured from user-editable files.
bool is_safe_command(const std::string& command, const std::vector<std::string>& args) {
    if (command.empty()) {
        return false;
    }
    if (command.find_first_of(kDangerousChars) != std::string::npos) {
        return false;
    }
    for (const auto& arg : args) {
        if (arg.find_first_of(kDangerousChars) != std::string::npos) {
            return false;
        }
    }

    if (command.front() == '/') {
        for (const auto& prefix : kAllowedCommandPrefixes) {
            if (command.rfind(prefix, 0) == 0) {
                return true;
            }
        }
        return false;
    }
    return true;
}

void close_pipe(int (&fds)[2]) {
    if (fds[0] != -1) {
        ::close(fds[0]);
    }
    if (fds[1] != -1) {
        ::close(fds[1]);
    }
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ProcessTransport::ProcessTransport(asio::any_io_executor executor, ProcessTransportConfig config)
    : config_(std::move(config))
    , executor_(std::move(executor))
{
    if (config_.read_chunk_size == 0) {
        config_.read_chunk_size = 4096;
    }
    read_buffer_.resize(config_.read_chunk_size);
    stderr_read_buffer_.resize(1024);
}

ProcessTransport::~ProcessTransport() {
    stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// IStreamTransport
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor ProcessTransport::get_executor() {
    return executor_;
}

TransportResult<void> ProcessTransport::start(DataHandler on_data, CloseHandler on_close) {
    if (running_) {
        return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already running"
        ));
    }

    if (!config_.skip_command_validation && !is_safe_command(config_.command, config_.args)) {
        return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Command validation failed: potentially unsafe command or arguments"
        ));
    }

    ignore_sigpipe_once();

    auto spawned = spawn_process();
    if (!spawned) {
        return spawned;
    }

    on_data_ = std::move(on_data);
    on_close_ = std::move(on_close);
    alive_ = std::make_shared<int>(0);
    running_ = true;
    exit_code_.reset();
    stderr_buffer_.clear();
    stderr_pending_line_.clear();

    read_stdout();
    if (stderr_stream_) {
        read_stderr();
    }

    MCPLINK_LOG_INFO("ProcessTransport started: " + config_.command +
                     " (pid " + std::to_string(child_pid_) + ")");
    return {};
}

TransportResult<void> ProcessTransport::write(std::string_view frame) {
    if (!running_ || !stdin_stream_ || !stdin_stream_->is_open()) {
        return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport not running"
        ));
    }

    asio::error_code ec;
    asio::write(*stdin_stream_, asio::buffer(frame.data(), frame.size()), ec);
    if (ec) {
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Write failed: " + ec.message()
        ));
    }
    return {};
}

void ProcessTransport::stop() {
    if (!running_ && child_pid_ <= 0 && !stderr_stream_) {
        return;
    }
    running_ = false;
    alive_.reset();

    close_streams();
    terminate_process();

    MCPLINK_LOG_INFO("ProcessTransport stopped");
}

bool ProcessTransport::is_running() const {
    return running_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Readers
// ═══════════════════════════════════════════════════════════════════════════

void ProcessTransport::read_stdout() {
    std::weak_ptr<int> guard = alive_;
    stdout_stream_->async_read_some(
        asio::buffer(read_buffer_),
        [this, guard](const asio::error_code& ec, std::size_t n) {
            if (guard.expired()) {
                return;
            }
            if (n > 0 && on_data_) {
                on_data_(std::string_view(read_buffer_.data(), n));
            }
            // The data handler may have stopped us
            if (guard.expired() || !running_) {
                return;
            }
            if (ec) {
                handle_stream_end(ec);
                return;
            }
            read_stdout();
        });
}

void ProcessTransport::read_stderr() {
    std::weak_ptr<int> guard = alive_;
    stderr_stream_->async_read_some(
        asio::buffer(stderr_read_buffer_),
        [this, guard](const asio::error_code& ec, std::size_t n) {
            if (guard.expired()) {
                return;
            }
            if (n > 0) {
                stderr_pending_line_.append(stderr_read_buffer_.data(), n);
                emit_stderr_lines(false);
            }
            // stderr closing is not a transport failure; stdout decides that.
            // A null stream means drain_stderr() already took the rest.
            if (ec || !stderr_stream_) {
                emit_stderr_lines(true);
                close_stream(stderr_stream_);
                return;
            }
            read_stderr();
        });
}

void ProcessTransport::emit_stderr_lines(bool flush_partial) {
    std::size_t start = 0;
    while (true) {
        const auto newline = stderr_pending_line_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = stderr_pending_line_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            MCPLINK_LOG_INFO("[" + config_.command + " stderr] " + line);
        }
        start = newline + 1;
    }

    stderr_buffer_.append(stderr_pending_line_, 0, start);
    stderr_pending_line_.erase(0, start);

    if (flush_partial && !stderr_pending_line_.empty()) {
        MCPLINK_LOG_INFO("[" + config_.command + " stderr] " + stderr_pending_line_);
        stderr_buffer_.append(stderr_pending_line_);
        stderr_pending_line_.clear();
    }

    if (stderr_buffer_.size() > config_.max_stderr_buffer) {
        stderr_buffer_.erase(0, stderr_buffer_.size() - config_.max_stderr_buffer);
    }
}

// The child has been reaped, so whatever it wrote to stderr is already in the
// pipe. Read it without blocking and flush the final partial line.
void ProcessTransport::drain_stderr() {
    if (!stderr_stream_ || !stderr_stream_->is_open()) {
        emit_stderr_lines(true);
        return;
    }

    asio::error_code ec;
    stderr_stream_->cancel(ec);
    if (!ec) {
        stderr_stream_->non_blocking(true, ec);
    }
    if (ec) {
        MCPLINK_LOG_DEBUG("ProcessTransport: cannot drain stderr: " + ec.message());
    } else {
        char buffer[1024];
        while (true) {
            const std::size_t n = stderr_stream_->read_some(asio::buffer(buffer), ec);
            if (n > 0) {
                stderr_pending_line_.append(buffer, n);
            }
            if (ec || n == 0) {
                break;
            }
        }
    }

    emit_stderr_lines(true);
    close_stream(stderr_stream_);
}

void ProcessTransport::handle_stream_end(const asio::error_code& ec) {
    running_ = false;
    close_stream(stdin_stream_);
    close_stream(stdout_stream_);

    // EOF usually means the child is exiting; give it a moment so the real
    // exit status is reported instead of our SIGTERM.
    for (int attempt = 0; attempt < kExitPollAttempts && child_pid_ > 0; ++attempt) {
        int status = 0;
        if (waitpid(child_pid_, &status, WNOHANG) > 0) {
            record_exit_status(status);
            child_pid_ = -1;
            break;
        }
        usleep(kExitPollIntervalUs);
    }
    terminate_process();
    drain_stderr();

    TransportError error;
    error.exit_code = exit_code_;
    if (ec == asio::error::eof) {
        error.category = TransportError::Category::Closed;
        error.message = "Server closed its output";
    } else {
        error.category = TransportError::Category::Network;
        error.message = "Read failed: " + ec.message();
    }
    if (exit_code_) {
        error.message += " (exit code " + std::to_string(*exit_code_) + ")";
    }

    MCPLINK_LOG_WARN("ProcessTransport: " + error.message);

    auto on_close = std::move(on_close_);
    on_close_ = nullptr;
    if (on_close) {
        on_close(error);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Process Management
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> ProcessTransport::spawn_process() {
    // argv is built before fork(): after fork only async-signal-safe calls
    // are allowed in the child, and malloc is not one of them.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    for (const auto& arg : config_.args) {
        argv_storage.push_back(arg);
    }

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdin_pipe) == -1 || pipe(stdout_pipe) == -1) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to create pipes: " + reason
        ));
    }

    if (config_.stderr_handling == StderrHandling::Capture) {
        if (pipe(stderr_pipe) == -1) {
            const std::string reason = std::strerror(errno);
            close_pipe(stdin_pipe);
            close_pipe(stdout_pipe);
            return tl::unexpected(make_error(
                TransportError::Category::Network,
                "Failed to create stderr pipe: " + reason
            ));
        }
    }

    const pid_t pid = fork();

    if (pid == -1) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to fork: " + reason
        ));
    }

    if (pid == 0) {
        // Child: no allocations from here on
        dup2(stdin_pipe[0], STDIN_FILENO);
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);

        switch (config_.stderr_handling) {
            case StderrHandling::Discard: {
                const int devnull = open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    dup2(devnull, STDERR_FILENO);
                    ::close(devnull);
                }
                break;
            }
            case StderrHandling::Passthrough:
                break;
            case StderrHandling::Capture:
                dup2(stderr_pipe[1], STDERR_FILENO);
                ::close(stderr_pipe[0]);
                ::close(stderr_pipe[1]);
                break;
        }

        execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent
    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);

    stdin_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdin_pipe[1]);
    stdout_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdout_pipe[0]);

    if (config_.stderr_handling == StderrHandling::Capture) {
        ::close(stderr_pipe[1]);
        stderr_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stderr_pipe[0]);
    }

    child_pid_ = pid;
    return {};
}

void ProcessTransport::close_stream(std::unique_ptr<asio::posix::stream_descriptor>& stream) {
    if (stream && stream->is_open()) {
        asio::error_code ec;
        stream->close(ec);
        if (ec) {
            MCPLINK_LOG_DEBUG("ProcessTransport: close failed: " + ec.message());
        }
    }
    stream.reset();
}

void ProcessTransport::close_streams() {
    close_stream(stdin_stream_);
    close_stream(stdout_stream_);
    close_stream(stderr_stream_);
}

void ProcessTransport::terminate_process() {
    if (child_pid_ <= 0) {
        return;
    }

    int status = 0;
    pid_t result = waitpid(child_pid_, &status, WNOHANG);

    if (result == 0) {
        kill(child_pid_, SIGTERM);
        result = waitpid(child_pid_, &status, WNOHANG);
        if (result == 0) {
            usleep(kProcessTerminationWaitUs);
            result = waitpid(child_pid_, &status, WNOHANG);
            if (result == 0) {
                kill(child_pid_, SIGKILL);
                result = waitpid(child_pid_, &status, 0);
            }
        }
    }

    if (result > 0) {
        record_exit_status(status);
    }

    child_pid_ = -1;
}

void ProcessTransport::record_exit_status(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);
    }
}

}  // namespace mcplink
