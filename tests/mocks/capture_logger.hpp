#ifndef MCPLINK_TESTS_CAPTURE_LOGGER_HPP
#define MCPLINK_TESTS_CAPTURE_LOGGER_HPP

#include "mcplink/log/logger.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink::testing {

// ─────────────────────────────────────────────────────────────────────────────
// CaptureLogger
// ─────────────────────────────────────────────────────────────────────────────
// Keeps every record at or above `min_level` for inspection.

class CaptureLogger final : public ILogger {
public:
    explicit CaptureLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] const std::vector<LogRecord>& records() const noexcept { return records_; }

    [[nodiscard]] bool contains(LogLevel level, std::string_view needle) const {
        return std::any_of(records_.begin(), records_.end(), [&](const LogRecord& r) {
            return r.level == level && r.message.find(needle) != std::string::npos;
        });
    }

    void clear() { records_.clear(); }

private:
    LogLevel min_level_;
    std::vector<LogRecord> records_;
};

/// Installs a CaptureLogger as the global logger for the lifetime of the guard
class ScopedCaptureLogger {
public:
    explicit ScopedCaptureLogger(LogLevel min_level = LogLevel::Trace) {
        auto logger = std::make_unique<CaptureLogger>(min_level);
        logger_ = logger.get();
        set_logger(std::move(logger));
    }

    ~ScopedCaptureLogger() { set_logger(nullptr); }

    ScopedCaptureLogger(const ScopedCaptureLogger&) = delete;
    ScopedCaptureLogger& operator=(const ScopedCaptureLogger&) = delete;

    CaptureLogger& operator*() const noexcept { return *logger_; }
    CaptureLogger* operator->() const noexcept { return logger_; }

private:
    CaptureLogger* logger_;
};

}  // namespace mcplink::testing

#endif  // MCPLINK_TESTS_CAPTURE_LOGGER_HPP
