#include "mcplink/transport/frame_reader.hpp"
#include "mcplink/log/logger.hpp"

namespace mcplink {

namespace {

constexpr std::size_t kPreviewLength = 80;

std::string preview(std::string_view line) {
    if (line.size() <= kPreviewLength) {
        return std::string(line);
    }
    return std::string(line.substr(0, kPreviewLength)) + "...";
}

}  // namespace

FrameReader::FrameReader(std::size_t max_frame_size)
    : max_frame_size_(max_frame_size)
{}

std::vector<Json> FrameReader::feed(std::string_view chunk) {
    std::vector<Json> frames;

    std::size_t start = 0;
    while (start < chunk.size()) {
        const auto newline = chunk.find('\n', start);
        if (newline == std::string_view::npos) {
            break;
        }

        const auto piece = chunk.substr(start, newline - start);
        start = newline + 1;

        if (skipping_oversized_) {
            // Tail of a frame already reported as too large
            skipping_oversized_ = false;
            continue;
        }

        if (carry_.empty()) {
            take_line(piece, frames);
        } else {
            carry_.append(piece);
            std::string line = std::move(carry_);
            carry_.clear();
            take_line(line, frames);
        }
    }

    if (start < chunk.size() && !skipping_oversized_) {
        carry_.append(chunk.substr(start));
        if (carry_.size() > max_frame_size_) {
            get_logger().error_fmt("Dropping frame larger than {} bytes", max_frame_size_);
            carry_.clear();
            skipping_oversized_ = true;
            ++dropped_;
        }
    }

    return frames;
}

void FrameReader::reset() noexcept {
    carry_.clear();
    skipping_oversized_ = false;
}

void FrameReader::take_line(std::string_view line, std::vector<Json>& out) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.find_first_not_of(" \t") == std::string_view::npos) {
        return;
    }
    if (line.size() > max_frame_size_) {
        get_logger().error_fmt("Dropping frame larger than {} bytes", max_frame_size_);
        ++dropped_;
        return;
    }

    Json parsed = Json::parse(line.begin(), line.end(), nullptr, false);
    if (parsed.is_discarded()) {
        MCPLINK_LOG_WARN("Dropping unparsable frame: " + preview(line));
        ++dropped_;
        return;
    }

    MCPLINK_LOG_TRACE("<< " + std::string(line));
    out.push_back(std::move(parsed));
}

}  // namespace mcplink
