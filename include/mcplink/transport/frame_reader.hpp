#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Frame Reader
// ═══════════════════════════════════════════════════════════════════════════
// Splits an inbound byte stream into newline-delimited JSON values.
//
// Chunks arrive with arbitrary boundaries: one chunk may hold several frames,
// and one frame may span several chunks. The unterminated tail of each chunk
// is carried over and completed by the next one.
//
//   "{\"a\":1}\n{\"b\""  ──feed──▶  [{a:1}]       carry: "{\"b\""
//   ":2}\r\n\n"           ──feed──▶  [{b:2}]       carry: ""

#include "mcplink/transport.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcplink {

class FrameReader {
public:
    static constexpr std::size_t kDefaultMaxFrameSize = 4 * 1024 * 1024;

    explicit FrameReader(std::size_t max_frame_size = kDefaultMaxFrameSize);

    /// Append a chunk and return every frame it completes, in stream order.
    /// Empty lines are skipped. A frame that is not valid JSON is logged and
    /// dropped without affecting its neighbours.
    [[nodiscard]] std::vector<Json> feed(std::string_view chunk);

    /// Bytes held back waiting for a terminator
    [[nodiscard]] std::size_t buffered() const noexcept { return carry_.size(); }

    /// Frames discarded as unparsable or oversized since construction
    [[nodiscard]] std::size_t dropped() const noexcept { return dropped_; }

    void reset() noexcept;

private:
    void take_line(std::string_view line, std::vector<Json>& out);

    std::string carry_;
    std::size_t max_frame_size_;
    std::size_t dropped_{0};
    bool skipping_oversized_{false};
};

}  // namespace mcplink
