#include <catch2/catch_test_macros.hpp>

#include "mcplink/transport/frame_reader.hpp"
#include "mocks/capture_logger.hpp"

#include <string>
#include <vector>

using namespace mcplink;

namespace {

const std::string kStream =
    "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"text\":\"a\\nb\"}}\n"
    "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{\"level\":\"info\"}}\r\n"
    "{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{}}\n";

std::vector<Json> feed_in_pieces(FrameReader& reader, const std::string& stream, std::vector<std::size_t> cuts) {
    std::vector<Json> out;
    std::size_t pos = 0;
    cuts.push_back(stream.size());
    for (auto cut : cuts) {
        for (auto& frame : reader.feed(std::string_view(stream).substr(pos, cut - pos))) {
            out.push_back(std::move(frame));
        }
        pos = cut;
    }
    return out;
}

void require_expected_frames(const std::vector<Json>& frames) {
    REQUIRE(frames.size() == 3);
    REQUIRE(frames[0]["id"] == 1);
    REQUIRE(frames[0]["result"]["text"] == "a\nb");
    REQUIRE(frames[1]["method"] == "notifications/message");
    REQUIRE(frames[2]["id"] == 2);
}

}  // namespace

TEST_CASE("FrameReader yields every frame whatever the chunk boundaries", "[framing]") {
    SECTION("Whole stream in one chunk") {
        FrameReader reader;
        require_expected_frames(reader.feed(kStream));
        REQUIRE(reader.buffered() == 0);
    }

    SECTION("Every single split point") {
        for (std::size_t cut = 1; cut < kStream.size(); ++cut) {
            FrameReader reader;
            require_expected_frames(feed_in_pieces(reader, kStream, {cut}));
            REQUIRE(reader.buffered() == 0);
        }
    }

    SECTION("Every pair of split points") {
        for (std::size_t a = 1; a < kStream.size(); a += 7) {
            for (std::size_t b = a + 1; b < kStream.size(); b += 5) {
                FrameReader reader;
                require_expected_frames(feed_in_pieces(reader, kStream, {a, b}));
            }
        }
    }

    SECTION("One byte at a time") {
        FrameReader reader;
        std::vector<std::size_t> cuts;
        for (std::size_t i = 1; i < kStream.size(); ++i) {
            cuts.push_back(i);
        }
        require_expected_frames(feed_in_pieces(reader, kStream, cuts));
    }
}

TEST_CASE("FrameReader carries an unterminated tail", "[framing]") {
    FrameReader reader;

    auto first = reader.feed("{\"a\":1}\n{\"b\"");
    REQUIRE(first.size() == 1);
    REQUIRE(reader.buffered() == 4);

    auto second = reader.feed(":2}\r\n\n");
    REQUIRE(second.size() == 1);
    REQUIRE(second[0]["b"] == 2);
    REQUIRE(reader.buffered() == 0);
}

TEST_CASE("FrameReader skips blank lines", "[framing]") {
    FrameReader reader;
    auto frames = reader.feed("\n\r\n  \n{\"x\":true}\n\n");
    REQUIRE(frames.size() == 1);
    REQUIRE(reader.dropped() == 0);
}

TEST_CASE("FrameReader drops invalid frames and keeps going", "[framing][error]") {
    mcplink::testing::ScopedCaptureLogger log(LogLevel::Warn);
    FrameReader reader;

    auto frames = reader.feed("{\"id\":1}\nnot json at all\n{\"id\":2}\n");

    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0]["id"] == 1);
    REQUIRE(frames[1]["id"] == 2);
    REQUIRE(reader.dropped() == 1);
    REQUIRE(log->contains(LogLevel::Warn, "not json at all"));
}

TEST_CASE("FrameReader drops oversized frames", "[framing][error]") {
    mcplink::testing::ScopedCaptureLogger log(LogLevel::Error);
    FrameReader reader(32);

    SECTION("Oversized line within one chunk") {
        const std::string big = "{\"pad\":\"" + std::string(64, 'x') + "\"}\n";
        auto frames = reader.feed(big + "{\"ok\":1}\n");
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0]["ok"] == 1);
        REQUIRE(reader.dropped() == 1);
    }

    SECTION("Oversized tail spanning chunks is skipped up to its newline") {
        REQUIRE(reader.feed("{\"pad\":\"" + std::string(40, 'x')).empty());
        REQUIRE(reader.buffered() == 0);
        REQUIRE(reader.feed(std::string(40, 'y')).empty());

        auto frames = reader.feed("\"}\n{\"ok\":2}\n");
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0]["ok"] == 2);
        REQUIRE(reader.dropped() == 1);
    }

    REQUIRE(log->contains(LogLevel::Error, "larger than 32"));
}

TEST_CASE("FrameReader reset discards buffered bytes", "[framing]") {
    FrameReader reader;
    REQUIRE(reader.feed("{\"partial\":").empty());
    REQUIRE(reader.buffered() > 0);

    reader.reset();
    REQUIRE(reader.buffered() == 0);

    auto frames = reader.feed("{\"fresh\":1}\n");
    REQUIRE(frames.size() == 1);
}
