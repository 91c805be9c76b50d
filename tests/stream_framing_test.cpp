#include <catch2/catch_test_macros.hpp>

#include "toolmux/transport/stream_framing.hpp"

#include <string>
#include <vector>

using namespace toolmux;

namespace {

std::vector<TransportResult<Json>> drain(FrameDecoder& decoder) {
    std::vector<TransportResult<Json>> frames;
    while (auto frame = decoder.next()) {
        frames.push_back(std::move(*frame));
    }
    return frames;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Encoding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("encode_frame newline mode writes one line", "[framing]") {
    auto frame = encode_frame(Json{{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1}}, FramingMode::NewlineDelimited);

    REQUIRE(frame.back() == '\n');
    REQUIRE(std::count(frame.begin(), frame.end(), '\n') == 1);
}

TEST_CASE("encode_frame content-length mode counts body bytes", "[framing]") {
    const Json message = {{"text", "h\xc3\xa9llo"}};
    auto frame = encode_frame(message, FramingMode::ContentLength);

    const auto body = message.dump();
    REQUIRE(frame == "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
}

// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited decoding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Newline decoder yields frames in order", "[framing]") {
    FrameDecoder decoder(FramingMode::NewlineDelimited, 1024);
    decoder.feed("{\"id\":1}\n{\"id\":2}\r\n\n   \n{\"id\":3}\n");

    auto frames = drain(decoder);
    REQUIRE(frames.size() == 3);
    REQUIRE((*frames[0])["id"] == 1);
    REQUIRE((*frames[1])["id"] == 2);
    REQUIRE((*frames[2])["id"] == 3);
    REQUIRE(decoder.buffered() == 0);
}

TEST_CASE("Newline decoder waits for the terminator", "[framing]") {
    FrameDecoder decoder(FramingMode::NewlineDelimited, 1024);

    decoder.feed("{\"id\":");
    REQUIRE(decoder.next().has_value() == false);

    decoder.feed("9}");
    REQUIRE(decoder.next().has_value() == false);

    decoder.feed("\n");
    auto frame = decoder.next();
    REQUIRE(frame.has_value());
    REQUIRE((**frame)["id"] == 9);
}

TEST_CASE("Newline decoder reports a malformed line and continues", "[framing]") {
    FrameDecoder decoder(FramingMode::NewlineDelimited, 1024);
    decoder.feed("this is not json\n{\"ok\":true}\n");

    auto frames = drain(decoder);
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0].has_value() == false);
    REQUIRE(frames[0].error().category == TransportError::Category::Protocol);
    REQUIRE((*frames[1])["ok"] == true);
}

TEST_CASE("Newline decoder drops an oversized line and resynchronizes", "[framing]") {
    FrameDecoder decoder(FramingMode::NewlineDelimited, 32);

    // No terminator yet: the buffered prefix already exceeds the limit
    decoder.feed("{\"blob\":\"" + std::string(64, 'x'));
    auto first = decoder.next();
    REQUIRE(first.has_value());
    REQUIRE(first->has_value() == false);
    REQUIRE(first->error().category == TransportError::Category::Protocol);

    // The rest of that line is discarded, the next frame survives
    decoder.feed(std::string(64, 'y') + "\"}\n{\"id\":2}\n");
    auto frames = drain(decoder);
    REQUIRE(frames.size() == 1);
    REQUIRE((*frames[0])["id"] == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Content-Length decoding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Content-Length decoder handles split headers and bodies", "[framing]") {
    FrameDecoder decoder(FramingMode::ContentLength, 1024);
    const std::string stream = encode_frame(Json{{"id", 1}}, FramingMode::ContentLength)
                             + encode_frame(Json{{"id", 2}}, FramingMode::ContentLength);

    std::vector<TransportResult<Json>> frames;
    for (char c : stream) {
        decoder.feed(std::string_view(&c, 1));
        auto more = drain(decoder);
        for (auto& f : more) {
            frames.push_back(std::move(f));
        }
    }

    REQUIRE(frames.size() == 2);
    REQUIRE((*frames[0])["id"] == 1);
    REQUIRE((*frames[1])["id"] == 2);
}

TEST_CASE("Content-Length header is case-insensitive and tolerates extra headers", "[framing]") {
    FrameDecoder decoder(FramingMode::ContentLength, 1024);
    decoder.feed("content-type: application/json\r\nCONTENT-LENGTH:  8 \r\n\r\n{\"a\":1}\n");

    auto frames = drain(decoder);
    REQUIRE(frames.size() == 1);
    REQUIRE((*frames[0])["a"] == 1);
}

TEST_CASE("Content-Length decoder rejects a missing length", "[framing]") {
    FrameDecoder decoder(FramingMode::ContentLength, 1024);
    decoder.feed("X-Other: 1\r\n\r\n");

    auto frame = decoder.next();
    REQUIRE(frame.has_value());
    REQUIRE(frame->has_value() == false);
}

TEST_CASE("Content-Length decoder skips an oversized body", "[framing]") {
    FrameDecoder decoder(FramingMode::ContentLength, 16);
    const std::string big_body(40, ' ');

    decoder.feed("Content-Length: 40\r\n\r\n" + big_body.substr(0, 10));
    auto first = decoder.next();
    REQUIRE(first.has_value());
    REQUIRE(first->has_value() == false);

    decoder.feed(big_body.substr(10));
    decoder.feed(encode_frame(Json{{"id", 5}}, FramingMode::ContentLength));

    auto frames = drain(decoder);
    REQUIRE(frames.size() == 1);
    REQUIRE((*frames[0])["id"] == 5);
}
