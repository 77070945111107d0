#include "test_common.hpp"
#include <sstream>
#include "errors.hpp"
#include "framing.hpp"

using gitport::ProtocolError;

namespace {
std::string bytes(std::initializer_list<int> values) {
    std::string out;
    for (int v : values)
        out.push_back(static_cast<char>(v));
    return out;
}
} // namespace

TEST_CASE("Length prefix is big-endian") {
    auto prefix = gitport::encode_length(0x01020304u);
    REQUIRE(prefix[0] == 0x01);
    REQUIRE(prefix[3] == 0x04);
    REQUIRE(gitport::decode_length(prefix) == 0x01020304u);
}

TEST_CASE("write_frame then read_frame") {
    std::stringstream ss;
    gitport::write_frame(ss, {0x81, 0xa2, 'o', 'k'});
    REQUIRE(ss.str() == bytes({0, 0, 0, 4, 0x81, 0xa2, 'o', 'k'}));

    std::vector<std::uint8_t> payload;
    REQUIRE(gitport::read_frame(ss, payload));
    REQUIRE(payload == std::vector<std::uint8_t>{0x81, 0xa2, 'o', 'k'});
    REQUIRE_FALSE(gitport::read_frame(ss, payload));
}

TEST_CASE("read_frame reports clean end of stream") {
    std::istringstream in("");
    std::vector<std::uint8_t> payload;
    REQUIRE_FALSE(gitport::read_frame(in, payload));
}

TEST_CASE("Zero length frame has an empty payload") {
    std::istringstream in(bytes({0, 0, 0, 0}));
    std::vector<std::uint8_t> payload{1, 2, 3};
    REQUIRE(gitport::read_frame(in, payload));
    REQUIRE(payload.empty());
}

TEST_CASE("Truncated length prefix is a protocol error") {
    std::istringstream in(bytes({0, 0}));
    std::vector<std::uint8_t> payload;
    REQUIRE_THROWS_AS(gitport::read_frame(in, payload), ProtocolError);
}

TEST_CASE("Truncated payload is a protocol error") {
    std::istringstream in(bytes({0, 0, 0, 10, 'a', 'b', 'c'}));
    std::vector<std::uint8_t> payload;
    REQUIRE_THROWS_AS(gitport::read_frame(in, payload), ProtocolError);
}

TEST_CASE("Oversized length is rejected before reading the payload") {
    std::istringstream in(bytes({0x7f, 0xff, 0xff, 0xff}));
    std::vector<std::uint8_t> payload;
    REQUIRE_THROWS_AS(gitport::read_frame(in, payload, 1024), ProtocolError);
    REQUIRE(payload.empty());
}

TEST_CASE("Back to back frames are read in order") {
    std::stringstream ss;
    gitport::write_frame(ss, {1});
    gitport::write_frame(ss, {});
    gitport::write_frame(ss, {2, 3});
    std::vector<std::uint8_t> payload;
    REQUIRE(gitport::read_frame(ss, payload));
    REQUIRE(payload == std::vector<std::uint8_t>{1});
    REQUIRE(gitport::read_frame(ss, payload));
    REQUIRE(payload.empty());
    REQUIRE(gitport::read_frame(ss, payload));
    REQUIRE(payload == std::vector<std::uint8_t>{2, 3});
    REQUIRE_FALSE(gitport::read_frame(ss, payload));
}

TEST_CASE("write_frame fails on a broken stream") {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    REQUIRE_THROWS_AS(gitport::write_frame(out, {1, 2}), ProtocolError);
}
