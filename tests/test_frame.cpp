#include <doctest/doctest.h>
#include "xmmrpc/frame.hpp"

using namespace xmmrpc;
using wire::Bytes;

TEST_CASE("sync frame header layout") {
    const Bytes f = build_frame(0x42, 0, {});
    CHECK(f == Bytes{0x10, 0x00, 0x00, 0x00,
                     0x02, 0x04, 0x00, 0x00, 0x00, 0x10,
                     0x02, 0x04, 0x00, 0x00, 0x00, 0x42,
                     0x11, 0x00, 0x01, 0x00});
}

TEST_CASE("transaction frame embeds int(tag) before the body") {
    const Bytes f = build_frame(0x42, 7, Bytes{'a', 'b'});
    CHECK(f == Bytes{0x18, 0x00, 0x00, 0x00,
                     0x02, 0x04, 0x00, 0x00, 0x00, 0x18,
                     0x02, 0x04, 0x00, 0x00, 0x00, 0x42,
                     0x11, 0x00, 0x01, 0x07,
                     0x02, 0x04, 0x11, 0x00, 0x01, 0x07,
                     'a', 'b'});
    CHECK(build_header(0x42, 7, 2).size() == FRAME_HEADER_TID_BYTES);
    CHECK(build_header(0x42, 0, 2).size() == FRAME_HEADER_BYTES);
}

TEST_CASE("total length excludes the prefix and counts the embedded id") {
    const Bytes body(37, 0x5A);
    for (uint8_t tid : {uint8_t{0}, uint8_t{1}, uint8_t{255}}) {
        Frame fr;
        std::string err;
        REQUIRE(parse_frame(build_frame(0x1234, tid, body), fr, err));
        CHECK(fr.total_length == body.size() + 16 + (tid ? 6 : 0));
        CHECK_FALSE(fr.length_mismatch);
        CHECK(fr.command_code == 0x1234u);
        CHECK(fr.channel_tag == channel_tag_for(tid));
        CHECK(fr.tid() == tid);
    }
}

TEST_CASE("parse keeps the echoed tag in the body and exposes it") {
    Frame fr;
    std::string err;
    REQUIRE(parse_frame(build_frame(0x42, 7, Bytes{'x'}), fr, err));
    REQUIRE(fr.embedded_tid.has_value());
    CHECK(*fr.embedded_tid == 0x11000107u);
    CHECK(fr.body.size() == 7);
    CHECK(fr.body.back() == 'x');

    REQUIRE(parse_frame(build_frame(0x42, 0, Bytes{'x'}), fr, err));
    CHECK_FALSE(fr.embedded_tid.has_value());
    CHECK(fr.body == Bytes{'x'});
}

TEST_CASE("length mismatch is flagged, not rejected") {
    Bytes f = build_frame(0x42, 0, Bytes{1, 2, 3});
    f[0] = 0x20;
    Frame fr;
    std::string err;
    REQUIRE(parse_frame(f, fr, err));
    CHECK(fr.length_mismatch);
    CHECK(fr.total_length == 0x20u);
    CHECK(fr.redundant_length == 19u);
}

TEST_CASE("malformed headers are reported") {
    Frame fr;
    std::string err;

    CHECK_FALSE(parse_frame(Bytes(10, 0), fr, err));
    CHECK(err == "short_frame:10");

    Bytes f = build_frame(0x42, 0, {});
    f[4] = 0x30;
    CHECK_FALSE(parse_frame(f, fr, err));
    CHECK(err == "bad_tag:0x30");
}

TEST_CASE("read_length_prefix is little-endian") {
    const uint8_t p[4] = {0x01, 0x02, 0x03, 0x04};
    CHECK(read_length_prefix(p) == 0x04030201u);
}
