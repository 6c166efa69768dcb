#include <doctest/doctest.h>
#include "xmmrpc/wire_codec.hpp"

#include <string>
#include <vector>

using namespace xmmrpc::wire;

static Value u(uint32_t v) { return Value(v); }
static Bytes str(const std::string& s) { return Bytes(s.begin(), s.end()); }

TEST_CASE("pack L 0 is a 6-byte generic integer and unpacks as n") {
    Bytes out;
    std::string err;
    REQUIRE(pack("L", {u(0)}, out, err));
    CHECK(out == Bytes{0x02, 0x04, 0x00, 0x00, 0x00, 0x00});

    std::vector<Value> vals;
    REQUIRE(unpack("n", out, vals, err));
    REQUIRE(vals.size() == 1);
    CHECK(std::get<uint32_t>(vals[0]) == 0u);
}

TEST_CASE("scalar widths are big-endian with 1/2/4 length bytes") {
    Bytes out;
    std::string err;
    REQUIRE(pack("BHL", {u(5), u(0x1234), u(0xdeadbeef)}, out, err));
    CHECK(out == Bytes{0x02, 0x01, 0x05,
                       0x02, 0x02, 0x12, 0x34,
                       0x02, 0x04, 0xde, 0xad, 0xbe, 0xef});
}

TEST_CASE("scalar out of range for its width is rejected") {
    Bytes out{0xAA};
    std::string err;
    CHECK_FALSE(pack("B", {u(256)}, out, err));
    CHECK(err == "out_of_range:B");
    CHECK(out == Bytes{0xAA});   // untouched

    CHECK_FALSE(pack("H", {u(0x10000)}, out, err));
    CHECK(err == "out_of_range:H");
}

TEST_CASE("byte array at exact capacity has no padding") {
    Bytes out;
    std::string err;
    REQUIRE(pack("s3", {Value(str("abc"))}, out, err));
    CHECK(out == Bytes{0x55, 0x03,
                       0x02, 0x04, 0x00, 0x00, 0x00, 0x03,
                       0x02, 0x04, 0x00, 0x00, 0x00, 0x00,
                       'a', 'b', 'c'});
}

TEST_CASE("byte array below capacity is zero padded to the slot size") {
    Bytes out;
    std::string err;
    REQUIRE(pack("s5", {Value(str("ab"))}, out, err));
    REQUIRE(out.size() == 14 + 5);
    CHECK(out[1] == 2);
    CHECK(out[7] == 5);     // slot bytes
    CHECK(out[13] == 3);    // padding bytes
    CHECK(out[14] == 'a');
    CHECK(out[15] == 'b');
    CHECK(out[16] == 0);
    CHECK(out[18] == 0);
}

TEST_CASE("over-capacity array fails") {
    Bytes out;
    std::string err;
    CHECK_FALSE(pack("s2", {Value(str("abc"))}, out, err));
    CHECK(err == "over_capacity:2");

    CHECK_FALSE(pack("SL1", {Value(Elements{1, 2})}, out, err));
    CHECK(err == "over_capacity:1");
}

TEST_CASE("capacity whose slot size does not fit is rejected before allocating") {
    Bytes out{0xAA};
    std::string err;

    // 1073741825 * 4 wraps a 32-bit slot size around to 4.
    CHECK_FALSE(pack("SL1073741825", {Value(Elements{1})}, out, err));
    CHECK(err == "over_capacity:1073741825");

    CHECK_FALSE(pack("s4000000000", {Value(Bytes{})}, out, err));
    CHECK(err == "over_capacity:4000000000");
    CHECK(out == Bytes{0xAA});

    REQUIRE(pack("s" + std::to_string(MAX_ARRAY_SLOT_BYTES), {Value(Bytes{})}, out, err));
    CHECK(out.size() == 1 + 1 + 2 * INT32_FIELD_BYTES + MAX_ARRAY_SLOT_BYTES);
}

TEST_CASE("occupied count of 130 uses the extended form") {
    Bytes payload(130, 0x41);
    Bytes out;
    std::string err;
    REQUIRE(pack("s200", {Value(payload)}, out, err));
    CHECK(out[0] == 0x55);
    CHECK(out[1] == 0x81);
    CHECK(out[2] == 130);

    std::vector<Value> vals;
    REQUIRE(unpack("s", out, vals, err));
    CHECK(std::get<Bytes>(vals[0]) == payload);
}

TEST_CASE("multi-byte extended count is least significant byte first") {
    Bytes payload(300, 0x01);
    Bytes out;
    std::string err;
    REQUIRE(pack("s300", {Value(payload)}, out, err));
    CHECK(out[1] == 0x82);
    CHECK(out[2] == 0x2c);
    CHECK(out[3] == 0x01);

    std::vector<Value> vals;
    REQUIRE(unpack("s300", out, vals, err));
    CHECK(std::get<Bytes>(vals[0]).size() == 300);
}

TEST_CASE("element arrays carry width tag and little-endian elements") {
    Bytes out;
    std::string err;
    REQUIRE(pack("SH3", {Value(Elements{1, 0x0203})}, out, err));
    CHECK(out == Bytes{0x56, 0x02,
                       0x02, 0x04, 0x00, 0x00, 0x00, 0x06,
                       0x02, 0x04, 0x00, 0x00, 0x00, 0x02,
                       0x01, 0x00, 0x03, 0x02,
                       0x00, 0x00});

    std::vector<Value> vals;
    REQUIRE(unpack("SH", out, vals, err));
    CHECK(std::get<Elements>(vals[0]) == Elements{1, 0x0203});

    CHECK_FALSE(unpack("SL", out, vals, err));
    CHECK(err == "tag_mismatch:S");
}

TEST_CASE("mixed format round-trips") {
    const std::vector<Value> in{u(7), u(0x11000107), Value(str("apn")), Value(Elements{9, 10, 11}), u(0xffff)};
    Bytes out;
    std::string err;
    REQUIRE(pack("BLs8SL4H", in, out, err));

    std::vector<Value> back;
    REQUIRE(unpack("BLs8SL4H", out, back, err));
    CHECK(back == in);
}

TEST_CASE("argument count mismatches are reported") {
    Bytes out;
    std::string err;
    CHECK_FALSE(pack("LL", {u(1)}, out, err));
    CHECK(err == "too_few_args");
    CHECK_FALSE(pack("L", {u(1), u(2)}, out, err));
    CHECK(err == "too_many_args");
}

TEST_CASE("malformed formats and value types are reported") {
    Bytes out;
    std::string err;
    CHECK_FALSE(pack("x", {u(1)}, out, err));
    CHECK(err == "unknown_format:x");
    CHECK_FALSE(pack("s", {Value(str("a"))}, out, err));
    CHECK(err == "missing_capacity:s");
    CHECK_FALSE(pack("SQ4", {Value(Elements{1})}, out, err));
    CHECK(err == "bad_element_type:S");
    CHECK_FALSE(pack("L", {Value(str("a"))}, out, err));
    CHECK(err == "bad_value:L");
    CHECK_FALSE(pack("s4", {u(1)}, out, err));
    CHECK(err == "bad_value:s");
}

TEST_CASE("unpack rejects wrong tags and truncated input") {
    std::vector<Value> vals;
    std::string err;

    CHECK_FALSE(unpack("n", Bytes{0x31, 0x01, 0x00}, vals, err));
    CHECK(err == "bad_tag:0x31");

    CHECK_FALSE(unpack("n", Bytes{0x02, 0x04, 0x00, 0x00}, vals, err));
    CHECK(err == "truncated");

    CHECK_FALSE(unpack("s", Bytes{0x02, 0x01, 0x00}, vals, err));
    CHECK(err == "bad_tag:0x02");

    CHECK_FALSE(unpack("n", Bytes{0x02, 0x05, 0x01, 0x00, 0x00, 0x00, 0x00}, vals, err));
    CHECK(err == "int_overflow");
}

TEST_CASE("unpack accepts any integer length and ignores trailing bytes") {
    std::vector<Value> vals;
    std::string err;
    REQUIRE(unpack("nn", Bytes{0x02, 0x01, 0x07, 0x02, 0x03, 0x01, 0x00, 0x02, 0xEE}, vals, err));
    CHECK(std::get<uint32_t>(vals[0]) == 7u);
    CHECK(std::get<uint32_t>(vals[1]) == 0x010002u);
}

TEST_CASE("zero slot size falls back to the occupied byte count") {
    const Bytes data{0x55, 0x02, 0x02, 0x01, 0x00, 0x02, 0x01, 0x00, 'a', 'b'};
    std::vector<Value> vals;
    std::string err;
    REQUIRE(unpack("s", data, vals, err));
    CHECK(std::get<Bytes>(vals[0]) == str("ab"));
}

TEST_CASE("inconsistent slot size is a decode error") {
    const Bytes data{0x55, 0x02, 0x02, 0x01, 0x05, 0x02, 0x01, 0x00, 'a', 'b'};
    std::vector<Value> vals;
    std::string err;
    CHECK_FALSE(unpack("s", data, vals, err));
    CHECK(err == "slot_mismatch:5");
}

TEST_CASE("take_int advances past one integer") {
    const Bytes data{0x02, 0x02, 0x01, 0x02, 0x02, 0x01, 0x09};
    size_t pos = 0;
    uint32_t v = 0;
    std::string err;
    REQUIRE(take_int(data.data(), data.size(), pos, v, err));
    CHECK(v == 0x0102u);
    CHECK(pos == 4);
    REQUIRE(take_int(data.data(), data.size(), pos, v, err));
    CHECK(v == 9u);
    CHECK(pos == data.size());
}
