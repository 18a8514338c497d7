#include <doctest/doctest.h>
#include "xbeelink/bytes.hpp"

using namespace xbeelink;

TEST_CASE("to_hex and to_pretty_hex use upper-case digits") {
    ByteVector b{0x7E, 0x00, 0x0a, 0xff};
    CHECK(to_hex(b) == "7E000AFF");
    CHECK(to_pretty_hex(b) == "7E 00 0A FF");
    CHECK(to_pretty_hex(ByteVector{}) == "");
    CHECK(byte_to_hex(0x5F) == "5F");
}

TEST_CASE("int_to_hex pads to the requested width") {
    CHECK(int_to_hex(0x1A, 4) == "001A");
    CHECK(int_to_hex(0, 2) == "00");
    CHECK(int_to_hex(0x12345, 2) == "12345");
}

TEST_CASE("from_hex accepts prefix, separators and either case") {
    ByteVector out;
    REQUIRE(from_hex("0x7e 00:04", out));
    CHECK(out == ByteVector{0x7E, 0x00, 0x04});

    REQUIRE(from_hex("", out));
    CHECK(out.empty());
}

TEST_CASE("from_hex rejects odd digit counts and non-hex characters") {
    ByteVector out;
    CHECK_FALSE(from_hex("7E0", out));
    CHECK_FALSE(from_hex("ZZ", out));
}

TEST_CASE("Big-endian helpers and tail") {
    ByteVector b;
    append_u16(b, 0xC105);
    CHECK(b == ByteVector{0xC1, 0x05});
    CHECK(read_u16(b, 0) == 0xC105);

    CHECK(tail(ByteVector{1, 2, 3}, 1) == ByteVector{2, 3});
    CHECK(tail(ByteVector{1, 2, 3}, 5).empty());
    CHECK(to_printable(ByteVector{'H', 'i', 0x00}) == "Hi.");
}
