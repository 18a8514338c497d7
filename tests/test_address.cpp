#include <doctest/doctest.h>
#include "xbeelink/address.hpp"
#include "xbeelink/messages.hpp"

using namespace xbeelink;

TEST_CASE("Address16 parsing pads short forms and rejects long ones") {
    Address16 a;
    REQUIRE(Address16::from_string("0x1", a));
    CHECK(a.value() == 0x0001);
    CHECK(a.to_string() == "0001");

    REQUIRE(Address16::from_string("fffe", a));
    CHECK(a == Address16::UNKNOWN);

    CHECK_FALSE(Address16::from_string("12345", a));
    CHECK_FALSE(Address16::from_string("", a));
}

TEST_CASE("Address64 parsing and sentinels") {
    Address64 a;
    REQUIRE(Address64::from_string("13A20040A1B2C3", a));
    CHECK(a.to_string() == "0013A20040A1B2C3");
    CHECK(a.value() == 0x0013A20040A1B2C3ULL);

    CHECK(Address64::BROADCAST.to_string() == "000000000000FFFF");
    CHECK(Address64() == Address64::UNKNOWN);
    CHECK_FALSE(Address64::from_string("0013A20040A1B2C3FF", a));
    CHECK_FALSE(Address64::from_string("XYZ", a));
}

TEST_CASE("IPv4Address dotted quad parsing") {
    IPv4Address ip;
    REQUIRE(IPv4Address::from_string("192.168.1.10", ip));
    CHECK(ip.to_string() == "192.168.1.10");

    CHECK_FALSE(IPv4Address::from_string("256.1.1.1", ip));
    CHECK_FALSE(IPv4Address::from_string("1.2.3", ip));
    CHECK_FALSE(IPv4Address::from_string("1..2.3", ip));
}

TEST_CASE("RemoteAddress prefers 64-bit comparison and falls back to 16-bit") {
    Address64 a64(0x0013A20040A1B2C3ULL);
    Address64 b64(0x0013A20040A1B2C4ULL);

    CHECK(RemoteAddress{a64, Address16(0x1234)}.matches(RemoteAddress{a64, Address16(0x9999)}));
    CHECK_FALSE(RemoteAddress{a64, Address16(0x1234)}.matches(RemoteAddress{b64, Address16(0x1234)}));

    // 64-bit unknown on one side: 16-bit decides
    CHECK(RemoteAddress{Address64::UNKNOWN, Address16(0x1234)}.matches(RemoteAddress{a64, Address16(0x1234)}));
    CHECK_FALSE(RemoteAddress{}.matches(RemoteAddress{}));
}
