#include <doctest/doctest.h>
#include "xbeelink/io_sample.hpp"
#include "test_support.hpp"

using namespace xbeelink;
using xbeelink::test::hex;

TEST_CASE("Standard sample with digital and analog lines") {
    IOSample s;
    std::string err;
    REQUIRE(IOSample::parse(hex("01 000C 03 0008 0200 01FF"), s, err));

    CHECK(s.digital_mask() == 0x000C);
    CHECK(s.analog_mask() == 0x03);
    CHECK(s.digital_value(2) == IOValue::Low);
    CHECK(s.digital_value(3) == IOValue::High);
    CHECK_FALSE(s.has_digital_value(4));
    CHECK(s.analog_value(0) == uint16_t(512));
    CHECK(s.analog_value(1) == uint16_t(511));
    CHECK_FALSE(s.has_power_supply_value());
    CHECK(s.to_string() == "{[DIO2: Low], [DIO3: High], [AD0: 512], [AD1: 511]}");
}

TEST_CASE("Analog mask bit 7 is the supply voltage") {
    IOSample s;
    std::string err;
    REQUIRE(IOSample::parse(hex("01 0000 81 0200 0CE4"), s, err));

    CHECK_FALSE(s.has_digital_values());
    CHECK(s.analog_value(0) == uint16_t(512));
    CHECK_FALSE(s.has_analog_value(7));
    REQUIRE(s.has_power_supply_value());
    CHECK(*s.power_supply_value() == 3300);
    CHECK(s.to_string() == "{[AD0: 512], [Power supply voltage: 3300]}");
}

TEST_CASE("Odd-length 802.15.4 sample uses the combined mask") {
    IOSample s;
    std::string err;
    REQUIRE(IOSample::parse(hex("01 0604 0004 0100 0020"), s, err));

    CHECK(s.digital_mask() == 0x0004);
    CHECK(s.digital_value(2) == IOValue::High);
    CHECK(s.analog_mask() == 0x0600);
    CHECK(s.analog_value(0) == uint16_t(256));
    CHECK(s.analog_value(1) == uint16_t(32));
    CHECK_FALSE(s.has_power_supply_value());
}

TEST_CASE("Sample blocks shorter than five bytes are rejected") {
    IOSample s;
    std::string err;
    CHECK_FALSE(IOSample::parse(hex("01 0000 00"), s, err));
    CHECK(err == "IO sample payload must be longer than 4.");
}
