#include <doctest/doctest.h>
#include "xbeelink/checksum.hpp"

#include <random>

using namespace xbeelink;

TEST_CASE("Checksum of an AT NI payload is 0x5F and validates") {
    Checksum cs;
    cs.add(ByteVector{0x08, 0x01, 0x4E, 0x49});
    CHECK(cs.generate() == 0x5F);
    CHECK(cs.validate() == false);

    cs.add(0x5F);
    CHECK(cs.validate() == true);
}

TEST_CASE("Checksum keeps a wide sum and truncates only at the end") {
    Checksum cs;
    cs.add(0xFF);
    cs.add(0xFF);
    cs.add(0xFF);                      // 0x2FD
    CHECK(cs.generate() == 0x02);

    cs.add(0x02);
    CHECK(cs.validate() == true);
}

TEST_CASE("Checksum reset starts over") {
    Checksum cs;
    cs.add(0x10);
    cs.reset();
    CHECK(cs.generate() == 0xFF);      // empty payload
    const uint8_t data[] = {0x8A, 0x00};
    cs.add(data, sizeof(data));
    CHECK(cs.generate() == 0x75);
}

TEST_CASE("Changing any single payload byte breaks validation") {
    std::mt19937 rng(0x5EED);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<int> size(1, 64);

    int undetected = 0;
    for (int round = 0; round < 2000; ++round) {
        ByteVector payload(static_cast<size_t>(size(rng)));
        for (auto& b : payload) b = static_cast<uint8_t>(byte(rng));

        Checksum cs;
        cs.add(payload);
        payload.push_back(cs.generate());

        Checksum good;
        good.add(payload);
        REQUIRE(good.validate());

        // flip one byte (payload or checksum) to a different value
        const size_t at = static_cast<size_t>(rng() % payload.size());
        const uint8_t delta = static_cast<uint8_t>(1 + rng() % 255);
        payload[at] = static_cast<uint8_t>(payload[at] + delta);

        Checksum bad;
        bad.add(payload);
        if (bad.validate()) ++undetected;
    }
    // an 8-bit sum catches every single-byte change
    CHECK(undetected == 0);
}
