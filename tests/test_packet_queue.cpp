#include <doctest/doctest.h>
#include "xbeelink/packet_queue.hpp"

#include <chrono>
#include <thread>

using namespace xbeelink;
using namespace std::chrono_literals;

static Packet data_from(uint64_t addr, char c) {
    return ReceivePacket{Address64(addr), Address16::UNKNOWN, 0x01, {static_cast<uint8_t>(c)}};
}

TEST_CASE("Queue hands packets back oldest first") {
    PacketQueue q;
    q.add(ModemStatusPacket{0x00});
    q.add(ModemStatusPacket{0x02});
    REQUIRE(q.size() == 2);

    auto a = q.first_packet();
    REQUIRE(a.has_value());
    CHECK(a->as<ModemStatusPacket>()->status == 0x00);
    CHECK(q.first_packet()->as<ModemStatusPacket>()->status == 0x02);
    CHECK(q.empty());
    CHECK_FALSE(q.first_packet().has_value());
}

TEST_CASE("Full queue drops the oldest packet") {
    PacketQueue q(3);
    for (uint8_t s = 0; s < 5; ++s) q.add(ModemStatusPacket{s});

    CHECK(q.size() == 3);
    CHECK(q.dropped() == 2);
    CHECK(q.first_packet()->as<ModemStatusPacket>()->status == 2);
}

TEST_CASE("Capacity is clamped to the compile-time maximum") {
    CHECK(PacketQueue(0).capacity() == PacketQueue::MAX_CAPACITY);
    CHECK(PacketQueue(500).capacity() == PacketQueue::MAX_CAPACITY);
    CHECK(PacketQueue(10).capacity() == 10);
}

TEST_CASE("Data queries skip other kinds and leave them queued") {
    PacketQueue q;
    q.add(ModemStatusPacket{0x06});
    q.add(data_from(0x0013A20000000001ULL, 'a'));
    q.add(data_from(0x0013A20000000002ULL, 'b'));

    RemoteAddress second{Address64(0x0013A20000000002ULL), Address16::UNKNOWN};
    auto b = q.first_data_packet_from(second);
    REQUIRE(b.has_value());
    CHECK(b->as<ReceivePacket>()->rf_data == ByteVector{'b'});

    auto a = q.first_data_packet();
    REQUIRE(a.has_value());
    CHECK(a->as<ReceivePacket>()->rf_data == ByteVector{'a'});

    CHECK(q.size() == 1);
    CHECK(q.first_packet()->is<ModemStatusPacket>());
}

TEST_CASE("Explicit and IP data queries") {
    PacketQueue q;
    ExplicitRxIndicatorPacket ex;
    ex.source64 = Address64(0x0013A20000000001ULL);
    ex.rf_data = {'x'};
    q.add(ex);

    RxIPv4Packet ip;
    ip.source_address = IPv4Address(10, 0, 0, 7);
    ip.data = {'y'};
    q.add(ip);

    CHECK_FALSE(q.first_ip_data_packet_from(IPv4Address(10, 0, 0, 8)).has_value());
    CHECK(q.first_ip_data_packet_from(IPv4Address(10, 0, 0, 7)).has_value());
    CHECK(q.first_explicit_data_packet_from(RemoteAddress{Address64(0x0013A20000000001ULL), Address16::UNKNOWN})
              .has_value());
    CHECK(q.empty());
}

TEST_CASE("Blocking query times out on an empty queue") {
    PacketQueue q;
    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(q.first_packet(40ms).has_value());
    CHECK(std::chrono::steady_clock::now() - start >= 35ms);
}

TEST_CASE("Blocking query wakes when a matching packet arrives") {
    PacketQueue q;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        q.add(ModemStatusPacket{0x00});          // not data: keeps waiting
        std::this_thread::sleep_for(20ms);
        q.add(data_from(0x0013A20000000001ULL, 'z'));
    });

    auto p = q.first_data_packet(2000ms);
    producer.join();
    REQUIRE(p.has_value());
    CHECK(p->as<ReceivePacket>()->rf_data == ByteVector{'z'});
    CHECK(q.size() == 1);
}
