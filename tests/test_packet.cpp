#include <doctest/doctest.h>
#include "xbeelink/packet.hpp"
#include "xbeelink/packet_json.hpp"
#include "test_support.hpp"

using namespace xbeelink;
using xbeelink::test::hex;

TEST_CASE("AT NI command serializes to the documented frame") {
    Packet p = AtCommandPacket{0x01, "NI", {}};

    CHECK(p.generate_bytes(false) == hex("7E 00 04 08 01 4E 49 5F"));
    CHECK(p.api_data() == hex("08 01 4E 49"));
    CHECK(p.length() == 4);
    CHECK(p.checksum() == 0x5F);
    CHECK(p.to_hex_string() == "7E000408014E495F");
    CHECK(p.frame_type() == FrameType::AT_COMMAND);
    CHECK(std::string(p.frame_type_name()) == "AT Command");
}

TEST_CASE("Unset frame ID goes out as 0") {
    Packet p = AtCommandPacket{std::nullopt, "NI", {}};
    CHECK_FALSE(p.frame_id().has_value());
    CHECK(p.generate_bytes(false) == hex("7E 00 04 08 00 4E 49 60"));

    p.set_frame_id(0x01);
    CHECK(p.generate_bytes(false) == hex("7E 00 04 08 01 4E 49 5F"));
}

TEST_CASE("Frame ID checks only apply to kinds that carry one") {
    Packet at = AtCommandPacket{0x07, "ID", {}};
    CHECK(at.needs_frame_id());
    CHECK(at.check_frame_id(0x07));
    CHECK_FALSE(at.check_frame_id(0x08));

    Packet ms = ModemStatusPacket{0x00};
    CHECK_FALSE(ms.needs_frame_id());
    ms.set_frame_id(0x07);             // no effect
    CHECK_FALSE(ms.frame_id().has_value());
    CHECK_FALSE(ms.check_frame_id(0x07));
    CHECK_FALSE(ms.check_frame_id(0x00));
}

TEST_CASE("Parameters list the envelope and fields in wire order") {
    Packet p = AtCommandPacket{0x01, "NI", {}};
    auto rows = p.parameters();
    REQUIRE(rows.size() == 6);
    CHECK(rows[0] == PacketParameter{"Start delimiter", "7E"});
    CHECK(rows[1] == PacketParameter{"Length", "00 04 (4)"});
    CHECK(rows[2] == PacketParameter{"Frame type", "08 (AT Command)"});
    CHECK(rows[3] == PacketParameter{"Frame ID", "01 (1)"});
    CHECK(rows[4] == PacketParameter{"AT Command", "4E 49 (NI)"});
    CHECK(rows[5] == PacketParameter{"Checksum", "5F"});

    Packet unset = AtCommandPacket{std::nullopt, "NI", {}};
    CHECK(unset.parameters()[3].second == "(NO FRAME ID)");

    CHECK(p.to_pretty_string().rfind("Packet: 7E000408014E495F\n", 0) == 0);
}

TEST_CASE("Packets compare by their unescaped bytes") {
    Packet a = AtCommandPacket{0x01, "NI", {}};
    Packet b = AtCommandPacket{0x01, "NI", {}};
    Packet c = AtCommandPacket{0x02, "NI", {}};
    CHECK(a == b);
    CHECK(a != c);
}

TEST_CASE("Broadcast detection for transmit and receive kinds") {
    Packet rx_bcast = ReceivePacket{Address64(0x0013A20040A1B2C3ULL), Address16::UNKNOWN, 0x02, {'H', 'i'}};
    Packet rx_acked = ReceivePacket{Address64(0x0013A20040A1B2C3ULL), Address16::UNKNOWN, 0x01, {'H', 'i'}};
    CHECK(rx_bcast.is_broadcast());
    CHECK_FALSE(rx_acked.is_broadcast());      // 0x01 is the acknowledged bit

    Packet rx16_pan = Rx16Packet{Address16(0x1234), 0x28, 0x04, {}};
    CHECK(rx16_pan.is_broadcast());

    TransmitRequestPacket tx;
    tx.dest64 = Address64::BROADCAST;
    CHECK(Packet(tx).is_broadcast());
    tx.dest64 = Address64(0x0013A20040A1B2C3ULL);
    tx.dest16 = Address16(0x1234);
    CHECK_FALSE(Packet(tx).is_broadcast());

    CHECK_FALSE(Packet(AtCommandPacket{0x01, "NI", {}}).is_broadcast());
}

TEST_CASE("JSON rendering carries type, frame ID and field rows") {
    Packet p = AtCommandPacket{0x01, "NI", {}};
    auto j = to_json(p);
    CHECK(j["type"].get<int>() == 0x08);
    CHECK(j["type_name"].get<std::string>() == "AT Command");
    CHECK(j["frame_id"].get<int>() == 1);
    CHECK(j["hex"].get<std::string>() == "7E000408014E495F");
    REQUIRE(j["fields"].size() == 6);
    CHECK(j["fields"][4]["k"].get<std::string>() == "AT Command");

    auto m = to_json(Packet(ModemStatusPacket{0x00}));
    CHECK(m["frame_id"].is_null());
}
