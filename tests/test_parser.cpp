#include <doctest/doctest.h>
#include "xbeelink/parser.hpp"
#include "test_support.hpp"

#include <chrono>

using namespace xbeelink;
using xbeelink::test::hex;

TEST_CASE("Parser decodes a whole API frame") {
    PacketParser parser;
    Packet p;
    std::string err;
    const ByteVector frame = hex("7E 00 04 08 01 4E 49 5F");
    REQUIRE(parser.parse_packet(frame, OperatingMode::API, p, err) == ParseStatus::Ok);
    const auto* at = p.as<AtCommandPacket>();
    REQUIRE(at != nullptr);
    CHECK(at->frame_id == FrameId(0x01));
    CHECK(at->command == "NI");
    CHECK(at->parameter.empty());
}

TEST_CASE("Parser accepts hex text and rejects bad hex") {
    PacketParser parser;
    Packet p;
    std::string err;
    CHECK(parser.parse_packet(std::string("7E 00 02 8A 00 75"), OperatingMode::API, p, err) == ParseStatus::Ok);
    CHECK(p.is<ModemStatusPacket>());

    CHECK(parser.parse_packet(std::string("7E 0"), OperatingMode::API, p, err) == ParseStatus::InvalidHex);
    CHECK(err == "Invalid hex string.");
}

TEST_CASE("Checksum mismatch reports the expected value") {
    PacketParser parser;
    Packet p;
    std::string err;
    const ByteVector frame = hex("7E 00 04 08 01 4E 49 00");
    CHECK(parser.parse_packet(frame, OperatingMode::API, p, err) == ParseStatus::InvalidChecksum);
    CHECK(err == "Invalid checksum (expected 0x5F).");
}

TEST_CASE("Truncated frame, bad delimiter and non-API mode") {
    PacketParser parser;
    Packet p;
    std::string err;

    const ByteVector truncated = hex("7E 00 04 08 01");
    CHECK(parser.parse_packet(truncated, OperatingMode::API, p, err) == ParseStatus::IncompletePacket);
    CHECK(err == "Error parsing packet: Incomplete packet.");

    const ByteVector no_delim = hex("00 04 08 01 4E 49 5F");
    CHECK(parser.parse_packet(no_delim, OperatingMode::API, p, err) == ParseStatus::InvalidStartDelimiter);
    CHECK(err == "Invalid start delimiter.");

    const ByteVector good = hex("7E 00 04 08 01 4E 49 5F");
    CHECK(parser.parse_packet(good, OperatingMode::AT, p, err) == ParseStatus::InvalidOperatingMode);
    CHECK(err == "Operating mode must be API or API Escaped.");
}

TEST_CASE("Payload shorter than the frame type minimum") {
    PacketParser parser;
    Packet p;
    std::string err;
    const ByteVector frame = hex("7E 00 03 08 01 4E A8");
    CHECK(parser.parse_packet(frame, OperatingMode::API, p, err) == ParseStatus::PayloadTooShort);
    CHECK(err == "Incomplete AT Command packet (minimum 4 bytes, got 3).");
}

TEST_CASE("Escaped mode decodes escapes and rejects raw reserved bytes") {
    PacketParser parser;
    Packet p;
    std::string err;

    const ByteVector escaped = hex("7E 00 02 8A 7D 31 64");
    REQUIRE(parser.parse_packet(escaped, OperatingMode::API_ESCAPED, p, err) == ParseStatus::Ok);
    CHECK(p.as<ModemStatusPacket>()->status == 0x11);

    const ByteVector raw = hex("7E 00 02 8A 11 64");
    CHECK(parser.parse_packet(raw, OperatingMode::API_ESCAPED, p, err) == ParseStatus::SpecialByteNotEscaped);
    CHECK(err == "Special byte not escaped: 0x11.");

    // the same raw bytes are fine without escaping
    CHECK(parser.parse_packet(raw, OperatingMode::API, p, err) == ParseStatus::Ok);
}

TEST_CASE("Escaped length bytes are decoded too") {
    // 0x11-byte payload: the length LSB itself must be escaped
    Packet p = RemoteAtCommandResponsePacket{0x01, Address64(0x0013A20040A1B2C3ULL), Address16::UNKNOWN,
                                             "NI", 0x00, {'A', 'B'}};
    const ByteVector wire = p.generate_bytes(true);
    CHECK(wire[1] == 0x00);
    CHECK(wire[2] == 0x7D);
    CHECK(wire[3] == 0x31);

    PacketParser parser;
    Packet out;
    std::string err;
    REQUIRE(parser.parse_packet(wire, OperatingMode::API_ESCAPED, out, err) == ParseStatus::Ok);
    CHECK(out == p);
}

TEST_CASE("Live source: frame body after the delimiter, with a byte timeout") {
    transport::MemoryConnection conn;
    std::string err;
    REQUIRE(conn.open(err));

    PacketParser parser(std::chrono::milliseconds(20));
    Packet p;

    conn.inject(hex("00 02 8A 00 75"));
    REQUIRE(parser.parse_packet(conn, OperatingMode::API, p, err) == ParseStatus::Ok);
    CHECK(p.as<ModemStatusPacket>()->status == 0x00);

    conn.inject(hex("00 04 08 01"));             // rest never arrives
    const auto start = std::chrono::steady_clock::now();
    CHECK(parser.parse_packet(conn, OperatingMode::API, p, err) == ParseStatus::IncompletePacket);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
}
