#include <doctest/doctest.h>
#include "xbeelink/data_reader.hpp"
#include "xbeelink/log.hpp"
#include "test_support.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace xbeelink;
using namespace std::chrono_literals;
using xbeelink::test::eventually;
using xbeelink::test::hex;

namespace {

struct LogCapture {
    std::mutex m;
    std::vector<std::string> lines;

    LogCapture() {
        log::set_level(log::Level::Warn);
        log::set_sink([this](log::Level, const std::string& msg) {
            std::lock_guard<std::mutex> lk(m);
            lines.push_back(msg);
        });
    }
    ~LogCapture() { log::set_sink(nullptr); }

    bool contains(const std::string& needle) {
        std::lock_guard<std::mutex> lk(m);
        for (const auto& l : lines)
            if (l.find(needle) != std::string::npos) return true;
        return false;
    }
};

Packet at_response(uint8_t fid, const std::string& cmd) {
    return AtCommandResponsePacket{fid, cmd, 0x00, {}};
}

} // namespace

TEST_CASE("Reader resyncs on the next delimiter after garbage") {
    transport::MemoryConnection conn;
    std::string err;
    REQUIRE(conn.open(err));
    DataReader reader(conn, OperatingMode::API);
    REQUIRE(reader.start());

    conn.inject(hex("01 02 03 FF"));
    conn.inject(hex("7E 00 05 88 01 4E 49 00 DF"));

    auto p = reader.queue().first_packet(2000ms);
    REQUIRE(p.has_value());
    CHECK(p->as<AtCommandResponsePacket>()->command == "NI");
    reader.stop();
}

TEST_CASE("A bad frame is logged and the next one still arrives") {
    LogCapture logs;
    transport::MemoryConnection conn;
    std::string err;
    REQUIRE(conn.open(err));
    DataReader reader(conn, OperatingMode::API);
    REQUIRE(reader.start());

    conn.inject(hex("7E 00 04 08 01 4E 49 00"));   // wrong checksum
    conn.inject(hex("7E 00 02 8A 00 75"));

    auto p = reader.queue().first_packet(2000ms);
    REQUIRE(p.has_value());
    CHECK(p->is<ModemStatusPacket>());
    CHECK(reader.is_running());
    CHECK(logs.contains("Invalid checksum (expected 0x5F)."));
    reader.stop();
}

TEST_CASE("Frame-ID listeners are one-shot once they accept") {
    transport::MemoryConnection conn;
    DataReader reader(conn, OperatingMode::API);

    int calls = 0;
    reader.add_frame_id_listener(5, [&](const Packet&) { ++calls; return true; });
    REQUIRE(reader.frame_id_listener_count() == 1);

    reader.packet_received(at_response(5, "NI"));
    reader.packet_received(at_response(5, "NI"));
    CHECK(calls == 1);
    CHECK(reader.frame_id_listener_count() == 0);
}

TEST_CASE("A rejecting frame-ID listener stays registered") {
    transport::MemoryConnection conn;
    DataReader reader(conn, OperatingMode::API);

    int seen = 0;
    reader.add_frame_id_listener(3, [&](const Packet& p) {
        ++seen;
        return p.as<AtCommandResponsePacket>()->command == "ID";
    });

    reader.packet_received(at_response(3, "NI"));
    reader.packet_received(at_response(4, "ID"));  // other frame ID: not offered
    CHECK(seen == 1);
    CHECK(reader.frame_id_listener_count() == 1);

    reader.packet_received(at_response(3, "ID"));
    CHECK(seen == 2);
    CHECK(reader.frame_id_listener_count() == 0);
}

TEST_CASE("Dispatch order: queue, frame-ID, any-packet, typed") {
    transport::MemoryConnection conn;
    DataReader reader(conn, OperatingMode::API);
    std::vector<std::string> order;

    reader.add_packet_listener([&](const Packet&) {
        order.push_back(reader.queue().size() == 1 ? "any(queued)" : "any");
    });
    reader.add_frame_id_listener(1, [&](const Packet&) { order.push_back("frame_id"); return true; });
    reader.add_data_listener([&](const XBeeMessage&) { order.push_back("data"); });
    reader.add_modem_status_listener([&](uint8_t) { order.push_back("modem"); });

    TransmitStatusPacket ts;
    ts.frame_id = 1;
    reader.packet_received(ts);
    CHECK(order == std::vector<std::string>{"frame_id", "any(queued)"});

    order.clear();
    reader.queue().clear();
    reader.packet_received(ReceivePacket{Address64(0x0013A20040A1B2C3ULL), Address16::UNKNOWN, 0x01, {'h'}});
    CHECK(order == std::vector<std::string>{"any(queued)", "data"});
}

TEST_CASE("Typed listeners receive message views") {
    transport::MemoryConnection conn;
    DataReader reader(conn, OperatingMode::API);

    std::optional<XBeeMessage> data;
    std::optional<uint8_t> modem;
    std::optional<IOSampleMessage> io;
    std::optional<IPMessage> ip;
    std::optional<UserDataRelayMessage> relay;
    reader.add_data_listener([&](const XBeeMessage& m) { data = m; });
    reader.add_modem_status_listener([&](uint8_t s) { modem = s; });
    reader.add_io_sample_listener([&](const IOSampleMessage& m) { io = m; });
    reader.add_ip_data_listener([&](const IPMessage& m) { ip = m; });
    reader.add_relay_data_listener([&](const UserDataRelayMessage& m) { relay = m; });

    reader.packet_received(ReceivePacket{Address64(0x0013A20040A1B2C3ULL), Address16(0x1234), 0x02, {'H', 'i'}});
    REQUIRE(data.has_value());
    CHECK(data->data_string() == "Hi");
    CHECK(data->broadcast);
    CHECK(data->remote.addr16 == Address16(0x1234));

    reader.packet_received(ModemStatusPacket{0x06});
    CHECK(modem == uint8_t(0x06));

    Packet sample;
    std::string err;
    REQUIRE(Packet::parse_payload(hex("92 0013A20040A1B2C3 FFFE 01 01 000C 03 0008 0200 01FF"), sample, err)
            == ParseStatus::Ok);
    reader.packet_received(sample);
    REQUIRE(io.has_value());
    CHECK(io->sample.analog_value(1) == uint16_t(511));

    RxIPv4Packet rx_ip;
    rx_ip.source_address = IPv4Address(10, 0, 0, 1);
    rx_ip.data = {'o', 'k'};
    reader.packet_received(rx_ip);
    REQUIRE(ip.has_value());
    CHECK(ip->data_string() == "ok");

    reader.packet_received(UserDataRelayOutputPacket{0x02, {0x01}});
    REQUIRE(relay.has_value());
    CHECK(relay->source_interface == 0x02);
}

TEST_CASE("Digi data-profile explicit frames also reach data readers") {
    transport::MemoryConnection conn;
    DataReader reader(conn, OperatingMode::API);

    int data_calls = 0, explicit_calls = 0;
    reader.add_data_listener([&](const XBeeMessage&) { ++data_calls; });
    reader.add_explicit_data_listener([&](const ExplicitXBeeMessage&) { ++explicit_calls; });

    ExplicitRxIndicatorPacket ex;
    ex.source64 = Address64(0x0013A20040A1B2C3ULL);
    ex.source_endpoint = ExplicitRxIndicatorPacket::DATA_ENDPOINT;
    ex.dest_endpoint = ExplicitRxIndicatorPacket::DATA_ENDPOINT;
    ex.cluster_id = ExplicitRxIndicatorPacket::DATA_CLUSTER;
    ex.profile_id = ExplicitRxIndicatorPacket::DIGI_PROFILE;
    ex.rf_data = {'d'};
    reader.packet_received(ex);

    CHECK(data_calls == 1);
    CHECK(explicit_calls == 1);
    CHECK(reader.queue().size() == 2);
    auto synthesized = reader.queue().first_data_packet();
    REQUIRE(synthesized.has_value());
    CHECK(synthesized->as<ReceivePacket>()->rf_data == ByteVector{'d'});

    ex.profile_id = 0x0104;                      // other profile: explicit only
    reader.packet_received(ex);
    CHECK(data_calls == 1);
    CHECK(explicit_calls == 2);
}

TEST_CASE("A throwing listener is logged and the others still run") {
    LogCapture logs;
    transport::MemoryConnection conn;
    DataReader reader(conn, OperatingMode::API);

    bool second_ran = false;
    reader.add_packet_listener([](const Packet&) { throw std::runtime_error("boom"); });
    reader.add_packet_listener([&](const Packet&) { second_ran = true; });

    reader.packet_received(ModemStatusPacket{0x00});
    CHECK(second_ran);
    CHECK(logs.contains("boom"));
}

TEST_CASE("Removed listeners are not called") {
    transport::MemoryConnection conn;
    DataReader reader(conn, OperatingMode::API);

    int calls = 0;
    auto id = reader.add_packet_listener([&](const Packet&) { ++calls; });
    CHECK(reader.remove_listener(id));
    CHECK_FALSE(reader.remove_listener(id));

    reader.packet_received(ModemStatusPacket{0x00});
    CHECK(calls == 0);
}

TEST_CASE("AT mode drains bytes until the mode changes") {
    transport::MemoryConnection conn;
    std::string err;
    REQUIRE(conn.open(err));
    DataReader reader(conn, OperatingMode::AT);
    REQUIRE(reader.start());

    conn.inject(hex("7E 00 02 8A 00 75"));
    CHECK(eventually([&] { return conn.available() == 0; }));
    std::this_thread::sleep_for(50ms);
    CHECK(reader.queue().empty());

    reader.set_mode(OperatingMode::API);
    conn.inject(hex("7E 00 02 8A 00 75"));
    CHECK(reader.queue().first_packet(2000ms).has_value());
    reader.stop();
}

TEST_CASE("Lifecycle: start, double start, stop, restart") {
    transport::MemoryConnection conn;
    std::string err;
    REQUIRE(conn.open(err));
    DataReader reader(conn, OperatingMode::API);
    CHECK(reader.state() == DataReader::State::Idle);

    REQUIRE(reader.start());
    CHECK(reader.is_running());
    CHECK_FALSE(reader.start());

    reader.stop();
    CHECK(reader.state() == DataReader::State::Stopped);
    CHECK(conn.is_open());                       // a requested stop leaves the link alone

    reader.queue().add(ModemStatusPacket{0x00});
    REQUIRE(reader.start());
    CHECK(reader.queue().empty());               // cleared on start
    reader.stop();
}

TEST_CASE("Transport failure stops the reader and closes the connection") {
    transport::MemoryConnection conn;
    std::string err;
    REQUIRE(conn.open(err));
    DataReader reader(conn, OperatingMode::API);

    std::atomic<bool> stopped_cb{false};
    reader.set_stop_callback([&] { stopped_cb = true; });
    REQUIRE(reader.start());

    conn.drop_link();
    CHECK(eventually([&] { return reader.state() == DataReader::State::Stopped; }));
    CHECK(eventually([&] { return stopped_cb.load(); }));
    CHECK_FALSE(conn.is_open());
    reader.stop();
}
