// -----------------------------------------------------------------------------
// packet_codec.cpp: frame type registry: payload bytes -> typed Packet.
//
// Every entry pairs a type code with its minimum payload length (type byte
// included) and a decoder. The length check runs before any decoder touches
// the buffer, so decoders index freely up to MIN_LENGTH - 1.
// Type codes missing from the table decode to UnknownPacket.
// -----------------------------------------------------------------------------
#include "xbeelink/packet.hpp"

namespace xbeelink {

namespace {

std::string read_command(const ByteVector& in, size_t at) {
  return std::string{static_cast<char>(in[at]), static_cast<char>(in[at + 1])};
}

// Sample decode failures are not frame faults: the frame is still valid and
// keeps its raw sample bytes.
std::optional<IOSample> try_sample(const ByteVector& data) {
  IOSample s;
  std::string ignored;
  if (!IOSample::parse(data, s, ignored)) return std::nullopt;
  return s;
}

// ---------------------------------------------------------------------------
// decode_*()
// ----------
// Payload index 0 is the type byte; for kinds with a frame ID it is at 1.
// ---------------------------------------------------------------------------
Packet decode_at_command(const ByteVector& in) {
  return AtCommandPacket{in[1], read_command(in, 2), tail(in, 4)};
}

Packet decode_at_command_queue(const ByteVector& in) {
  return AtCommandQueuePacket{in[1], read_command(in, 2), tail(in, 4)};
}

Packet decode_at_command_response(const ByteVector& in) {
  return AtCommandResponsePacket{in[1], read_command(in, 2), in[4], tail(in, 5)};
}

Packet decode_remote_at_request(const ByteVector& in) {
  RemoteAtCommandRequestPacket p;
  p.frame_id  = in[1];
  p.dest64    = Address64::from_bytes(in, 2);
  p.dest16    = Address16::from_bytes(in, 10);
  p.options   = in[12];
  p.command   = read_command(in, 13);
  p.parameter = tail(in, 15);
  return p;
}

Packet decode_remote_at_response(const ByteVector& in) {
  RemoteAtCommandResponsePacket p;
  p.frame_id = in[1];
  p.source64 = Address64::from_bytes(in, 2);
  p.source16 = Address16::from_bytes(in, 10);
  p.command  = read_command(in, 12);
  p.status   = in[14];
  p.value    = tail(in, 15);
  return p;
}

Packet decode_transmit_request(const ByteVector& in) {
  TransmitRequestPacket p;
  p.frame_id = in[1];
  p.dest64   = Address64::from_bytes(in, 2);
  p.dest16   = Address16::from_bytes(in, 10);
  p.radius   = in[12];
  p.options  = in[13];
  p.rf_data  = tail(in, 14);
  return p;
}

Packet decode_transmit_status(const ByteVector& in) {
  TransmitStatusPacket p;
  p.frame_id         = in[1];
  p.dest16           = Address16::from_bytes(in, 2);
  p.retry_count      = in[4];
  p.delivery_status  = in[5];
  p.discovery_status = in[6];
  return p;
}

Packet decode_tx64(const ByteVector& in) {
  return Tx64Packet{in[1], Address64::from_bytes(in, 2), in[10], tail(in, 11)};
}

Packet decode_tx16(const ByteVector& in) {
  return Tx16Packet{in[1], Address16::from_bytes(in, 2), in[4], tail(in, 5)};
}

Packet decode_tx_status(const ByteVector& in) {
  return TxStatusPacket{in[1], in[2]};
}

Packet decode_explicit_addressing(const ByteVector& in) {
  ExplicitAddressingPacket p;
  p.frame_id        = in[1];
  p.dest64          = Address64::from_bytes(in, 2);
  p.dest16          = Address16::from_bytes(in, 10);
  p.source_endpoint = in[12];
  p.dest_endpoint   = in[13];
  p.cluster_id      = read_u16(in, 14);
  p.profile_id      = read_u16(in, 16);
  p.radius          = in[18];
  p.options         = in[19];
  p.rf_data         = tail(in, 20);
  return p;
}

Packet decode_tx_ipv4(const ByteVector& in) {
  TxIPv4Packet p;
  p.frame_id     = in[1];
  p.dest_address = IPv4Address::from_bytes(in, 2);
  p.dest_port    = read_u16(in, 6);
  p.source_port  = read_u16(in, 8);
  p.protocol     = in[10];
  p.options      = in[11];
  p.data         = tail(in, 12);
  return p;
}

Packet decode_user_data_relay(const ByteVector& in) {
  return UserDataRelayPacket{in[1], in[2], tail(in, 3)};
}

Packet decode_receive(const ByteVector& in) {
  ReceivePacket p;
  p.source64 = Address64::from_bytes(in, 1);
  p.source16 = Address16::from_bytes(in, 9);
  p.options  = in[11];
  p.rf_data  = tail(in, 12);
  return p;
}

Packet decode_io_sample_indicator(const ByteVector& in) {
  IoDataSampleRxIndicatorPacket p;
  p.source64    = Address64::from_bytes(in, 1);
  p.source16    = Address16::from_bytes(in, 9);
  p.options     = in[11];
  p.sample_data = tail(in, 12);
  p.sample      = try_sample(p.sample_data);
  return p;
}

Packet decode_modem_status(const ByteVector& in) {
  return ModemStatusPacket{in[1]};
}

Packet decode_rx_ipv4(const ByteVector& in) {
  RxIPv4Packet p;
  p.source_address = IPv4Address::from_bytes(in, 1);
  p.dest_port      = read_u16(in, 5);
  p.source_port    = read_u16(in, 7);
  p.protocol       = in[9];
  p.status         = in[10];
  p.data           = tail(in, 11);
  return p;
}

Packet decode_rx64(const ByteVector& in) {
  return Rx64Packet{Address64::from_bytes(in, 1), in[9], in[10], tail(in, 11)};
}

Packet decode_rx16(const ByteVector& in) {
  return Rx16Packet{Address16::from_bytes(in, 1), in[3], in[4], tail(in, 5)};
}

Packet decode_rx64_io(const ByteVector& in) {
  Rx64IoPacket p;
  p.source64    = Address64::from_bytes(in, 1);
  p.rssi        = in[9];
  p.options     = in[10];
  p.sample_data = tail(in, 11);
  p.sample      = try_sample(p.sample_data);
  return p;
}

Packet decode_rx16_io(const ByteVector& in) {
  Rx16IoPacket p;
  p.source16    = Address16::from_bytes(in, 1);
  p.rssi        = in[3];
  p.options     = in[4];
  p.sample_data = tail(in, 5);
  p.sample      = try_sample(p.sample_data);
  return p;
}

Packet decode_explicit_rx(const ByteVector& in) {
  ExplicitRxIndicatorPacket p;
  p.source64        = Address64::from_bytes(in, 1);
  p.source16        = Address16::from_bytes(in, 9);
  p.source_endpoint = in[11];
  p.dest_endpoint   = in[12];
  p.cluster_id      = read_u16(in, 13);
  p.profile_id      = read_u16(in, 15);
  p.options         = in[17];
  p.rf_data         = tail(in, 18);
  return p;
}

Packet decode_user_data_relay_output(const ByteVector& in) {
  return UserDataRelayOutputPacket{in[1], tail(in, 2)};
}

struct CodecEntry {
  FrameType type;
  size_t min_length;
  Packet (*decode)(const ByteVector&);
};

const CodecEntry REGISTRY[] = {
  {AtCommandPacket::TYPE,               AtCommandPacket::MIN_LENGTH,               decode_at_command},
  {AtCommandQueuePacket::TYPE,          AtCommandQueuePacket::MIN_LENGTH,          decode_at_command_queue},
  {AtCommandResponsePacket::TYPE,       AtCommandResponsePacket::MIN_LENGTH,       decode_at_command_response},
  {RemoteAtCommandRequestPacket::TYPE,  RemoteAtCommandRequestPacket::MIN_LENGTH,  decode_remote_at_request},
  {RemoteAtCommandResponsePacket::TYPE, RemoteAtCommandResponsePacket::MIN_LENGTH, decode_remote_at_response},
  {TransmitRequestPacket::TYPE,         TransmitRequestPacket::MIN_LENGTH,         decode_transmit_request},
  {TransmitStatusPacket::TYPE,          TransmitStatusPacket::MIN_LENGTH,          decode_transmit_status},
  {Tx64Packet::TYPE,                    Tx64Packet::MIN_LENGTH,                    decode_tx64},
  {Tx16Packet::TYPE,                    Tx16Packet::MIN_LENGTH,                    decode_tx16},
  {TxStatusPacket::TYPE,                TxStatusPacket::MIN_LENGTH,                decode_tx_status},
  {ExplicitAddressingPacket::TYPE,      ExplicitAddressingPacket::MIN_LENGTH,      decode_explicit_addressing},
  {TxIPv4Packet::TYPE,                  TxIPv4Packet::MIN_LENGTH,                  decode_tx_ipv4},
  {UserDataRelayPacket::TYPE,           UserDataRelayPacket::MIN_LENGTH,           decode_user_data_relay},
  {ReceivePacket::TYPE,                 ReceivePacket::MIN_LENGTH,                 decode_receive},
  {IoDataSampleRxIndicatorPacket::TYPE, IoDataSampleRxIndicatorPacket::MIN_LENGTH, decode_io_sample_indicator},
  {ModemStatusPacket::TYPE,             ModemStatusPacket::MIN_LENGTH,             decode_modem_status},
  {RxIPv4Packet::TYPE,                  RxIPv4Packet::MIN_LENGTH,                  decode_rx_ipv4},
  {Rx64Packet::TYPE,                    Rx64Packet::MIN_LENGTH,                    decode_rx64},
  {Rx16Packet::TYPE,                    Rx16Packet::MIN_LENGTH,                    decode_rx16},
  {Rx64IoPacket::TYPE,                  Rx64IoPacket::MIN_LENGTH,                  decode_rx64_io},
  {Rx16IoPacket::TYPE,                  Rx16IoPacket::MIN_LENGTH,                  decode_rx16_io},
  {ExplicitRxIndicatorPacket::TYPE,     ExplicitRxIndicatorPacket::MIN_LENGTH,     decode_explicit_rx},
  {UserDataRelayOutputPacket::TYPE,     UserDataRelayOutputPacket::MIN_LENGTH,     decode_user_data_relay_output},
};

const CodecEntry* find_codec(uint8_t type) {
  for (const auto& e : REGISTRY)
    if (static_cast<uint8_t>(e.type) == type) return &e;
  return nullptr;
}

} // namespace

size_t Packet::min_length(uint8_t frame_type) {
  const CodecEntry* e = find_codec(frame_type);
  return e ? e->min_length : 0;
}

ParseStatus Packet::parse_payload(const ByteVector& payload, Packet& out, std::string& err) {
  if (payload.empty()) {
    err = "Payload cannot be empty.";
    return ParseStatus::EmptyPayload;
  }

  const CodecEntry* e = find_codec(payload[0]);
  if (!e) {                                        // forward-compatible fallback
    out = UnknownPacket{payload[0], tail(payload, 1)};
    return ParseStatus::Ok;
  }

  if (payload.size() < e->min_length) {
    err = std::string("Incomplete ") + xbeelink::frame_type_name(e->type) + " packet (minimum " +
          std::to_string(e->min_length) + " bytes, got " + std::to_string(payload.size()) + ").";
    return ParseStatus::PayloadTooShort;
  }

  out = e->decode(payload);
  return ParseStatus::Ok;
}

} // namespace xbeelink
