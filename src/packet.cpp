// -----------------------------------------------------------------------------
// packet.cpp: serialization side of Packet.
//
// Layouts per frame kind are documented in packet.hpp. Decoding lives in
// packet_codec.cpp, diagnostic formatting in packet_format.cpp.
// -----------------------------------------------------------------------------
#include "xbeelink/packet.hpp"
#include "xbeelink/checksum.hpp"
#include "xbeelink/escape.hpp"
#include "xbeelink/status_codes.hpp"

namespace xbeelink {

namespace {

// Two ASCII command characters. Short commands are padded so the layout of
// the following fields never shifts.
void append_command(ByteVector& out, const std::string& cmd) {
  for (size_t i = 0; i < 2; ++i)
    out.push_back(i < cmd.size() ? static_cast<uint8_t>(cmd[i]) : 0x00);
}

// ---------------------------------------------------------------------------
// encode_fields()
// ---------------
// One overload per kind. Writes everything after the type byte and the
// frame ID byte.
// ---------------------------------------------------------------------------
void encode_fields(const AtCommandPacket& p, ByteVector& out) {
  append_command(out, p.command);
  append(out, p.parameter);
}

void encode_fields(const AtCommandQueuePacket& p, ByteVector& out) {
  append_command(out, p.command);
  append(out, p.parameter);
}

void encode_fields(const AtCommandResponsePacket& p, ByteVector& out) {
  append_command(out, p.command);
  out.push_back(p.status);
  append(out, p.value);
}

void encode_fields(const RemoteAtCommandRequestPacket& p, ByteVector& out) {
  p.dest64.append_to(out);
  p.dest16.append_to(out);
  out.push_back(p.options);
  append_command(out, p.command);
  append(out, p.parameter);
}

void encode_fields(const RemoteAtCommandResponsePacket& p, ByteVector& out) {
  p.source64.append_to(out);
  p.source16.append_to(out);
  append_command(out, p.command);
  out.push_back(p.status);
  append(out, p.value);
}

void encode_fields(const TransmitRequestPacket& p, ByteVector& out) {
  p.dest64.append_to(out);
  p.dest16.append_to(out);
  out.push_back(p.radius);
  out.push_back(p.options);
  append(out, p.rf_data);
}

void encode_fields(const TransmitStatusPacket& p, ByteVector& out) {
  p.dest16.append_to(out);
  out.push_back(p.retry_count);
  out.push_back(p.delivery_status);
  out.push_back(p.discovery_status);
}

void encode_fields(const Tx64Packet& p, ByteVector& out) {
  p.dest64.append_to(out);
  out.push_back(p.options);
  append(out, p.rf_data);
}

void encode_fields(const Tx16Packet& p, ByteVector& out) {
  p.dest16.append_to(out);
  out.push_back(p.options);
  append(out, p.rf_data);
}

void encode_fields(const TxStatusPacket& p, ByteVector& out) {
  out.push_back(p.status);
}

void encode_fields(const ExplicitAddressingPacket& p, ByteVector& out) {
  p.dest64.append_to(out);
  p.dest16.append_to(out);
  out.push_back(p.source_endpoint);
  out.push_back(p.dest_endpoint);
  append_u16(out, p.cluster_id);
  append_u16(out, p.profile_id);
  out.push_back(p.radius);
  out.push_back(p.options);
  append(out, p.rf_data);
}

void encode_fields(const TxIPv4Packet& p, ByteVector& out) {
  p.dest_address.append_to(out);
  append_u16(out, p.dest_port);
  append_u16(out, p.source_port);
  out.push_back(p.protocol);
  out.push_back(p.options);
  append(out, p.data);
}

void encode_fields(const UserDataRelayPacket& p, ByteVector& out) {
  out.push_back(p.dest_interface);
  append(out, p.data);
}

void encode_fields(const ReceivePacket& p, ByteVector& out) {
  p.source64.append_to(out);
  p.source16.append_to(out);
  out.push_back(p.options);
  append(out, p.rf_data);
}

void encode_fields(const IoDataSampleRxIndicatorPacket& p, ByteVector& out) {
  p.source64.append_to(out);
  p.source16.append_to(out);
  out.push_back(p.options);
  append(out, p.sample_data);
}

void encode_fields(const ModemStatusPacket& p, ByteVector& out) {
  out.push_back(p.status);
}

void encode_fields(const RxIPv4Packet& p, ByteVector& out) {
  p.source_address.append_to(out);
  append_u16(out, p.dest_port);
  append_u16(out, p.source_port);
  out.push_back(p.protocol);
  out.push_back(p.status);
  append(out, p.data);
}

void encode_fields(const Rx64Packet& p, ByteVector& out) {
  p.source64.append_to(out);
  out.push_back(p.rssi);
  out.push_back(p.options);
  append(out, p.rf_data);
}

void encode_fields(const Rx16Packet& p, ByteVector& out) {
  p.source16.append_to(out);
  out.push_back(p.rssi);
  out.push_back(p.options);
  append(out, p.rf_data);
}

void encode_fields(const Rx64IoPacket& p, ByteVector& out) {
  p.source64.append_to(out);
  out.push_back(p.rssi);
  out.push_back(p.options);
  append(out, p.sample_data);
}

void encode_fields(const Rx16IoPacket& p, ByteVector& out) {
  p.source16.append_to(out);
  out.push_back(p.rssi);
  out.push_back(p.options);
  append(out, p.sample_data);
}

void encode_fields(const ExplicitRxIndicatorPacket& p, ByteVector& out) {
  p.source64.append_to(out);
  p.source16.append_to(out);
  out.push_back(p.source_endpoint);
  out.push_back(p.dest_endpoint);
  append_u16(out, p.cluster_id);
  append_u16(out, p.profile_id);
  out.push_back(p.options);
  append(out, p.rf_data);
}

void encode_fields(const UserDataRelayOutputPacket& p, ByteVector& out) {
  out.push_back(p.source_interface);
  append(out, p.data);
}

void encode_fields(const UnknownPacket& p, ByteVector& out) {
  append(out, p.data);
}

// ---------------------------------------------------------------------------
// broadcast_of()
// --------------
// Transmit kinds look at the destination sentinels, receive kinds at the
// options bit field. Everything else is never a broadcast.
// ---------------------------------------------------------------------------
template <typename T>
bool broadcast_of(const T&) { return false; }

bool dest_is_broadcast(const Address64& a64, const Address16& a16) {
  return a64 == Address64::BROADCAST || a16 == Address16::BROADCAST;
}

bool broadcast_of(const TransmitRequestPacket& p)        { return dest_is_broadcast(p.dest64, p.dest16); }
bool broadcast_of(const RemoteAtCommandRequestPacket& p) { return dest_is_broadcast(p.dest64, p.dest16); }
bool broadcast_of(const ExplicitAddressingPacket& p)     { return dest_is_broadcast(p.dest64, p.dest16); }
bool broadcast_of(const Tx64Packet& p)                   { return p.dest64 == Address64::BROADCAST; }
bool broadcast_of(const Tx16Packet& p)                   { return p.dest16 == Address16::BROADCAST; }

bool options_broadcast(uint8_t o) { return (o & receive_options::BROADCAST_PACKET) != 0; }
bool options_broadcast_802(uint8_t o) {
  return (o & (receive_options::BROADCAST_PACKET | receive_options::PAN_BROADCAST)) != 0;
}

bool broadcast_of(const ReceivePacket& p)                 { return options_broadcast(p.options); }
bool broadcast_of(const IoDataSampleRxIndicatorPacket& p) { return options_broadcast(p.options); }
bool broadcast_of(const ExplicitRxIndicatorPacket& p)     { return options_broadcast(p.options); }
bool broadcast_of(const Rx64Packet& p)                    { return options_broadcast_802(p.options); }
bool broadcast_of(const Rx16Packet& p)                    { return options_broadcast_802(p.options); }
bool broadcast_of(const Rx64IoPacket& p)                  { return options_broadcast_802(p.options); }
bool broadcast_of(const Rx16IoPacket& p)                  { return options_broadcast_802(p.options); }

} // namespace

// ---------- identity ----------

FrameType Packet::frame_type() const {
  return std::visit([](const auto& p) {
    using T = std::decay_t<decltype(p)>;
    return T::TYPE;
  }, v_);
}

uint8_t Packet::frame_type_value() const {
  if (const auto* u = std::get_if<UnknownPacket>(&v_)) return u->frame_type;
  return static_cast<uint8_t>(frame_type());
}

bool Packet::needs_frame_id() const {
  return std::visit([](const auto& p) {
    using T = std::decay_t<decltype(p)>;
    return T::NEEDS_FRAME_ID;
  }, v_);
}

FrameId Packet::frame_id() const {
  return std::visit([](const auto& p) -> FrameId {
    using T = std::decay_t<decltype(p)>;
    if constexpr (T::NEEDS_FRAME_ID) return p.frame_id;
    else                             return std::nullopt;
  }, v_);
}

void Packet::set_frame_id(uint8_t id) {
  std::visit([id](auto& p) {
    using T = std::decay_t<decltype(p)>;
    if constexpr (T::NEEDS_FRAME_ID) p.frame_id = id;
  }, v_);
}

bool Packet::check_frame_id(uint8_t id) const {
  const FrameId fid = frame_id();
  return needs_frame_id() && fid.has_value() && *fid == id;
}

bool Packet::is_broadcast() const {
  return std::visit([](const auto& p) { return broadcast_of(p); }, v_);
}

// ---------- serialization ----------

ByteVector Packet::api_data() const {
  ByteVector out;
  out.push_back(frame_type_value());
  std::visit([&out](const auto& p) {
    using T = std::decay_t<decltype(p)>;
    if constexpr (T::NEEDS_FRAME_ID) out.push_back(p.frame_id.value_or(0));
    encode_fields(p, out);
  }, v_);
  return out;
}

uint8_t Packet::checksum() const {
  Checksum cs;
  cs.add(api_data());
  return cs.generate();
}

// generate_bytes(): full envelope; escaping covers length, payload and
// checksum, never the leading delimiter.
ByteVector Packet::generate_bytes(bool escaped) const {
  const ByteVector payload = api_data();
  Checksum cs;
  cs.add(payload);

  ByteVector frame;
  frame.reserve(payload.size() + 4);
  frame.push_back(escape::HEADER_BYTE);
  append_u16(frame, static_cast<uint16_t>(payload.size()));
  append(frame, payload);
  frame.push_back(cs.generate());

  return escaped ? escape::escape_frame(frame) : frame;
}

} // namespace xbeelink
