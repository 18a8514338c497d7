// -----------------------------------------------------------------------------
// packet_format.cpp: diagnostic breakdown of a Packet.
//
// parameters() returns the envelope and every field in wire order:
//   Start delimiter, Length, Frame type, [Frame ID], <kind fields>, Checksum
// Values are pretty hex, with a decoded hint in parentheses where one exists:
//   {"Frame type", "08 (AT Command)"}, {"AT Command", "4E 49 (NI)"}
// -----------------------------------------------------------------------------
#include "xbeelink/packet.hpp"
#include "xbeelink/status_codes.hpp"

namespace xbeelink {

namespace {

using Params = std::vector<PacketParameter>;

std::string pretty_u8(uint8_t v)   { return byte_to_hex(v); }
std::string pretty_u16(uint16_t v) {
  ByteVector b;
  append_u16(b, v);
  return to_pretty_hex(b);
}
std::string pretty_with_decimal(uint8_t v) { return pretty_u8(v) + " (" + std::to_string(v) + ")"; }
std::string pretty_described(uint8_t v, const char* desc) { return pretty_u8(v) + " (" + desc + ")"; }

std::string pretty_addr(const Address64& a) { return to_pretty_hex(ByteVector(a.bytes().begin(), a.bytes().end())); }
std::string pretty_addr(const Address16& a) { return to_pretty_hex(ByteVector(a.bytes().begin(), a.bytes().end())); }

std::string pretty_command(const std::string& cmd) {
  return to_pretty_hex(ByteVector(cmd.begin(), cmd.end())) + " (" + cmd + ")";
}

// NI, NI-style text parameters get their ASCII form appended.
std::string pretty_text_bytes(const ByteVector& v) {
  return to_pretty_hex(v) + " (" + to_printable(v) + ")";
}

void add_data(Params& out, const char* label, const ByteVector& data) {
  if (!data.empty()) out.emplace_back(label, to_pretty_hex(data));
}

void add_sample(Params& out, const std::optional<IOSample>& sample) {
  if (!sample) return;
  out.emplace_back("Number of samples", "01");             // always one sample
  out.emplace_back("Digital channel mask", pretty_u16(sample->digital_mask()));
  out.emplace_back("Analog channel mask", pretty_u16(sample->analog_mask()));
  for (const auto& kv : sample->digital_values())
    out.emplace_back("DIO" + std::to_string(kv.first) + " digital value",
                     kv.second == IOValue::High ? "High" : "Low");
  for (const auto& kv : sample->analog_values())
    out.emplace_back("AD" + std::to_string(kv.first) + " analog value", pretty_u16(kv.second));
  if (sample->has_power_supply_value())
    out.emplace_back("Power supply value", pretty_u16(*sample->power_supply_value()));
}

// ---------------------------------------------------------------------------
// fields_of()
// -----------
// Kind-specific rows only; the envelope rows are added by Packet::parameters().
// ---------------------------------------------------------------------------
void fields_of(const AtCommandPacket& p, Params& out) {
  out.emplace_back("AT Command", pretty_command(p.command));
  if (!p.parameter.empty()) out.emplace_back("Parameter", pretty_text_bytes(p.parameter));
}

void fields_of(const AtCommandQueuePacket& p, Params& out) {
  out.emplace_back("AT Command", pretty_command(p.command));
  if (!p.parameter.empty()) out.emplace_back("Parameter", pretty_text_bytes(p.parameter));
}

void fields_of(const AtCommandResponsePacket& p, Params& out) {
  out.emplace_back("AT Command", pretty_command(p.command));
  out.emplace_back("Status", pretty_described(p.status, at_status_description(p.status)));
  if (!p.value.empty()) out.emplace_back("Response", pretty_text_bytes(p.value));
}

void fields_of(const RemoteAtCommandRequestPacket& p, Params& out) {
  out.emplace_back("64-bit dest. address", pretty_addr(p.dest64));
  out.emplace_back("16-bit dest. address", pretty_addr(p.dest16));
  out.emplace_back("Command options", pretty_u8(p.options));
  out.emplace_back("AT Command", pretty_command(p.command));
  if (!p.parameter.empty()) out.emplace_back("Parameter", pretty_text_bytes(p.parameter));
}

void fields_of(const RemoteAtCommandResponsePacket& p, Params& out) {
  out.emplace_back("64-bit source address", pretty_addr(p.source64));
  out.emplace_back("16-bit source address", pretty_addr(p.source16));
  out.emplace_back("AT Command", pretty_command(p.command));
  out.emplace_back("Status", pretty_described(p.status, at_status_description(p.status)));
  if (!p.value.empty()) out.emplace_back("Response", pretty_text_bytes(p.value));
}

void fields_of(const TransmitRequestPacket& p, Params& out) {
  out.emplace_back("64-bit dest. address", pretty_addr(p.dest64));
  out.emplace_back("16-bit dest. address", pretty_addr(p.dest16));
  out.emplace_back("Broadcast radius", pretty_with_decimal(p.radius));
  out.emplace_back("Options", pretty_u8(p.options));
  add_data(out, "RF data", p.rf_data);
}

void fields_of(const TransmitStatusPacket& p, Params& out) {
  out.emplace_back("16-bit dest. address", pretty_addr(p.dest16));
  out.emplace_back("Tx. retry count", pretty_with_decimal(p.retry_count));
  out.emplace_back("Delivery status",
                   pretty_described(p.delivery_status, transmit_status_description(p.delivery_status)));
  out.emplace_back("Discovery status",
                   pretty_described(p.discovery_status, discovery_status_description(p.discovery_status)));
}

void fields_of(const Tx64Packet& p, Params& out) {
  out.emplace_back("64-bit dest. address", pretty_addr(p.dest64));
  out.emplace_back("Options", pretty_u8(p.options));
  add_data(out, "RF data", p.rf_data);
}

void fields_of(const Tx16Packet& p, Params& out) {
  out.emplace_back("16-bit dest. address", pretty_addr(p.dest16));
  out.emplace_back("Options", pretty_u8(p.options));
  add_data(out, "RF data", p.rf_data);
}

void fields_of(const TxStatusPacket& p, Params& out) {
  out.emplace_back("Status", pretty_described(p.status, transmit_status_description(p.status)));
}

void fields_of(const ExplicitAddressingPacket& p, Params& out) {
  out.emplace_back("64-bit dest. address", pretty_addr(p.dest64));
  out.emplace_back("16-bit dest. address", pretty_addr(p.dest16));
  out.emplace_back("Source endpoint", pretty_u8(p.source_endpoint));
  out.emplace_back("Dest. endpoint", pretty_u8(p.dest_endpoint));
  out.emplace_back("Cluster ID", pretty_u16(p.cluster_id));
  out.emplace_back("Profile ID", pretty_u16(p.profile_id));
  out.emplace_back("Broadcast radius", pretty_with_decimal(p.radius));
  out.emplace_back("Options", pretty_u8(p.options));
  add_data(out, "RF data", p.rf_data);
}

void fields_of(const TxIPv4Packet& p, Params& out) {
  out.emplace_back("Destination address", p.dest_address.to_string());
  out.emplace_back("Destination port", pretty_u16(p.dest_port) + " (" + std::to_string(p.dest_port) + ")");
  out.emplace_back("Source port", pretty_u16(p.source_port) + " (" + std::to_string(p.source_port) + ")");
  out.emplace_back("Protocol", pretty_described(p.protocol, ip_protocol_description(p.protocol)));
  out.emplace_back("Transmit options", pretty_u8(p.options));
  add_data(out, "Data", p.data);
}

void fields_of(const UserDataRelayPacket& p, Params& out) {
  out.emplace_back("Destination interface",
                   pretty_described(p.dest_interface, relay_interface_description(p.dest_interface)));
  add_data(out, "Data", p.data);
}

void fields_of(const ReceivePacket& p, Params& out) {
  out.emplace_back("64-bit source address", pretty_addr(p.source64));
  out.emplace_back("16-bit source address", pretty_addr(p.source16));
  out.emplace_back("Receive options", pretty_u8(p.options));
  add_data(out, "RF data", p.rf_data);
}

void fields_of(const IoDataSampleRxIndicatorPacket& p, Params& out) {
  out.emplace_back("64-bit source address", pretty_addr(p.source64));
  out.emplace_back("16-bit source address", pretty_addr(p.source16));
  out.emplace_back("Receive options", pretty_u8(p.options));
  if (p.sample) add_sample(out, p.sample);
  else          add_data(out, "RF data", p.sample_data);
}

void fields_of(const ModemStatusPacket& p, Params& out) {
  out.emplace_back("Status", pretty_described(p.status, modem_status_description(p.status)));
}

void fields_of(const RxIPv4Packet& p, Params& out) {
  out.emplace_back("Source address", p.source_address.to_string());
  out.emplace_back("Destination port", pretty_u16(p.dest_port) + " (" + std::to_string(p.dest_port) + ")");
  out.emplace_back("Source port", pretty_u16(p.source_port) + " (" + std::to_string(p.source_port) + ")");
  out.emplace_back("Protocol", pretty_described(p.protocol, ip_protocol_description(p.protocol)));
  out.emplace_back("Status", pretty_u8(p.status));
  add_data(out, "Data", p.data);
}

void fields_of(const Rx64Packet& p, Params& out) {
  out.emplace_back("64-bit source address", pretty_addr(p.source64));
  out.emplace_back("RSSI", pretty_u8(p.rssi));
  out.emplace_back("Options", pretty_u8(p.options));
  add_data(out, "RF data", p.rf_data);
}

void fields_of(const Rx16Packet& p, Params& out) {
  out.emplace_back("16-bit source address", pretty_addr(p.source16));
  out.emplace_back("RSSI", pretty_u8(p.rssi));
  out.emplace_back("Options", pretty_u8(p.options));
  add_data(out, "RF data", p.rf_data);
}

void fields_of(const Rx64IoPacket& p, Params& out) {
  out.emplace_back("64-bit source address", pretty_addr(p.source64));
  out.emplace_back("RSSI", pretty_u8(p.rssi));
  out.emplace_back("Options", pretty_u8(p.options));
  if (p.sample) add_sample(out, p.sample);
  else          add_data(out, "RF data", p.sample_data);
}

void fields_of(const Rx16IoPacket& p, Params& out) {
  out.emplace_back("16-bit source address", pretty_addr(p.source16));
  out.emplace_back("RSSI", pretty_u8(p.rssi));
  out.emplace_back("Options", pretty_u8(p.options));
  if (p.sample) add_sample(out, p.sample);
  else          add_data(out, "RF data", p.sample_data);
}

void fields_of(const ExplicitRxIndicatorPacket& p, Params& out) {
  out.emplace_back("64-bit source address", pretty_addr(p.source64));
  out.emplace_back("16-bit source address", pretty_addr(p.source16));
  out.emplace_back("Source endpoint", pretty_u8(p.source_endpoint));
  out.emplace_back("Dest. endpoint", pretty_u8(p.dest_endpoint));
  out.emplace_back("Cluster ID", pretty_u16(p.cluster_id));
  out.emplace_back("Profile ID", pretty_u16(p.profile_id));
  out.emplace_back("Receive options", pretty_u8(p.options));
  add_data(out, "RF data", p.rf_data);
}

void fields_of(const UserDataRelayOutputPacket& p, Params& out) {
  out.emplace_back("Source interface",
                   pretty_described(p.source_interface, relay_interface_description(p.source_interface)));
  add_data(out, "Data", p.data);
}

void fields_of(const UnknownPacket& p, Params& out) {
  add_data(out, "RF data", p.data);
}

} // namespace

std::vector<PacketParameter> Packet::parameters() const {
  const ByteVector frame = generate_bytes(false);
  const size_t len = frame.size() - 4;           // delimiter, 2 length bytes, checksum

  Params out;
  out.emplace_back("Start delimiter", byte_to_hex(frame[0]));
  out.emplace_back("Length", pretty_u16(static_cast<uint16_t>(len)) + " (" + std::to_string(len) + ")");
  out.emplace_back("Frame type", pretty_described(frame_type_value(), frame_type_name()));

  if (needs_frame_id()) {
    const FrameId fid = frame_id();
    out.emplace_back("Frame ID", fid ? pretty_with_decimal(*fid) : std::string("(NO FRAME ID)"));
  }

  std::visit([&out](const auto& p) { fields_of(p, out); }, v_);

  out.emplace_back("Checksum", byte_to_hex(frame.back()));
  return out;
}

std::string Packet::to_pretty_string() const {
  std::string s = "Packet: " + to_hex_string() + "\n";
  for (const auto& kv : parameters())
    s += kv.first + ": " + kv.second + "\n";
  return s;
}

} // namespace xbeelink
