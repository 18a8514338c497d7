// -----------------------------------------------------------------------------
// messages.cpp: frame -> message conversion used by the reader loop and queue.
// -----------------------------------------------------------------------------
#include "xbeelink/messages.hpp"

namespace xbeelink {

bool RemoteAddress::matches(const RemoteAddress& other) const {
  const bool known64 = addr64 != Address64::UNKNOWN && other.addr64 != Address64::UNKNOWN;
  if (known64) return addr64 == other.addr64;
  const bool known16 = addr16 != Address16::UNKNOWN && other.addr16 != Address16::UNKNOWN;
  return known16 && addr16 == other.addr16;
}

std::string RemoteAddress::to_string() const {
  return addr64.to_string() + " - " + addr16.to_string();
}

bool is_digi_data_frame(const ExplicitRxIndicatorPacket& p) {
  return p.dest_endpoint == ExplicitRxIndicatorPacket::DATA_ENDPOINT &&
         p.source_endpoint == ExplicitRxIndicatorPacket::DATA_ENDPOINT &&
         p.cluster_id == ExplicitRxIndicatorPacket::DATA_CLUSTER &&
         p.profile_id == ExplicitRxIndicatorPacket::DIGI_PROFILE;
}

std::optional<RemoteAddress> source_of(const Packet& p) {
  if (auto* r = p.as<ReceivePacket>())                 return RemoteAddress{r->source64, r->source16};
  if (auto* r = p.as<IoDataSampleRxIndicatorPacket>()) return RemoteAddress{r->source64, r->source16};
  if (auto* r = p.as<ExplicitRxIndicatorPacket>())     return RemoteAddress{r->source64, r->source16};
  if (auto* r = p.as<RemoteAtCommandResponsePacket>()) return RemoteAddress{r->source64, r->source16};
  if (auto* r = p.as<Rx64Packet>())                    return RemoteAddress{r->source64, Address16::UNKNOWN};
  if (auto* r = p.as<Rx64IoPacket>())                  return RemoteAddress{r->source64, Address16::UNKNOWN};
  if (auto* r = p.as<Rx16Packet>())                    return RemoteAddress{Address64::UNKNOWN, r->source16};
  if (auto* r = p.as<Rx16IoPacket>())                  return RemoteAddress{Address64::UNKNOWN, r->source16};
  return std::nullopt;
}

std::optional<XBeeMessage> data_message_from(const Packet& p) {
  if (auto* r = p.as<ReceivePacket>())
    return XBeeMessage{{r->source64, r->source16}, r->rf_data, p.is_broadcast()};
  if (auto* r = p.as<Rx64Packet>())
    return XBeeMessage{{r->source64, Address16::UNKNOWN}, r->rf_data, p.is_broadcast()};
  if (auto* r = p.as<Rx16Packet>())
    return XBeeMessage{{Address64::UNKNOWN, r->source16}, r->rf_data, p.is_broadcast()};
  if (auto* r = p.as<ExplicitRxIndicatorPacket>()) {
    if (is_digi_data_frame(*r))
      return XBeeMessage{{r->source64, r->source16}, r->rf_data, p.is_broadcast()};
  }
  return std::nullopt;
}

std::optional<ExplicitXBeeMessage> explicit_message_from(const Packet& p) {
  const auto* r = p.as<ExplicitRxIndicatorPacket>();
  if (!r) return std::nullopt;
  ExplicitXBeeMessage m;
  m.remote          = {r->source64, r->source16};
  m.source_endpoint = r->source_endpoint;
  m.dest_endpoint   = r->dest_endpoint;
  m.cluster_id      = r->cluster_id;
  m.profile_id      = r->profile_id;
  m.data            = r->rf_data;
  m.broadcast       = p.is_broadcast();
  return m;
}

std::optional<IOSampleMessage> io_sample_message_from(const Packet& p) {
  if (auto* r = p.as<IoDataSampleRxIndicatorPacket>()) {
    if (r->sample) return IOSampleMessage{{r->source64, r->source16}, *r->sample};
  } else if (auto* r64 = p.as<Rx64IoPacket>()) {
    if (r64->sample) return IOSampleMessage{{r64->source64, Address16::UNKNOWN}, *r64->sample};
  } else if (auto* r16 = p.as<Rx16IoPacket>()) {
    if (r16->sample) return IOSampleMessage{{Address64::UNKNOWN, r16->source16}, *r16->sample};
  }
  return std::nullopt;
}

std::optional<IPMessage> ip_message_from(const Packet& p) {
  const auto* r = p.as<RxIPv4Packet>();
  if (!r) return std::nullopt;
  return IPMessage{r->source_address, r->source_port, r->dest_port, r->protocol, r->data};
}

std::optional<UserDataRelayMessage> relay_message_from(const Packet& p) {
  const auto* r = p.as<UserDataRelayOutputPacket>();
  if (!r) return std::nullopt;
  return UserDataRelayMessage{r->source_interface, r->data};
}

} // namespace xbeelink
