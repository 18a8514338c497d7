#pragma once
/**
 * @file messages.hpp
 * @brief Application-level views of received frames.
 *
 * The reader loop builds these while dispatching to typed listeners: each one
 * pairs the sender's identity with the payload, independent of which frame
 * kind carried it (0x90, 0x80 and 0x81 all become an XBeeMessage).
 *
 * The from_packet helpers return std::nullopt for frame kinds that do not
 * carry that kind of message.
 */

#include "xbeelink/address.hpp"
#include "xbeelink/io_sample.hpp"
#include "xbeelink/packet.hpp"

#include <optional>
#include <string>

namespace xbeelink {

/// Sender or destination identity. Unknown parts hold the UNKNOWN sentinels.
struct RemoteAddress {
  Address64 addr64 = Address64::UNKNOWN;
  Address16 addr16 = Address16::UNKNOWN;

  /// 64-bit addresses are compared when both sides know theirs, else 16-bit.
  bool matches(const RemoteAddress& other) const;
  std::string to_string() const;   // "0013A20012345678 - FFFE"
};

struct XBeeMessage {
  RemoteAddress remote;
  ByteVector data;
  bool broadcast = false;

  std::string data_string() const { return std::string(data.begin(), data.end()); }
};

struct ExplicitXBeeMessage {
  RemoteAddress remote;
  uint8_t source_endpoint = 0;
  uint8_t dest_endpoint = 0;
  uint16_t cluster_id = 0;
  uint16_t profile_id = 0;
  ByteVector data;
  bool broadcast = false;
};

struct IOSampleMessage {
  RemoteAddress remote;
  IOSample sample;
};

struct IPMessage {
  IPv4Address address;
  uint16_t source_port = 0;
  uint16_t dest_port = 0;
  uint8_t protocol = 0;
  ByteVector data;

  std::string data_string() const { return std::string(data.begin(), data.end()); }
};

struct UserDataRelayMessage {
  uint8_t source_interface = 0;
  ByteVector data;
};

/// Source identity of a received frame, if the kind carries one.
std::optional<RemoteAddress> source_of(const Packet& p);

/// 0x90, 0x80, 0x81, and 0x91 frames on the Digi data endpoint/cluster/profile.
std::optional<XBeeMessage> data_message_from(const Packet& p);
/// 0x91 only.
std::optional<ExplicitXBeeMessage> explicit_message_from(const Packet& p);
/// 0x92, 0x82, 0x83 with a decodable sample.
std::optional<IOSampleMessage> io_sample_message_from(const Packet& p);
/// 0xB0
std::optional<IPMessage> ip_message_from(const Packet& p);
/// 0xAD
std::optional<UserDataRelayMessage> relay_message_from(const Packet& p);

/// True when an explicit frame targets the Digi data endpoint/cluster/profile.
bool is_digi_data_frame(const ExplicitRxIndicatorPacket& p);

} // namespace xbeelink
