#pragma once
/**
 * @file packet.hpp
 * @brief Typed API frames: one plain struct per frame kind, wrapped in Packet.
 *
 * @details
 * The set of frame kinds is closed. Each kind is a small aggregate carrying its
 * decoded fields plus two compile-time traits:
 *   - `TYPE`            frame type code written as payload byte 0
 *   - `NEEDS_FRAME_ID`  whether byte 1 is a frame ID
 *
 * `Packet` holds exactly one of them in a std::variant and provides everything
 * generic: serialization (`api_data()`, `generate_bytes()`), the derived length
 * and checksum, frame ID access, broadcast detection, diagnostic formatting and
 * parsing from a raw payload (`Packet::parse_payload()`, the frame type
 * registry in packet_codec.cpp).
 *
 * Frame IDs are `std::optional<uint8_t>`. An unset ID serializes as 0x00 and is
 * filled in by Session before a synchronous send.
 *
 * Wire envelope produced by generate_bytes():
 * @code
 *   [0x7E][LEN_MSB][LEN_LSB][payload: LEN bytes][checksum]
 * @endcode
 * LEN and the checksum are derived from the unescaped payload on every call.
 *
 * Two packets compare equal when their unescaped frames are byte-identical.
 *
 * @code
 *   xbeelink::Packet p = xbeelink::AtCommandPacket{0x01, "NI", {}};
 *   auto wire = p.generate_bytes(false);   // 7E 00 04 08 01 4E 49 5F
 * @endcode
 */

#include "xbeelink/address.hpp"
#include "xbeelink/bytes.hpp"
#include "xbeelink/frame_type.hpp"
#include "xbeelink/io_sample.hpp"
#include "xbeelink/status.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace xbeelink {

using FrameId = std::optional<uint8_t>;

// ---------------------------------------------------------------------------
// Frame kinds carrying a frame ID (requests and their responses)
// ---------------------------------------------------------------------------

/// 0x08: local AT command, applied immediately.
struct AtCommandPacket {
  static constexpr FrameType TYPE = FrameType::AT_COMMAND;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 4;

  FrameId frame_id;
  std::string command;          ///< two ASCII characters, e.g. "NI"
  ByteVector parameter;
};

/// 0x09: local AT command, queued until AC/WR.
struct AtCommandQueuePacket {
  static constexpr FrameType TYPE = FrameType::AT_COMMAND_QUEUE;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 4;

  FrameId frame_id;
  std::string command;
  ByteVector parameter;
};

/// 0x88
struct AtCommandResponsePacket {
  static constexpr FrameType TYPE = FrameType::AT_COMMAND_RESPONSE;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 5;

  FrameId frame_id;
  std::string command;
  uint8_t status = 0;           ///< see at_status
  ByteVector value;
};

/// 0x17
struct RemoteAtCommandRequestPacket {
  static constexpr FrameType TYPE = FrameType::REMOTE_AT_COMMAND_REQUEST;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 15;

  FrameId frame_id;
  Address64 dest64;
  Address16 dest16;
  uint8_t options = 0;          ///< see remote_at_options
  std::string command;
  ByteVector parameter;
};

/// 0x97
struct RemoteAtCommandResponsePacket {
  static constexpr FrameType TYPE = FrameType::REMOTE_AT_COMMAND_RESPONSE;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 15;

  FrameId frame_id;
  Address64 source64;
  Address16 source16;
  std::string command;
  uint8_t status = 0;
  ByteVector value;
};

/// 0x10
struct TransmitRequestPacket {
  static constexpr FrameType TYPE = FrameType::TRANSMIT_REQUEST;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 14;

  FrameId frame_id;
  Address64 dest64;
  Address16 dest16;
  uint8_t radius = 0;
  uint8_t options = 0;          ///< see transmit_options
  ByteVector rf_data;
};

/// 0x8B
struct TransmitStatusPacket {
  static constexpr FrameType TYPE = FrameType::TRANSMIT_STATUS;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 7;

  FrameId frame_id;
  Address16 dest16;
  uint8_t retry_count = 0;
  uint8_t delivery_status = 0;  ///< see transmit_status
  uint8_t discovery_status = 0;
};

/// 0x00: 802.15.4 transmit to a 64-bit address.
struct Tx64Packet {
  static constexpr FrameType TYPE = FrameType::TX_64;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 11;

  FrameId frame_id;
  Address64 dest64;
  uint8_t options = 0;
  ByteVector rf_data;
};

/// 0x01: 802.15.4 transmit to a 16-bit address.
struct Tx16Packet {
  static constexpr FrameType TYPE = FrameType::TX_16;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 5;

  FrameId frame_id;
  Address16 dest16;
  uint8_t options = 0;
  ByteVector rf_data;
};

/// 0x89: 802.15.4 transmit status.
struct TxStatusPacket {
  static constexpr FrameType TYPE = FrameType::TX_STATUS;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 3;

  FrameId frame_id;
  uint8_t status = 0;
};

/// 0x11
struct ExplicitAddressingPacket {
  static constexpr FrameType TYPE = FrameType::EXPLICIT_ADDRESSING;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 20;

  FrameId frame_id;
  Address64 dest64;
  Address16 dest16;
  uint8_t source_endpoint = 0;
  uint8_t dest_endpoint = 0;
  uint16_t cluster_id = 0;
  uint16_t profile_id = 0;
  uint8_t radius = 0;
  uint8_t options = 0;
  ByteVector rf_data;
};

/// 0x20
struct TxIPv4Packet {
  static constexpr FrameType TYPE = FrameType::TX_IPV4;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 12;

  FrameId frame_id;
  IPv4Address dest_address;
  uint16_t dest_port = 0;
  uint16_t source_port = 0;
  uint8_t protocol = 0;         ///< see ip_protocol
  uint8_t options = 0;
  ByteVector data;
};

/// 0x2D
struct UserDataRelayPacket {
  static constexpr FrameType TYPE = FrameType::USER_DATA_RELAY;
  static constexpr bool NEEDS_FRAME_ID = true;
  static constexpr size_t MIN_LENGTH = 3;

  FrameId frame_id;
  uint8_t dest_interface = 0;   ///< see relay_interface
  ByteVector data;
};

// ---------------------------------------------------------------------------
// Unsolicited frame kinds (no frame ID)
// ---------------------------------------------------------------------------

/// 0x90
struct ReceivePacket {
  static constexpr FrameType TYPE = FrameType::RECEIVE_PACKET;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 12;

  Address64 source64;
  Address16 source16;
  uint8_t options = 0;          ///< see receive_options
  ByteVector rf_data;
};

/// 0x92: `sample` is set when the sample block decodes.
struct IoDataSampleRxIndicatorPacket {
  static constexpr FrameType TYPE = FrameType::IO_DATA_SAMPLE_RX_INDICATOR;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 12;

  Address64 source64;
  Address16 source16;
  uint8_t options = 0;
  ByteVector sample_data;
  std::optional<IOSample> sample;
};

/// 0x8A
struct ModemStatusPacket {
  static constexpr FrameType TYPE = FrameType::MODEM_STATUS;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 2;

  uint8_t status = 0;           ///< see modem_status
};

/// 0xB0
struct RxIPv4Packet {
  static constexpr FrameType TYPE = FrameType::RX_IPV4;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 11;

  IPv4Address source_address;
  uint16_t dest_port = 0;
  uint16_t source_port = 0;
  uint8_t protocol = 0;
  uint8_t status = 0;           ///< reserved, carried through
  ByteVector data;
};

/// 0x80
struct Rx64Packet {
  static constexpr FrameType TYPE = FrameType::RX_64;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 11;

  Address64 source64;
  uint8_t rssi = 0;
  uint8_t options = 0;
  ByteVector rf_data;
};

/// 0x81
struct Rx16Packet {
  static constexpr FrameType TYPE = FrameType::RX_16;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 5;

  Address16 source16;
  uint8_t rssi = 0;
  uint8_t options = 0;
  ByteVector rf_data;
};

/// 0x82
struct Rx64IoPacket {
  static constexpr FrameType TYPE = FrameType::RX_IO_64;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 11;

  Address64 source64;
  uint8_t rssi = 0;
  uint8_t options = 0;
  ByteVector sample_data;
  std::optional<IOSample> sample;
};

/// 0x83
struct Rx16IoPacket {
  static constexpr FrameType TYPE = FrameType::RX_IO_16;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 5;

  Address16 source16;
  uint8_t rssi = 0;
  uint8_t options = 0;
  ByteVector sample_data;
  std::optional<IOSample> sample;
};

/// 0x91
struct ExplicitRxIndicatorPacket {
  static constexpr FrameType TYPE = FrameType::EXPLICIT_RX_INDICATOR;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 18;

  /// Digi data endpoint/cluster/profile: such frames also count as plain data.
  static constexpr uint8_t DATA_ENDPOINT = 0xE8;
  static constexpr uint16_t DATA_CLUSTER = 0x0011;
  static constexpr uint16_t DIGI_PROFILE = 0xC105;

  Address64 source64;
  Address16 source16;
  uint8_t source_endpoint = 0;
  uint8_t dest_endpoint = 0;
  uint16_t cluster_id = 0;
  uint16_t profile_id = 0;
  uint8_t options = 0;
  ByteVector rf_data;
};

/// 0xAD
struct UserDataRelayOutputPacket {
  static constexpr FrameType TYPE = FrameType::USER_DATA_RELAY_OUTPUT;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 2;

  uint8_t source_interface = 0;
  ByteVector data;
};

/// Any type code without a codec. Keeps the raw type byte and the rest verbatim.
struct UnknownPacket {
  static constexpr FrameType TYPE = FrameType::UNKNOWN;
  static constexpr bool NEEDS_FRAME_ID = false;
  static constexpr size_t MIN_LENGTH = 1;

  uint8_t frame_type = 0xFF;
  ByteVector data;
};

using PacketVariant = std::variant<
    AtCommandPacket, AtCommandQueuePacket, AtCommandResponsePacket,
    RemoteAtCommandRequestPacket, RemoteAtCommandResponsePacket,
    TransmitRequestPacket, TransmitStatusPacket,
    Tx64Packet, Tx16Packet, TxStatusPacket,
    ExplicitAddressingPacket, TxIPv4Packet, UserDataRelayPacket,
    ReceivePacket, IoDataSampleRxIndicatorPacket, ModemStatusPacket, RxIPv4Packet,
    Rx64Packet, Rx16Packet, Rx64IoPacket, Rx16IoPacket,
    ExplicitRxIndicatorPacket, UserDataRelayOutputPacket, UnknownPacket>;

/// One row of the diagnostic breakdown, e.g. {"Frame type", "08 (AT Command)"}.
using PacketParameter = std::pair<std::string, std::string>;

class Packet {
public:
  Packet() : v_(UnknownPacket{}) {}

  /// Implicit from any frame kind: `Packet p = ModemStatusPacket{0x00};`
  template <typename T,
            typename = std::enable_if_t<!std::is_same<std::decay_t<T>, Packet>::value>>
  Packet(T&& kind) : v_(std::forward<T>(kind)) {}

  // -------- Identity --------
  FrameType frame_type() const;
  uint8_t frame_type_value() const;             ///< raw byte, also for UnknownPacket
  const char* frame_type_name() const { return xbeelink::frame_type_name(frame_type()); }

  bool needs_frame_id() const;
  /// Empty for kinds without a frame ID, or when not yet assigned.
  FrameId frame_id() const;
  /// No effect on kinds without a frame ID.
  void set_frame_id(uint8_t id);
  /// True only for kinds with a frame ID whose ID equals `id`.
  bool check_frame_id(uint8_t id) const;

  bool is_broadcast() const;

  // -------- Serialization --------
  /// Payload: type byte, frame ID byte (if any), kind-specific fields.
  ByteVector api_data() const;
  ByteVector generate_bytes(bool escaped = false) const;
  size_t length() const { return api_data().size(); }
  uint8_t checksum() const;

  // -------- Diagnostics --------
  std::vector<PacketParameter> parameters() const;
  std::string to_pretty_string() const;
  std::string to_hex_string() const { return to_hex(generate_bytes(false)); }

  // -------- Kind access --------
  template <typename T> bool is() const { return std::holds_alternative<T>(v_); }
  template <typename T> const T* as() const { return std::get_if<T>(&v_); }
  template <typename T> T* as() { return std::get_if<T>(&v_); }
  const PacketVariant& variant() const { return v_; }

  bool operator==(const Packet& o) const { return generate_bytes(false) == o.generate_bytes(false); }
  bool operator!=(const Packet& o) const { return !(*this == o); }

  // -------- Parsing (frame type registry, packet_codec.cpp) --------

  /**
   * @brief Decode one payload (type byte onward, no envelope).
   *
   * Known types shorter than their minimum fail with PayloadTooShort and a
   * message naming the frame type, the minimum and the actual length. Unknown
   * type codes always succeed as UnknownPacket.
   */
  static ParseStatus parse_payload(const ByteVector& payload, Packet& out, std::string& err);

  /// Minimum payload length for a type code; 0 when the code has no codec.
  static size_t min_length(uint8_t frame_type);

private:
  PacketVariant v_;
};

} // namespace xbeelink
