#pragma once
/**
 * @file parser.hpp
 * @brief Streaming API frame parser.
 *
 * @details
 * The live path (reader loop) consumes the 0x7E delimiter itself and then calls
 * parse_packet(source, ...), which:
 *   1. reads the 2-byte length,
 *   2. reads exactly LEN payload bytes,
 *   3. reads the checksum byte and verifies it against the payload,
 *   4. hands the payload to the frame type registry (Packet::parse_payload).
 *
 * In API_ESCAPED mode every logical byte goes through escape decoding: an
 * ESCAPE_BYTE is dropped and the next byte XOR 0x20 is taken; a raw 0x7E,
 * 0x11 or 0x13 is a framing fault.
 *
 * Each raw byte read waits at most byte_timeout (300 ms by default). Running
 * out of time or input is IncompletePacket, separate from every other fault.
 *
 * Fault messages (returned through `err`):
 *   "Error parsing packet: Incomplete packet."
 *   "Invalid checksum (expected 0x5F)."
 *   "Special byte not escaped: 0x11."
 *   "Operating mode must be API or API Escaped."
 *   "Invalid start delimiter."
 *   "Incomplete AT Command packet (minimum 4 bytes, got 3)."
 */

#include "xbeelink/operating_mode.hpp"
#include "xbeelink/packet.hpp"
#include "xbeelink/transport/connection.hpp"

#include <chrono>

namespace xbeelink {

class PacketParser {
public:
  static constexpr std::chrono::milliseconds DEFAULT_BYTE_TIMEOUT{300};

  explicit PacketParser(std::chrono::milliseconds byte_timeout = DEFAULT_BYTE_TIMEOUT)
  : byte_timeout_(byte_timeout) {}

  /// Frame body from a live source; the start delimiter was already consumed.
  ParseStatus parse_packet(transport::ByteSource& source, OperatingMode mode,
                           Packet& out, std::string& err) const;

  /// A whole frame held in memory, starting with 0x7E. Trailing bytes are ignored.
  ParseStatus parse_packet(const ByteVector& frame, OperatingMode mode,
                           Packet& out, std::string& err) const;

  /// Same as above from hex text ("7E 00 04 08 01 4E 49 5F").
  ParseStatus parse_packet(const std::string& hex, OperatingMode mode,
                           Packet& out, std::string& err) const;

  std::chrono::milliseconds byte_timeout() const { return byte_timeout_; }

private:
  ParseStatus read_logical_byte(transport::ByteSource& source, OperatingMode mode,
                                uint8_t& out, std::string& err) const;

  std::chrono::milliseconds byte_timeout_;
};

} // namespace xbeelink
