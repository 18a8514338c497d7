#pragma once
/**
 * @file frame_type.hpp
 * @brief API frame type codes (payload byte 0) and their display names.
 */

#include <cstdint>

namespace xbeelink {

enum class FrameType : uint8_t {
  TX_64                        = 0x00,
  TX_16                        = 0x01,
  AT_COMMAND                   = 0x08,
  AT_COMMAND_QUEUE             = 0x09,
  TRANSMIT_REQUEST             = 0x10,
  EXPLICIT_ADDRESSING          = 0x11,
  REMOTE_AT_COMMAND_REQUEST    = 0x17,
  TX_IPV4                      = 0x20,
  USER_DATA_RELAY              = 0x2D,
  RX_64                        = 0x80,
  RX_16                        = 0x81,
  RX_IO_64                     = 0x82,
  RX_IO_16                     = 0x83,
  AT_COMMAND_RESPONSE          = 0x88,
  TX_STATUS                    = 0x89,
  MODEM_STATUS                 = 0x8A,
  TRANSMIT_STATUS              = 0x8B,
  RECEIVE_PACKET               = 0x90,
  EXPLICIT_RX_INDICATOR        = 0x91,
  IO_DATA_SAMPLE_RX_INDICATOR  = 0x92,
  REMOTE_AT_COMMAND_RESPONSE   = 0x97,
  USER_DATA_RELAY_OUTPUT       = 0xAD,
  RX_IPV4                      = 0xB0,
  UNKNOWN                      = 0xFF,
};

/// Maps a type byte to its enum; codes this library has no codec for map to UNKNOWN.
FrameType frame_type_from_byte(uint8_t value);

/// Human-readable name, e.g. "AT Command", "Remote Command Response".
const char* frame_type_name(FrameType type);

inline uint8_t frame_type_value(FrameType type) { return static_cast<uint8_t>(type); }

} // namespace xbeelink
