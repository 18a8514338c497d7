#pragma once
/**
 * @file status.hpp
 * @brief Result codes for parsing and for the send paths.
 *
 * Functions return one of these and, where useful, a reason string through an
 * `std::string& err` out-parameter. Parse faults are per-frame; send faults are
 * surfaced to the caller. Timeout has its own code so "device silent" is never
 * confused with "link broken".
 */

#include <cstdint>
#include <string>

namespace xbeelink {

enum class ParseStatus : uint8_t {
  Ok = 0,
  IncompletePacket,       ///< per-byte timeout or end of input before the frame completed
  InvalidChecksum,
  SpecialByteNotEscaped,  ///< raw 0x7E/0x11/0x13 inside a frame in escaped mode
  InvalidOperatingMode,   ///< parser asked to run in a non-API mode
  InvalidStartDelimiter,  ///< buffer parse: first byte was not 0x7E
  PayloadTooShort,        ///< known frame type below its minimum length
  EmptyPayload,
  InvalidHex,
};

enum class SendStatus : uint8_t {
  Ok = 0,
  Timeout,                ///< no matching response within the deadline
  InterfaceNotOpen,
  InvalidOperatingMode,
  WriteFailed,
  Interrupted,            ///< session closed while waiting
  AtCommandError,         ///< response arrived but its AT status is not OK
  TransmitFailed,         ///< transmit status other than SUCCESS / SELF_ADDRESSED
  InvalidArgument,
};

const char* to_string(ParseStatus s);
const char* to_string(SendStatus s);

} // namespace xbeelink
