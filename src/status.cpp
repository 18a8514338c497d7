// -----------------------------------------------------------------------------
// status.cpp: snake_case names for ParseStatus / SendStatus.
// -----------------------------------------------------------------------------
#include "xbeelink/status.hpp"

namespace xbeelink {

const char* to_string(ParseStatus s) {
  switch (s) {
    case ParseStatus::Ok:                    return "ok";
    case ParseStatus::IncompletePacket:      return "incomplete_packet";
    case ParseStatus::InvalidChecksum:       return "invalid_checksum";
    case ParseStatus::SpecialByteNotEscaped: return "special_byte_not_escaped";
    case ParseStatus::InvalidOperatingMode:  return "invalid_operating_mode";
    case ParseStatus::InvalidStartDelimiter: return "invalid_start_delimiter";
    case ParseStatus::PayloadTooShort:       return "payload_too_short";
    case ParseStatus::EmptyPayload:          return "empty_payload";
    case ParseStatus::InvalidHex:            return "invalid_hex";
  }
  return "unknown";
}

const char* to_string(SendStatus s) {
  switch (s) {
    case SendStatus::Ok:                   return "ok";
    case SendStatus::Timeout:              return "timeout";
    case SendStatus::InterfaceNotOpen:     return "interface_not_open";
    case SendStatus::InvalidOperatingMode: return "invalid_operating_mode";
    case SendStatus::WriteFailed:          return "write_failed";
    case SendStatus::Interrupted:          return "interrupted";
    case SendStatus::AtCommandError:       return "at_command_error";
    case SendStatus::TransmitFailed:       return "transmit_failed";
    case SendStatus::InvalidArgument:      return "invalid_argument";
  }
  return "unknown";
}

} // namespace xbeelink
