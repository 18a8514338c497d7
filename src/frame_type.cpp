// -----------------------------------------------------------------------------
// frame_type.cpp: frame type names.
// -----------------------------------------------------------------------------
#include "xbeelink/frame_type.hpp"

namespace xbeelink {

namespace {

struct FrameTypeEntry {
  FrameType type;
  const char* name;
};

const FrameTypeEntry FRAME_TYPES[] = {
  {FrameType::TX_64,                       "TX (Transmit) Request 64-bit address"},
  {FrameType::TX_16,                       "TX (Transmit) Request 16-bit address"},
  {FrameType::AT_COMMAND,                  "AT Command"},
  {FrameType::AT_COMMAND_QUEUE,            "AT Command Queue"},
  {FrameType::TRANSMIT_REQUEST,            "Transmit Request"},
  {FrameType::EXPLICIT_ADDRESSING,         "Explicit Addressing Command Frame"},
  {FrameType::REMOTE_AT_COMMAND_REQUEST,   "Remote AT Command Request"},
  {FrameType::TX_IPV4,                     "TX IPv4"},
  {FrameType::USER_DATA_RELAY,             "User Data Relay"},
  {FrameType::RX_64,                       "RX (Receive) Packet 64-bit Address"},
  {FrameType::RX_16,                       "RX (Receive) Packet 16-bit Address"},
  {FrameType::RX_IO_64,                    "IO Data Sample RX 64-bit Address Indicator"},
  {FrameType::RX_IO_16,                    "IO Data Sample RX 16-bit Address Indicator"},
  {FrameType::AT_COMMAND_RESPONSE,         "AT Command Response"},
  {FrameType::TX_STATUS,                   "TX (Transmit) Status"},
  {FrameType::MODEM_STATUS,                "Modem Status"},
  {FrameType::TRANSMIT_STATUS,             "Transmit Status"},
  {FrameType::RECEIVE_PACKET,              "Receive Packet"},
  {FrameType::EXPLICIT_RX_INDICATOR,       "Explicit RX Indicator"},
  {FrameType::IO_DATA_SAMPLE_RX_INDICATOR, "IO Data Sample RX Indicator"},
  {FrameType::REMOTE_AT_COMMAND_RESPONSE,  "Remote Command Response"},
  {FrameType::USER_DATA_RELAY_OUTPUT,      "User Data Relay Output"},
  {FrameType::RX_IPV4,                     "RX IPv4"},
};

} // namespace

FrameType frame_type_from_byte(uint8_t value) {
  for (const auto& e : FRAME_TYPES)
    if (static_cast<uint8_t>(e.type) == value) return e.type;
  return FrameType::UNKNOWN;
}

const char* frame_type_name(FrameType type) {
  for (const auto& e : FRAME_TYPES)
    if (e.type == type) return e.name;
  return "Unknown";
}

} // namespace xbeelink
