#pragma once
/**
 * @file status_codes.hpp
 * @brief Named byte values carried inside frames, with their descriptions.
 *
 * Packets keep these fields as raw bytes so that values a newer firmware
 * introduces survive a parse/serialize round trip. The constants below name
 * the values the engine itself branches on; the *_description() lookups cover
 * the full vendor tables for diagnostics.
 */

#include <cstdint>

namespace xbeelink {

/// AT command response status (0x88 / 0x97 frames).
namespace at_status {
constexpr uint8_t OK                = 0x00;
constexpr uint8_t ERROR             = 0x01;
constexpr uint8_t INVALID_COMMAND   = 0x02;
constexpr uint8_t INVALID_PARAMETER = 0x03;
constexpr uint8_t TX_FAILURE        = 0x04;
}
const char* at_status_description(uint8_t status);

/// Modem status events (0x8A frame).
namespace modem_status {
constexpr uint8_t HARDWARE_RESET        = 0x00;
constexpr uint8_t WATCHDOG_TIMER_RESET  = 0x01;
constexpr uint8_t JOINED_NETWORK        = 0x02;
constexpr uint8_t DISASSOCIATED         = 0x03;
constexpr uint8_t COORDINATOR_STARTED   = 0x06;
}
const char* modem_status_description(uint8_t status);

/// Delivery status (0x8B Transmit Status, 0x89 TX Status).
namespace transmit_status {
constexpr uint8_t SUCCESS             = 0x00;
constexpr uint8_t NO_ACK              = 0x01;
constexpr uint8_t CCA_FAILURE         = 0x02;
constexpr uint8_t PURGED              = 0x03;
constexpr uint8_t NETWORK_ACK_FAILURE = 0x21;
constexpr uint8_t SELF_ADDRESSED      = 0x23;
constexpr uint8_t ADDRESS_NOT_FOUND   = 0x24;
constexpr uint8_t ROUTE_NOT_FOUND     = 0x25;
}
const char* transmit_status_description(uint8_t status);

/// Discovery status (0x8B Transmit Status).
const char* discovery_status_description(uint8_t status);

/// Receive options bit field (0x90, 0x91, 0x92, 0x80..0x83).
namespace receive_options {
constexpr uint8_t PACKET_ACKNOWLEDGED = 0x01;
constexpr uint8_t BROADCAST_PACKET    = 0x02;
constexpr uint8_t PAN_BROADCAST       = 0x04;   // 802.15.4 RX frames
constexpr uint8_t APS_ENCRYPTED       = 0x20;
constexpr uint8_t FROM_END_DEVICE     = 0x40;
}

/// Transmit options bit field.
namespace transmit_options {
constexpr uint8_t NONE              = 0x00;
constexpr uint8_t DISABLE_ACK       = 0x01;
constexpr uint8_t ENABLE_APS        = 0x20;
constexpr uint8_t USE_EXTENDED_TIMEOUT = 0x40;
}

/// Remote AT command options.
namespace remote_at_options {
constexpr uint8_t NONE          = 0x00;
constexpr uint8_t DISABLE_ACK   = 0x01;
constexpr uint8_t APPLY_CHANGES = 0x02;
}

/// IP protocol byte (0x20 / 0xB0 frames).
namespace ip_protocol {
constexpr uint8_t UDP     = 0x00;
constexpr uint8_t TCP     = 0x01;
constexpr uint8_t TCP_SSL = 0x04;
}
const char* ip_protocol_description(uint8_t protocol);

/// Local interfaces addressed by User Data Relay frames.
namespace relay_interface {
constexpr uint8_t SERIAL      = 0x00;
constexpr uint8_t BLUETOOTH   = 0x01;
constexpr uint8_t MICROPYTHON = 0x02;
}
const char* relay_interface_description(uint8_t iface);

} // namespace xbeelink
