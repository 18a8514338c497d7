// -----------------------------------------------------------------------------
// status_codes.cpp: description tables for the status bytes in status_codes.hpp.
// Unlisted values fall through to "Unknown" rather than failing.
// -----------------------------------------------------------------------------
#include "xbeelink/status_codes.hpp"

#include <cstddef>

namespace xbeelink {

namespace {

struct CodeEntry {
  uint8_t value;
  const char* text;
};

template <std::size_t N>
const char* lookup(const CodeEntry (&table)[N], uint8_t value, const char* fallback) {
  for (const auto& e : table)
    if (e.value == value) return e.text;
  return fallback;
}

const CodeEntry AT_STATUS[] = {
  {0x00, "Status OK"},
  {0x01, "Status Error"},
  {0x02, "Invalid command"},
  {0x03, "Invalid parameter"},
  {0x04, "TX failure"},
};

const CodeEntry MODEM_STATUS[] = {
  {0x00, "Device was reset"},
  {0x01, "Watchdog timer was reset"},
  {0x02, "Device joined to network"},
  {0x03, "Device disassociated"},
  {0x04, "Configuration error/synchronization lost"},
  {0x05, "Coordinator realignment"},
  {0x06, "The coordinator started"},
  {0x07, "Network security key was updated"},
  {0x0B, "Network Woke Up"},
  {0x0C, "Network Went To Sleep"},
  {0x0D, "Voltage supply limit exceeded"},
  {0x11, "Modem configuration changed while joining"},
  {0x80, "Stack error"},
  {0x82, "Send/join command issued without connecting from AP"},
  {0x83, "Access point not found"},
  {0x84, "PSK not configured"},
  {0x87, "SSID not found"},
  {0x88, "Failed to join with security enabled"},
  {0x8A, "Invalid channel"},
  {0x8E, "Failed to join access point"},
};

const CodeEntry TRANSMIT_STATUS[] = {
  {0x00, "Success"},
  {0x01, "No acknowledgement received"},
  {0x02, "CCA failure"},
  {0x03, "Transmission purged, it was attempted before stack was up"},
  {0x04, "Physical error occurred on the interface with the WiFi transceiver"},
  {0x15, "Invalid destination endpoint"},
  {0x18, "No buffers"},
  {0x21, "Network ACK Failure"},
  {0x22, "Not joined to network"},
  {0x23, "Self-addressed"},
  {0x24, "Address not found"},
  {0x25, "Route not found"},
  {0x26, "Broadcast source failed to hear a neighbor relay the message"},
  {0x2B, "Invalid binding table index"},
  {0x2C, "Invalid endpoint"},
  {0x2D, "Attempted broadcast with APS transmission"},
  {0x2E, "Attempted broadcast with APS transmission, but EE=0"},
  {0x31, "A software error occurred"},
  {0x32, "Resource error lack of free buffers, timers, etc."},
  {0x74, "Data payload too large"},
  {0x75, "Indirect message unrequested"},
  {0x76, "Attempt to create a client socket failed"},
  {0x77, "TCP connection to given IP address and port doesn't exist"},
  {0x78, "Invalid UDP port"},
  {0x79, "Invalid TCP port"},
  {0x7A, "Invalid host"},
  {0x7B, "Invalid data mode"},
  {0x7C, "Invalid interface"},
  {0x7D, "Interface not accepting frames"},
  {0x80, "Connection refused"},
  {0x81, "Connection lost"},
  {0x82, "No server"},
  {0x83, "Socket closed"},
  {0x84, "Unknown server"},
  {0x85, "Unknown error"},
  {0xBB, "Key not authorized"},
};

const CodeEntry DISCOVERY_STATUS[] = {
  {0x00, "No discovery overhead"},
  {0x01, "Address discovery"},
  {0x02, "Route discovery"},
  {0x03, "Address and route"},
  {0x40, "Extended timeout discovery"},
};

const CodeEntry IP_PROTOCOL[] = {
  {0x00, "UDP"},
  {0x01, "TCP"},
  {0x04, "TCP SSL"},
};

const CodeEntry RELAY_INTERFACE[] = {
  {0x00, "Serial port"},
  {0x01, "Bluetooth Low Energy"},
  {0x02, "MicroPython"},
};

} // namespace

const char* at_status_description(uint8_t s)        { return lookup(AT_STATUS, s, "Unknown status"); }
const char* modem_status_description(uint8_t s)     { return lookup(MODEM_STATUS, s, "Unknown"); }
const char* transmit_status_description(uint8_t s)  { return lookup(TRANSMIT_STATUS, s, "Unknown"); }
const char* discovery_status_description(uint8_t s) { return lookup(DISCOVERY_STATUS, s, "Unknown"); }
const char* ip_protocol_description(uint8_t p)      { return lookup(IP_PROTOCOL, p, "Unknown"); }
const char* relay_interface_description(uint8_t i)  { return lookup(RELAY_INTERFACE, i, "Unknown"); }

} // namespace xbeelink
