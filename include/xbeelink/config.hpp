#pragma once
/**
 * @file config.hpp
 * @brief Session and serial settings, optionally loaded from a JSON file.
 *
 * File format (every key optional, unknown keys ignored):
 * @code{.json}
 *   {
 *     "mode": "api2",
 *     "receive_timeout_ms": 2000,
 *     "byte_timeout_ms": 300,
 *     "queue_capacity": 50,
 *     "serial": { "path": "/dev/ttyUSB0", "baud": 9600 }
 *   }
 * @endcode
 *
 * Values already present in the structs act as defaults; keys in the file
 * override them, and CLI flags override the file.
 */

#include "xbeelink/operating_mode.hpp"
#include "xbeelink/packet_queue.hpp"

#include <string>

namespace xbeelink {

struct SessionConfig {
  OperatingMode mode = OperatingMode::API;
  int receive_timeout_ms = 2000;   ///< synchronous send wait
  int byte_timeout_ms = 300;       ///< per-byte wait inside a frame
  size_t queue_capacity = PacketQueue::MAX_CAPACITY;
};

struct SerialConfig {
  std::string path = "/dev/ttyUSB0";
  int baud = 9600;
};

/// Check ranges after loading or flag overrides. false with a reason on the first bad value.
bool validate_config(const SessionConfig& session, const SerialConfig& serial, std::string& err);

/// Parse JSON text into the structs. Bad JSON or wrong value types fail with a reason.
bool parse_config(const std::string& json_text, SessionConfig& session, SerialConfig& serial,
                  std::string& err);

/// Read `path` and parse_config() it.
bool load_config(const std::string& path, SessionConfig& session, SerialConfig& serial,
                 std::string& err);

} // namespace xbeelink
