#pragma once
/**
 * @file operating_mode.hpp
 * @brief Module operating modes. Only API and API_ESCAPED carry frames.
 */

#include <cstdint>
#include <string>

namespace xbeelink {

enum class OperatingMode : uint8_t {
  AT = 0,          ///< transparent mode; bytes are not framed
  API = 1,         ///< API frames, no escaping (AP=1)
  API_ESCAPED = 2, ///< API frames with escaping (AP=2, "API2")
  UNKNOWN = 99,
};

inline bool is_api_mode(OperatingMode m) {
  return m == OperatingMode::API || m == OperatingMode::API_ESCAPED;
}

inline const char* to_string(OperatingMode m) {
  switch (m) {
    case OperatingMode::AT:          return "AT mode";
    case OperatingMode::API:         return "API mode";
    case OperatingMode::API_ESCAPED: return "API mode with escaped characters";
    default:                         return "Unknown";
  }
}

/// Accepts "at", "api", "api1", "api2", "escaped" (case-insensitive).
inline OperatingMode operating_mode_from_string(const std::string& s) {
  std::string v;
  for (char c : s) v += static_cast<char>((c >= 'A' && c <= 'Z') ? c + 32 : c);
  if (v == "at")                                   return OperatingMode::AT;
  if (v == "api" || v == "api1")                   return OperatingMode::API;
  if (v == "api2" || v == "escaped" || v == "api_escaped") return OperatingMode::API_ESCAPED;
  return OperatingMode::UNKNOWN;
}

} // namespace xbeelink
