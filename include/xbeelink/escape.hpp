#pragma once

/**
 * @file escape.hpp
 * @brief Escaped API (API2) byte codec.
 *
 * @details
 * In escaped mode four byte values may not appear raw on the line once a frame
 * has started:
 *   HEADER_BYTE (0x7E) frame delimiter
 *   ESCAPE_BYTE (0x7D) escape marker
 *   XON_BYTE    (0x11) software flow control
 *   XOFF_BYTE   (0x13) software flow control
 *
 * Each one is sent as ESCAPE_BYTE followed by `b ^ 0x20`. The delimiter that
 * opens a frame is never escaped, so escape_frame() copies it through and
 * escapes everything after it (length, payload and checksum).
 *
 * Decoding on the live stream is bytewise and lives in the parser
 * (see parser.cpp, read_logical_byte()). unescape() here is the buffer version
 * of the same rule for callers that already hold a whole escaped run.
 *
 * @code
 *   ByteVector raw = {0x7E, 0x00, 0x02, 0x23, 0x11, 0xCB};
 *   ByteVector wire = xbeelink::escape::escape_frame(raw);
 *   // wire: 7E 00 02 23 7D 31 CB
 * @endcode
 */

#include <cstdint>
#include <string>
#include <vector>

namespace xbeelink {
namespace escape {

constexpr uint8_t HEADER_BYTE = 0x7E;
constexpr uint8_t ESCAPE_BYTE = 0x7D;
constexpr uint8_t XON_BYTE    = 0x11;
constexpr uint8_t XOFF_BYTE   = 0x13;
constexpr uint8_t ESCAPE_XOR  = 0x20;

inline bool is_special_byte(uint8_t b) {
  return b == HEADER_BYTE || b == ESCAPE_BYTE || b == XON_BYTE || b == XOFF_BYTE;
}

/// Escape every reserved byte in `in`, appending to `out`.
inline void escape(const uint8_t* in, size_t len, std::vector<uint8_t>& out) {
  out.reserve(out.size() + len * 2);
  for (size_t i = 0; i < len; ++i) {
    const uint8_t b = in[i];
    if (is_special_byte(b)) {
      out.push_back(ESCAPE_BYTE);
      out.push_back(static_cast<uint8_t>(b ^ ESCAPE_XOR));
    } else {
      out.push_back(b);
    }
  }
}

inline std::vector<uint8_t> escape(const std::vector<uint8_t>& in) {
  std::vector<uint8_t> out;
  escape(in.data(), in.size(), out);
  return out;
}

/**
 * @brief Escape a complete frame, leaving a leading delimiter untouched.
 *
 * If the first byte is not HEADER_BYTE the whole buffer is escaped.
 */
inline std::vector<uint8_t> escape_frame(const std::vector<uint8_t>& frame) {
  std::vector<uint8_t> out;
  if (frame.empty()) return out;
  size_t start = 0;
  if (frame[0] == HEADER_BYTE) {
    out.push_back(HEADER_BYTE);
    start = 1;
  }
  escape(frame.data() + start, frame.size() - start, out);
  return out;
}

/**
 * @brief Undo escaping on a buffer.
 *
 * @param err set on failure: a reserved byte seen without its escape marker,
 *            or an escape marker as the final byte.
 * @return false on a framing fault.
 */
inline bool unescape(const std::vector<uint8_t>& in, std::vector<uint8_t>& out,
                     std::string& err) {
  out.clear();
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    uint8_t b = in[i];
    if (b == ESCAPE_BYTE) {
      if (i + 1 >= in.size()) {
        err = "Escape byte at end of data.";
        return false;
      }
      out.push_back(static_cast<uint8_t>(in[++i] ^ ESCAPE_XOR));
      continue;
    }
    if (is_special_byte(b)) {
      static const char* hex = "0123456789ABCDEF";
      err = "Special byte not escaped: 0x";
      err += hex[b >> 4];
      err += hex[b & 0x0F];
      err += ".";
      return false;
    }
    out.push_back(b);
  }
  return true;
}

} // namespace escape
} // namespace xbeelink
