#pragma once
/**
 * @file bytes.hpp
 * @brief Byte buffer alias plus the hex and big-endian helpers every codec uses.
 *
 * Hex strings are upper-case without separators (`"7E00040801"`), or
 * space-separated for the pretty variant (`"7E 00 04 08 01"`). Parsing accepts
 * either case, an optional `0x` prefix and embedded spaces.
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace xbeelink {

using ByteVector = std::vector<uint8_t>;

/// "7E0004" style hex dump.
std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const ByteVector& data);

/// "7E 00 04" style hex dump, used by the diagnostic parameter tables.
std::string to_pretty_hex(const ByteVector& data);

/// Single byte as two upper-case hex digits.
std::string byte_to_hex(uint8_t b);

/// Integer as zero-padded hex with `min_digits` digits (no prefix).
std::string int_to_hex(uint32_t value, int min_digits);

/**
 * @brief Parse hex text into bytes.
 * @return false on an odd digit count or a non-hex character; `out` is then unspecified.
 */
bool from_hex(const std::string& text, ByteVector& out);

/// Append helpers (big-endian, as on the wire).
inline void append_u16(ByteVector& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void append(ByteVector& out, const ByteVector& in) {
  out.insert(out.end(), in.begin(), in.end());
}

inline uint16_t read_u16(const ByteVector& in, size_t at) {
  return static_cast<uint16_t>((in[at] << 8) | in[at + 1]);
}

/// Bytes [from, end) as a new vector (empty if from is past the end).
inline ByteVector tail(const ByteVector& in, size_t from) {
  if (from >= in.size()) return {};
  return ByteVector(in.begin() + static_cast<std::ptrdiff_t>(from), in.end());
}

/// Printable view of a payload; non-printable bytes become '.'.
std::string to_printable(const ByteVector& data);

} // namespace xbeelink
