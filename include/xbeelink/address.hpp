#pragma once
/**
 * @file address.hpp
 * @brief Fixed-size node addresses: 16-bit network, 64-bit extended, IPv4.
 *
 * All three are plain value types compared byte-wise. Sentinels:
 *
 * | Type      | COORDINATOR        | BROADCAST          | UNKNOWN            |
 * |-----------|--------------------|--------------------|--------------------|
 * | Address16 | 0000               | FFFF               | FFFE               |
 * | Address64 | 0000000000000000   | 000000000000FFFF   | 000000000000FFFE   |
 *
 * Text form is upper-case hex without separators. from_string() accepts an
 * optional `0x` prefix and short forms, which are left-padded with zeros
 * ("FFFF" as a 64-bit address is the broadcast address).
 */

#include "xbeelink/bytes.hpp"
#include <array>

namespace xbeelink {

class Address16 {
public:
  static const Address16 COORDINATOR;
  static const Address16 BROADCAST;
  static const Address16 UNKNOWN;

  Address16() = default;
  explicit Address16(uint16_t value)
  : bytes_{{static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)}} {}
  Address16(uint8_t hsb, uint8_t lsb) : bytes_{{hsb, lsb}} {}

  /// Reads two bytes at `at`; caller guarantees the range.
  static Address16 from_bytes(const ByteVector& in, size_t at) {
    return Address16(in[at], in[at + 1]);
  }

  static bool from_string(const std::string& text, Address16& out);

  uint16_t value() const { return static_cast<uint16_t>((bytes_[0] << 8) | bytes_[1]); }
  const std::array<uint8_t, 2>& bytes() const { return bytes_; }
  void append_to(ByteVector& out) const { out.insert(out.end(), bytes_.begin(), bytes_.end()); }

  std::string to_string() const;

  bool operator==(const Address16& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const Address16& o) const { return !(*this == o); }

private:
  std::array<uint8_t, 2> bytes_{{0xFF, 0xFE}};   // unknown until told otherwise
};

class Address64 {
public:
  static const Address64 COORDINATOR;
  static const Address64 BROADCAST;
  static const Address64 UNKNOWN;

  Address64() = default;
  explicit Address64(uint64_t value);

  static Address64 from_bytes(const ByteVector& in, size_t at);
  static bool from_string(const std::string& text, Address64& out);

  uint64_t value() const;
  const std::array<uint8_t, 8>& bytes() const { return bytes_; }
  void append_to(ByteVector& out) const { out.insert(out.end(), bytes_.begin(), bytes_.end()); }

  std::string to_string() const;

  bool operator==(const Address64& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const Address64& o) const { return !(*this == o); }

private:
  std::array<uint8_t, 8> bytes_{{0, 0, 0, 0, 0, 0, 0xFF, 0xFE}};
};

/// IPv4 address as carried by the IP frame types (network byte order).
class IPv4Address {
public:
  IPv4Address() = default;
  IPv4Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d) : bytes_{{a, b, c, d}} {}

  static IPv4Address from_bytes(const ByteVector& in, size_t at) {
    return IPv4Address(in[at], in[at + 1], in[at + 2], in[at + 3]);
  }
  /// Dotted quad, e.g. "192.168.1.10".
  static bool from_string(const std::string& text, IPv4Address& out);

  const std::array<uint8_t, 4>& bytes() const { return bytes_; }
  void append_to(ByteVector& out) const { out.insert(out.end(), bytes_.begin(), bytes_.end()); }
  std::string to_string() const;

  bool operator==(const IPv4Address& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const IPv4Address& o) const { return !(*this == o); }

private:
  std::array<uint8_t, 4> bytes_{{0, 0, 0, 0}};
};

} // namespace xbeelink
