// -----------------------------------------------------------------------------
// address.cpp: parsing and formatting for Address16 / Address64 / IPv4Address.
// -----------------------------------------------------------------------------
#include "xbeelink/address.hpp"

namespace xbeelink {

const Address16 Address16::COORDINATOR(0x0000);
const Address16 Address16::BROADCAST(0xFFFF);
const Address16 Address16::UNKNOWN(0xFFFE);

const Address64 Address64::COORDINATOR(0x0000000000000000ULL);
const Address64 Address64::BROADCAST(0x000000000000FFFFULL);
const Address64 Address64::UNKNOWN(0x000000000000FFFEULL);

namespace {

// Strip "0x", check the digit count, left-pad to `digits` and decode.
bool parse_padded_hex(const std::string& text, size_t digits, ByteVector& out) {
  std::string s = text;
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s.erase(0, 2);
  if (s.empty() || s.size() > digits) return false;
  s.insert(0, digits - s.size(), '0');
  return from_hex(s, out) && out.size() == digits / 2;
}

} // namespace

// ---------- Address16 ----------

bool Address16::from_string(const std::string& text, Address16& out) {
  ByteVector b;
  if (!parse_padded_hex(text, 4, b)) return false;
  out = Address16(b[0], b[1]);
  return true;
}

std::string Address16::to_string() const {
  return to_hex(bytes_.data(), bytes_.size());
}

// ---------- Address64 ----------

Address64::Address64(uint64_t value) {
  for (int i = 7; i >= 0; --i) {
    bytes_[static_cast<size_t>(i)] = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
}

Address64 Address64::from_bytes(const ByteVector& in, size_t at) {
  Address64 a;
  for (size_t i = 0; i < 8; ++i) a.bytes_[i] = in[at + i];
  return a;
}

bool Address64::from_string(const std::string& text, Address64& out) {
  ByteVector b;
  if (!parse_padded_hex(text, 16, b)) return false;
  out = from_bytes(b, 0);
  return true;
}

uint64_t Address64::value() const {
  uint64_t v = 0;
  for (uint8_t b : bytes_) v = (v << 8) | b;
  return v;
}

std::string Address64::to_string() const {
  return to_hex(bytes_.data(), bytes_.size());
}

// ---------- IPv4Address ----------

bool IPv4Address::from_string(const std::string& text, IPv4Address& out) {
  std::array<uint8_t, 4> parts{};
  size_t idx = 0;
  int acc = -1;                                  // -1 = no digit yet in this part
  for (size_t i = 0; i <= text.size(); ++i) {
    const char c = (i < text.size()) ? text[i] : '.';
    if (c >= '0' && c <= '9') {
      acc = (acc < 0 ? 0 : acc) * 10 + (c - '0');
      if (acc > 255) return false;
    } else if (c == '.') {
      if (acc < 0 || idx >= 4) return false;
      parts[idx++] = static_cast<uint8_t>(acc);
      acc = -1;
    } else {
      return false;
    }
  }
  if (idx != 4) return false;
  out = IPv4Address(parts[0], parts[1], parts[2], parts[3]);
  return true;
}

std::string IPv4Address::to_string() const {
  return std::to_string(bytes_[0]) + "." + std::to_string(bytes_[1]) + "." +
         std::to_string(bytes_[2]) + "." + std::to_string(bytes_[3]);
}

} // namespace xbeelink
