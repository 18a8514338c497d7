// -----------------------------------------------------------------------------
// bytes.cpp: hex helpers shared by the codecs, the CLI and the tests.
// -----------------------------------------------------------------------------
#include "xbeelink/bytes.hpp"

namespace xbeelink {

namespace {
const char HEX_DIGITS[] = "0123456789ABCDEF";

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
} // namespace

std::string byte_to_hex(uint8_t b) {
  std::string s(2, '0');
  s[0] = HEX_DIGITS[b >> 4];
  s[1] = HEX_DIGITS[b & 0x0F];
  return s;
}

std::string to_hex(const uint8_t* data, size_t len) {
  std::string s;
  s.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    s += HEX_DIGITS[data[i] >> 4];
    s += HEX_DIGITS[data[i] & 0x0F];
  }
  return s;
}

std::string to_hex(const ByteVector& data) {
  return to_hex(data.data(), data.size());
}

std::string to_pretty_hex(const ByteVector& data) {
  std::string s;
  s.reserve(data.size() * 3);
  for (size_t i = 0; i < data.size(); ++i) {
    if (i) s += ' ';
    s += byte_to_hex(data[i]);
  }
  return s;
}

std::string int_to_hex(uint32_t value, int min_digits) {
  std::string s;
  while (value) {
    s.insert(s.begin(), HEX_DIGITS[value & 0x0F]);
    value >>= 4;
  }
  while (static_cast<int>(s.size()) < min_digits) s.insert(s.begin(), '0');
  return s;
}

// from_hex(): tolerant of "0x" prefix and spaces so CLI input can be pasted
// straight from a pretty dump.
bool from_hex(const std::string& text, ByteVector& out) {
  out.clear();
  size_t i = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) i = 2;

  int hi = -1;                                  // pending high nibble
  for (; i < text.size(); ++i) {
    const char c = text[i];
    if (c == ' ' || c == ':') continue;
    const int v = hex_value(c);
    if (v < 0) return false;
    if (hi < 0) {
      hi = v;
    } else {
      out.push_back(static_cast<uint8_t>((hi << 4) | v));
      hi = -1;
    }
  }
  return hi < 0;                                // odd digit count is an error
}

std::string to_printable(const ByteVector& data) {
  std::string s;
  s.reserve(data.size());
  for (uint8_t b : data) s += (b >= 0x20 && b < 0x7F) ? static_cast<char>(b) : '.';
  return s;
}

} // namespace xbeelink
