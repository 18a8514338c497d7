// -----------------------------------------------------------------------------
// parser.cpp: streaming frame parser (see parser.hpp for the contract).
// -----------------------------------------------------------------------------
#include "xbeelink/parser.hpp"
#include "xbeelink/checksum.hpp"
#include "xbeelink/escape.hpp"

namespace xbeelink {

namespace {

const char* INCOMPLETE = "Error parsing packet: Incomplete packet.";

// In-memory source for the buffer overloads. Running off the end looks like
// a byte timeout, so a short buffer reports IncompletePacket.
class BufferSource : public transport::ByteSource {
public:
  BufferSource(const ByteVector& data, size_t start) : data_(data), pos_(start) {}

  transport::RxResult read_byte_wait(uint8_t& out, std::chrono::milliseconds) override {
    if (pos_ >= data_.size()) return transport::RxResult::None;
    out = data_[pos_++];
    return transport::RxResult::Ok;
  }

private:
  const ByteVector& data_;
  size_t pos_;
};

} // namespace

// ---------------------------------------------------------------------------
// read_logical_byte()
// -------------------
// One byte as the frame sees it: raw in API mode, escape-decoded in API2.
// ---------------------------------------------------------------------------
ParseStatus PacketParser::read_logical_byte(transport::ByteSource& source, OperatingMode mode,
                                            uint8_t& out, std::string& err) const {
  uint8_t raw = 0;
  if (source.read_byte_wait(raw, byte_timeout_) != transport::RxResult::Ok) {
    err = INCOMPLETE;
    return ParseStatus::IncompletePacket;
  }

  if (mode != OperatingMode::API_ESCAPED) {
    out = raw;
    return ParseStatus::Ok;
  }

  if (raw == escape::ESCAPE_BYTE) {
    uint8_t next = 0;
    if (source.read_byte_wait(next, byte_timeout_) != transport::RxResult::Ok) {
      err = INCOMPLETE;
      return ParseStatus::IncompletePacket;
    }
    out = static_cast<uint8_t>(next ^ escape::ESCAPE_XOR);
    return ParseStatus::Ok;
  }

  if (escape::is_special_byte(raw)) {
    err = "Special byte not escaped: 0x" + byte_to_hex(raw) + ".";
    return ParseStatus::SpecialByteNotEscaped;
  }

  out = raw;
  return ParseStatus::Ok;
}

ParseStatus PacketParser::parse_packet(transport::ByteSource& source, OperatingMode mode,
                                       Packet& out, std::string& err) const {
  if (!is_api_mode(mode)) {
    err = "Operating mode must be API or API Escaped.";
    return ParseStatus::InvalidOperatingMode;
  }

  uint8_t msb = 0, lsb = 0;
  ParseStatus st = read_logical_byte(source, mode, msb, err);
  if (st != ParseStatus::Ok) return st;
  st = read_logical_byte(source, mode, lsb, err);
  if (st != ParseStatus::Ok) return st;
  const size_t length = static_cast<size_t>((msb << 8) | lsb);

  ByteVector payload;
  payload.reserve(length);
  Checksum cs;
  for (size_t i = 0; i < length; ++i) {
    uint8_t b = 0;
    st = read_logical_byte(source, mode, b, err);
    if (st != ParseStatus::Ok) return st;
    payload.push_back(b);
    cs.add(b);
  }

  uint8_t received = 0;
  st = read_logical_byte(source, mode, received, err);
  if (st != ParseStatus::Ok) return st;

  const uint8_t expected = cs.generate();
  cs.add(received);
  if (!cs.validate()) {
    err = "Invalid checksum (expected 0x" + byte_to_hex(expected) + ").";
    return ParseStatus::InvalidChecksum;
  }

  return Packet::parse_payload(payload, out, err);
}

ParseStatus PacketParser::parse_packet(const ByteVector& frame, OperatingMode mode,
                                       Packet& out, std::string& err) const {
  if (frame.empty()) {
    err = INCOMPLETE;
    return ParseStatus::IncompletePacket;
  }
  if (frame[0] != escape::HEADER_BYTE) {
    err = "Invalid start delimiter.";
    return ParseStatus::InvalidStartDelimiter;
  }
  BufferSource src(frame, 1);
  return parse_packet(src, mode, out, err);
}

ParseStatus PacketParser::parse_packet(const std::string& hex, OperatingMode mode,
                                       Packet& out, std::string& err) const {
  ByteVector frame;
  if (!from_hex(hex, frame)) {
    err = "Invalid hex string.";
    return ParseStatus::InvalidHex;
  }
  return parse_packet(frame, mode, out, err);
}

} // namespace xbeelink
