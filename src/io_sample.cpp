// -----------------------------------------------------------------------------
// io_sample.cpp: IO sample block decoding (see io_sample.hpp for layouts).
// -----------------------------------------------------------------------------
#include "xbeelink/io_sample.hpp"

namespace xbeelink {

namespace {
inline bool bit_set(uint32_t v, int i) { return ((v >> i) & 1u) != 0; }
}

bool IOSample::parse(const ByteVector& payload, IOSample& out, std::string& err) {
  if (payload.size() < MIN_LENGTH) {
    err = "IO sample payload must be longer than 4.";
    return false;
  }
  out = IOSample{};
  out.raw_ = payload;
  return (payload.size() % 2 != 0) ? out.parse_raw_802(err) : out.parse_standard(err);
}

// ---------------------------------------------------------------------------
// parse_standard()
// ----------------
// Even-length block. Analog bit 7 is the supply voltage, not a line.
// ---------------------------------------------------------------------------
bool IOSample::parse_standard(std::string& err) {
  size_t idx = 4;
  digital_mask_ = static_cast<uint16_t>(((raw_[1] & 0x7F) << 8) | raw_[2]);
  analog_mask_  = static_cast<uint16_t>(raw_[3] & 0xBF);

  if (digital_mask_ > 0) {
    if (raw_.size() < idx + 2) {
      err = "IO sample truncated in digital values.";
      return false;
    }
    const uint16_t values = static_cast<uint16_t>(((raw_[4] & 0x7F) << 8) | raw_[5]);
    for (int i = 0; i < 16; ++i) {
      if (!bit_set(digital_mask_, i)) continue;
      digital_[i] = bit_set(values, i) ? IOValue::High : IOValue::Low;
    }
    idx += 2;
  }

  int adc = 0;
  while (raw_.size() - idx > 1 && adc < 8) {
    if (!bit_set(analog_mask_, adc)) { ++adc; continue; }
    const uint16_t v = read_u16(raw_, idx);
    if (adc == 7) power_supply_ = v;
    else          analog_[adc] = v;
    idx += 2;
    ++adc;
  }
  return true;
}

// ---------------------------------------------------------------------------
// parse_raw_802()
// ---------------
// Odd-length 802.15.4 block. One combined 16-bit mask: DIO0..DIO8 in bits 0..8,
// AD0..AD5 in bits 9..14. No supply voltage.
// ---------------------------------------------------------------------------
bool IOSample::parse_raw_802(std::string& err) {
  size_t idx = 3;
  const uint16_t combined = read_u16(raw_, 1);
  digital_mask_ = static_cast<uint16_t>(((raw_[1] & 0x01) << 8) | raw_[2]);
  analog_mask_  = static_cast<uint16_t>(combined & 0x7E00);

  if (digital_mask_ > 0) {
    if (raw_.size() < idx + 2) {
      err = "IO sample truncated in digital values.";
      return false;
    }
    const uint16_t values = static_cast<uint16_t>(((raw_[3] & 0x7F) << 8) | raw_[4]);
    for (int i = 0; i < 16; ++i) {
      if (!bit_set(digital_mask_, i)) continue;
      digital_[i] = bit_set(values, i) ? IOValue::High : IOValue::Low;
    }
    idx += 2;
  }

  int adc = 9;
  while (raw_.size() - idx > 1 && adc < 16) {
    if (!bit_set(analog_mask_, adc)) { ++adc; continue; }
    analog_[adc - 9] = read_u16(raw_, idx);
    idx += 2;
    ++adc;
  }
  return true;
}

std::optional<IOValue> IOSample::digital_value(int line) const {
  auto it = digital_.find(line);
  if (it == digital_.end()) return std::nullopt;
  return it->second;
}

std::optional<uint16_t> IOSample::analog_value(int line) const {
  auto it = analog_.find(line);
  if (it == analog_.end()) return std::nullopt;
  return it->second;
}

std::string IOSample::to_string() const {
  std::string s = "{";
  for (const auto& kv : digital_) {
    s += "[DIO" + std::to_string(kv.first) + ": ";
    s += (kv.second == IOValue::High) ? "High" : "Low";
    s += "], ";
  }
  for (const auto& kv : analog_)
    s += "[AD" + std::to_string(kv.first) + ": " + std::to_string(kv.second) + "], ";
  if (has_power_supply_value())
    s += "[Power supply voltage: " + std::to_string(*power_supply_) + "], ";
  if (s.size() > 1) s.resize(s.size() - 2);       // drop trailing ", "
  return s + "}";
}

} // namespace xbeelink
