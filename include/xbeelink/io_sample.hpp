#pragma once
/**
 * @file io_sample.hpp
 * @brief Decoder for the IO sample block carried by IO data sample frames.
 *
 * Two layouts exist and are told apart by payload length parity:
 *
 * Even length (ZigBee/DigiMesh, frame 0x92):
 *   [0] sample count  [1..2] digital mask (15 bits)  [3] analog mask
 *   [4..5] digital values (only if digital mask != 0)  then 2 bytes per enabled
 *   analog line, AD0..AD3, and bit 7 = supply voltage.
 *
 * Odd length (802.15.4 raw, frames 0x82/0x83):
 *   [0] sample count  [1..2] combined mask: bit 0 of [1] is DIO8, bits 9..14 are
 *   AD0..AD5  then digital values (if any) and 2 bytes per enabled ADC line.
 *
 * Lines are identified by their index (DIO0..DIO15, AD0..AD7).
 */

#include "xbeelink/bytes.hpp"
#include <map>
#include <optional>

namespace xbeelink {

enum class IOValue : uint8_t { Low = 0, High = 1 };

class IOSample {
public:
  static constexpr size_t MIN_LENGTH = 5;

  /**
   * @brief Decode a sample block.
   * @param err set when the block is shorter than MIN_LENGTH or truncated
   *            inside the digital values.
   */
  static bool parse(const ByteVector& payload, IOSample& out, std::string& err);

  uint16_t digital_mask() const { return digital_mask_; }
  uint16_t analog_mask()  const { return analog_mask_; }

  bool has_digital_values() const { return !digital_.empty(); }
  bool has_digital_value(int line) const { return digital_.count(line) != 0; }
  std::optional<IOValue> digital_value(int line) const;
  const std::map<int, IOValue>& digital_values() const { return digital_; }

  bool has_analog_values() const { return !analog_.empty(); }
  bool has_analog_value(int line) const { return analog_.count(line) != 0; }
  std::optional<uint16_t> analog_value(int line) const;
  const std::map<int, uint16_t>& analog_values() const { return analog_; }

  bool has_power_supply_value() const { return (analog_mask_ & 0x80) != 0 && power_supply_.has_value(); }
  std::optional<uint16_t> power_supply_value() const { return power_supply_; }

  const ByteVector& raw() const { return raw_; }

  /// "{[DIO1: High], [AD2: 512], [Power supply voltage: 3300]}"
  std::string to_string() const;

private:
  bool parse_standard(std::string& err);
  bool parse_raw_802(std::string& err);

  ByteVector raw_;
  uint16_t digital_mask_ = 0;
  uint16_t analog_mask_ = 0;
  std::map<int, IOValue> digital_;
  std::map<int, uint16_t> analog_;
  std::optional<uint16_t> power_supply_;
};

} // namespace xbeelink
