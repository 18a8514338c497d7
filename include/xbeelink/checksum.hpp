#pragma once
/**
 * @file checksum.hpp
 * @brief Running 8-bit checksum used when generating and validating API frames.
 *
 * The sum is kept in a wide accumulator and only truncated to its low byte when
 * generate() or validate() is called:
 *   - generate() = 0xFF - (sum & 0xFF)
 *   - validate() = (sum & 0xFF) == 0xFF, i.e. sum(payload ++ [checksum])
 *
 * One instance per frame; not thread-safe.
 */

#include "xbeelink/bytes.hpp"

namespace xbeelink {

class Checksum {
public:
  void add(uint8_t b) { sum_ += b; }
  void add(const uint8_t* data, size_t len);
  void add(const ByteVector& data) { add(data.data(), data.size()); }

  void reset() { sum_ = 0; }

  /// Checksum byte to append after the payload.
  uint8_t generate() const { return static_cast<uint8_t>(0xFF - (sum_ & 0xFF)); }

  /// True once the received checksum byte has been added and the frame is intact.
  bool validate() const { return (sum_ & 0xFF) == 0xFF; }

private:
  uint32_t sum_ = 0;
};

} // namespace xbeelink
