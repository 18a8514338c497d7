#pragma once
/**
 * @file frame_id.hpp
 * @brief Frame ID allocator used to correlate requests with their responses.
 *
 * | Value  | Meaning                                      |
 * |--------|----------------------------------------------|
 * | 0x00   | no response requested (never allocated)      |
 * | 1..255 | handed out in order, wrapping 255 -> 1       |
 *
 * One allocator belongs to each Session; RemoteNode facades borrow it through
 * their session, so IDs stay unique across local and remote requests.
 */

#include <cstdint>
#include <mutex>

namespace xbeelink {

class FrameIdAllocator {
public:
  static constexpr uint8_t NO_RESPONSE = 0x00;

  /// Next ID in 1..255. Thread-safe.
  uint8_t next() {
    std::lock_guard<std::mutex> lk(m_);
    last_ = (last_ == 0xFF) ? 1 : static_cast<uint8_t>(last_ + 1);
    return last_;
  }

  /// Last ID handed out (0xFF before the first call).
  uint8_t last() const {
    std::lock_guard<std::mutex> lk(m_);
    return last_;
  }

private:
  mutable std::mutex m_;
  uint8_t last_ = 0xFF;     // first next() yields 1
};

} // namespace xbeelink
