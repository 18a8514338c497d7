// -----------------------------------------------------------------------------
// checksum.cpp: bulk add for the frame checksum (see checksum.hpp).
// -----------------------------------------------------------------------------
#include "xbeelink/checksum.hpp"

namespace xbeelink {

void Checksum::add(const uint8_t* data, size_t len) {
  for (size_t i = 0; i < len; ++i) sum_ += data[i];
}

} // namespace xbeelink
