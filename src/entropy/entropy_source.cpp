#include "uidkit/entropy/entropy_source.h"

#include <stdexcept>

namespace uidkit::entropy {

bool SystemEntropySource::fill(std::span<std::uint8_t> out) {
  std::lock_guard<std::mutex> lock(mutex_);

  // random_device yields 32-bit words; spread each across up to four bytes.
  try {
    if (!device_) {
      device_ = token_.has_value() ? std::make_unique<std::random_device>(*token_)
                                   : std::make_unique<std::random_device>();
    }
    std::size_t i = 0;
    while (i < out.size()) {
      std::uint32_t word = (*device_)();
      for (int b = 0; b < 4 && i < out.size(); ++b, ++i) {
        out[i] = static_cast<std::uint8_t>(word & 0xFFu);
        word >>= 8u;
      }
    }
  } catch (const std::runtime_error&) {
    // The device could not be opened or read.
    return false;
  }
  return true;
}

}  // namespace uidkit::entropy
