#include "uuid7util/id/uuid.h"

namespace uuid7util::id {

std::string Uuid::to_string() const {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < kSize; ++i) {
    // Hyphens follow bytes 3, 5, 7 and 9.
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHexDigits[bytes_[i] >> 4]);
    out.push_back(kHexDigits[bytes_[i] & 0x0F]);
  }
  return out;
}

}  // namespace uuid7util::id
