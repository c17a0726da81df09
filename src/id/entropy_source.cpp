#include "uuid7util/id/entropy_source.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <climits>

namespace uuid7util::id {

namespace {

// Drains the OpenSSL error queue into one message, most recent last.
std::string openssl_error_text() {
  std::string text;
  while (const unsigned long code = ERR_get_error()) {
    std::array<char, 256> buffer{};
    ERR_error_string_n(code, buffer.data(), buffer.size());
    if (!text.empty()) {
      text += "; ";
    }
    text += buffer.data();
  }
  return text.empty() ? std::string{"RAND_bytes failed"} : text;
}

}  // namespace

core::Status<std::string> OpenSslEntropySource::fill(std::span<std::uint8_t> out) {
  // RAND_bytes takes an int length.
  if (out.size() > static_cast<std::size_t>(INT_MAX)) {
    return core::Status<std::string>::err("request of " + std::to_string(out.size()) +
                                          " bytes exceeds RAND_bytes limit");
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    return core::Status<std::string>::err(openssl_error_text());
  }
  return core::Status<std::string>::ok({});
}

core::Status<std::string> DeterministicEntropySource::fill(std::span<std::uint8_t> out) {
  constexpr std::uint64_t kGoldenGamma = 0x9E3779B97F4A7C15ULL;

  std::size_t i = 0;
  while (i < out.size()) {
    std::uint64_t z = state_.fetch_add(kGoldenGamma, std::memory_order_relaxed) + kGoldenGamma;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    z ^= z >> 31;
    for (int b = 0; b < 8 && i < out.size(); ++b, ++i) {
      out[i] = static_cast<std::uint8_t>(z >> (8 * b));
    }
  }
  return core::Status<std::string>::ok({});
}

IEntropySource& process_entropy_source() {
  static OpenSslEntropySource source;
  return source;
}

core::Result<Uuid, CodecFailure> make_random_uuid(IEntropySource& entropy) {
  Uuid::Bytes bytes{};
  const auto drawn = entropy.fill(bytes);
  if (!drawn.has_value()) {
    return core::Result<Uuid, CodecFailure>::err(
        make_failure(CodecError::kEntropySourceFailure, CodecStage::kDrawingEntropy, drawn.error()));
  }

  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant 10
  return core::Result<Uuid, CodecFailure>::ok(Uuid{bytes});
}

}  // namespace uuid7util::id
