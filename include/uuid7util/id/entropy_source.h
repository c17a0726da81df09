#pragma once

#include "uuid7util/core/result.h"
#include "uuid7util/id/codec_error.h"
#include "uuid7util/id/uuid.h"

#include <atomic>
#include <cstdint>
#include <span>
#include <string>

namespace uuid7util::id {

// Abstract source of random bytes for dependency injection.
// Production code uses the OpenSSL DRBG; tests inject deterministic or failing sources.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Fill every byte of out, or report why not.
  // Contract: on error the contents of out are unspecified and must not be used.
  virtual core::Status<std::string> fill(std::span<std::uint8_t> out) = 0;

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Production source: OpenSSL RAND_bytes. Thread-safe; no fallback on failure.
class OpenSslEntropySource final : public IEntropySource {
 public:
  OpenSslEntropySource() = default;
  ~OpenSslEntropySource() override = default;

  OpenSslEntropySource(const OpenSslEntropySource&) = default;
  OpenSslEntropySource& operator=(const OpenSslEntropySource&) = default;
  OpenSslEntropySource(OpenSslEntropySource&&) = default;
  OpenSslEntropySource& operator=(OpenSslEntropySource&&) = default;

  core::Status<std::string> fill(std::span<std::uint8_t> out) override;
};

// Deterministic source: a splitmix64 stream from a seed.
// For tests where reproducible identifiers are required. NOT cryptographically secure.
// Thread-safe. Same seed and same sequence of fill() calls produces the same bytes.
class DeterministicEntropySource final : public IEntropySource {
 public:
  explicit DeterministicEntropySource(std::uint64_t seed = 0) : state_(seed) {}
  ~DeterministicEntropySource() override = default;

  // Not copyable or movable (contains atomic state)
  DeterministicEntropySource(const DeterministicEntropySource&) = delete;
  DeterministicEntropySource& operator=(const DeterministicEntropySource&) = delete;
  DeterministicEntropySource(DeterministicEntropySource&&) = delete;
  DeterministicEntropySource& operator=(DeterministicEntropySource&&) = delete;

  core::Status<std::string> fill(std::span<std::uint8_t> out) override;

 private:
  std::atomic<std::uint64_t> state_;
};

// process_entropy_source returns the shared OpenSSL-backed source.
[[nodiscard]] IEntropySource& process_entropy_source();

// make_random_uuid draws 16 bytes and marks them as a version-4, RFC-variant
// identifier. This is the random baseline the timestamp codec stamps over.
[[nodiscard]] core::Result<Uuid, CodecFailure> make_random_uuid(IEntropySource& entropy);

}  // namespace uuid7util::id
