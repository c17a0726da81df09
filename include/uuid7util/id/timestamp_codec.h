#pragma once

#include "uuid7util/core/clock.h"
#include "uuid7util/core/result.h"
#include "uuid7util/core/time.h"
#include "uuid7util/id/codec_error.h"
#include "uuid7util/id/entropy_source.h"
#include "uuid7util/id/uuid.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace uuid7util::id {

// OverflowPolicy decides what happens to millisecond values that do not fit
// in the 48-bit timestamp field (negative, or after year 10889).
// kTruncate - keep the low 48 bits (default; extraction then reads a different instant)
// kReject   - fail with CodecError::kTimestampOutOfRange
enum class OverflowPolicy {
  kTruncate,  // NOLINT(readability-identifier-naming)
  kReject,    // NOLINT(readability-identifier-naming)
};

// CodecOptions holds codec behavior switches. Every field has an explicit default.
struct CodecOptions {
  OverflowPolicy overflow_policy{OverflowPolicy::kTruncate};  // NOLINT(readability-identifier-naming)
};

// parse_overflow_policy accepts "truncate" or "reject"; nullopt otherwise.
[[nodiscard]] std::optional<OverflowPolicy> parse_overflow_policy(std::string_view name);
[[nodiscard]] const char* overflow_policy_name(OverflowPolicy policy);

using UuidResult = core::Result<Uuid, CodecFailure>;
using TimestampResult = core::Result<core::MillisTimestamp, CodecFailure>;

// sub_millisecond_sequence maps the nanoseconds inside a millisecond to the
// 12-bit rand_a field: (nanos >> 8), masked. It is derived from the instant
// alone, not a counter, so it does not order identifiers minted in the same
// millisecond.
[[nodiscard]] std::uint16_t sub_millisecond_sequence(std::uint32_t sub_millis_nanos);

// extract_timestamp reads the 48-bit millisecond timestamp of a v7 identifier.
// Fails with kInvalidVersion (stage kCheckingVersion) for any other version.
[[nodiscard]] TimestampResult extract_timestamp(const Uuid& uuid);

// stamp_timestamp overwrites the timestamp, version and rand_a fields of
// baseline and forces the RFC variant; rand_b is kept. Truncates to 48 bits.
[[nodiscard]] Uuid stamp_timestamp(const Uuid& baseline, const core::UnixInstant& instant);

// TimestampCodec builds and re-stamps v7 identifiers.
// Holds references (not ownership) to its collaborators; it has no mutable
// state of its own, so one instance may be shared across threads as long as
// the entropy source is thread-safe.
class TimestampCodec {
 public:
  TimestampCodec(IEntropySource& entropy, core::IClock& clock, CodecOptions options = {})
      : entropy_(entropy), clock_(clock), options_(options) {}

  [[nodiscard]] const CodecOptions& options() const { return options_; }

  // from_unix_instant creates a v7 identifier for instant with fresh randomness.
  [[nodiscard]] UuidResult from_unix_instant(const core::UnixInstant& instant) const;

  // from_timestamp accepts a system_clock time point of any integral precision.
  // Sub-millisecond precision feeds the rand_a field. Instants beyond the int64
  // millisecond range are rejected or wrapped per the overflow policy.
  template <typename Duration>
  [[nodiscard]] UuidResult from_timestamp(
      const std::chrono::time_point<core::Clock, Duration> ts) const {
    if (const auto instant = core::to_unix_instant(ts)) {
      return from_unix_instant(*instant);
    }
    if (options_.overflow_policy == OverflowPolicy::kReject) {
      return reject_unrepresentable();
    }
    return from_unix_instant(core::to_wrapped_unix_instant(ts));
  }

  // restamp_from_string parses text, extracts its timestamp and builds a new
  // v7 identifier for the same millisecond. Only version-7 text is accepted.
  [[nodiscard]] UuidResult restamp_from_string(std::string_view text) const;

  // generate_now creates a v7 identifier for the injected clock's current time.
  [[nodiscard]] UuidResult generate_now() const;

 private:
  [[nodiscard]] UuidResult reject_unrepresentable() const;

  IEntropySource& entropy_;
  core::IClock& clock_;
  CodecOptions options_;
};

// Convenience entry points backed by the OpenSSL source, the system clock and
// default options.
[[nodiscard]] UuidResult new_uuid7_from_unix_instant(const core::UnixInstant& instant);
[[nodiscard]] UuidResult new_uuid7_from_string(std::string_view text);
[[nodiscard]] UuidResult new_uuid7();

template <typename Duration>
[[nodiscard]] UuidResult new_uuid7_from_timestamp(
    const std::chrono::time_point<core::Clock, Duration> ts) {
  // Default options truncate, so out-of-range instants wrap.
  return new_uuid7_from_unix_instant(core::to_wrapped_unix_instant(ts));
}

}  // namespace uuid7util::id
