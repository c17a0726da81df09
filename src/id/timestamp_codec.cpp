#include "uuid7util/id/timestamp_codec.h"

#include "uuid7util/id/uuid7_layout.h"
#include "uuid7util/id/uuid_text.h"

#include <string>

namespace uuid7util::id {

namespace {

constexpr std::int64_t kMaxTimestampMs = static_cast<std::int64_t>(kTimestampMask);

bool fits_timestamp_field(const std::int64_t millis) {
  return millis >= 0 && millis <= kMaxTimestampMs;
}

}  // namespace

std::optional<OverflowPolicy> parse_overflow_policy(const std::string_view name) {
  if (name == "truncate") {
    return OverflowPolicy::kTruncate;
  }
  if (name == "reject") {
    return OverflowPolicy::kReject;
  }
  return std::nullopt;
}

const char* overflow_policy_name(const OverflowPolicy policy) {
  switch (policy) {
    case OverflowPolicy::kTruncate:
      return "truncate";
    case OverflowPolicy::kReject:
      return "reject";
  }
  return "unknown";
}

std::uint16_t sub_millisecond_sequence(const std::uint32_t sub_millis_nanos) {
  return static_cast<std::uint16_t>((sub_millis_nanos >> 8) & kRandAMask);
}

TimestampResult extract_timestamp(const Uuid& uuid) {
  if (uuid.version() != kVersion7) {
    return TimestampResult::err(make_failure(CodecError::kInvalidVersion,
                                             CodecStage::kCheckingVersion,
                                             "found version " + std::to_string(uuid.version())));
  }

  // 48 bits always fit in int64 milliseconds.
  const auto millis = static_cast<std::int64_t>(read_timestamp_ms(uuid));
  return TimestampResult::ok(core::from_unix_millis(millis));
}

Uuid stamp_timestamp(const Uuid& baseline, const core::UnixInstant& instant) {
  Uuid7Fields fields = unpack(baseline);
  // Two's complement wrap, then mask: negative instants keep their low 48 bits.
  fields.unix_ts_ms = static_cast<std::uint64_t>(instant.millis) & kTimestampMask;
  fields.version = kVersion7;
  fields.rand_a = sub_millisecond_sequence(instant.sub_millis_nanos);
  fields.variant = kRfcVariant;
  return pack(fields);
}

UuidResult TimestampCodec::from_unix_instant(const core::UnixInstant& instant) const {
  if (options_.overflow_policy == OverflowPolicy::kReject && !fits_timestamp_field(instant.millis)) {
    return UuidResult::err(make_failure(CodecError::kTimestampOutOfRange,
                                        CodecStage::kConstructingFromTimestamp,
                                        std::to_string(instant.millis) + " ms"));
  }

  const auto baseline = make_random_uuid(entropy_);
  if (!baseline.has_value()) {
    return UuidResult::err(baseline.error().wrapped(CodecStage::kConstructingFromTimestamp));
  }

  return UuidResult::ok(stamp_timestamp(baseline.value(), instant));
}

UuidResult TimestampCodec::reject_unrepresentable() const {
  return UuidResult::err(make_failure(CodecError::kTimestampOutOfRange,
                                      CodecStage::kConstructingFromTimestamp,
                                      "instant outside the int64 millisecond range"));
}

UuidResult TimestampCodec::restamp_from_string(const std::string_view text) const {
  const auto parsed = parse_uuid(text);
  if (!parsed.has_value()) {
    return UuidResult::err(make_failure(CodecError::kMalformedInput, CodecStage::kParsingInput,
                                        describe(parsed.error())));
  }

  const auto timestamp = extract_timestamp(parsed.value());
  if (!timestamp.has_value()) {
    return UuidResult::err(timestamp.error().wrapped(CodecStage::kExtractingTimestamp));
  }

  // Sub-millisecond bits of the input are not carried over. Construction
  // failures already carry kConstructingFromTimestamp.
  return from_timestamp(timestamp.value());
}

UuidResult TimestampCodec::generate_now() const {
  return from_timestamp(clock_.now());
}

UuidResult new_uuid7_from_unix_instant(const core::UnixInstant& instant) {
  core::SystemClock clock;
  const TimestampCodec codec{process_entropy_source(), clock};
  return codec.from_unix_instant(instant);
}

UuidResult new_uuid7_from_string(const std::string_view text) {
  core::SystemClock clock;
  const TimestampCodec codec{process_entropy_source(), clock};
  return codec.restamp_from_string(text);
}

UuidResult new_uuid7() {
  core::SystemClock clock;
  const TimestampCodec codec{process_entropy_source(), clock};
  return codec.generate_now();
}

}  // namespace uuid7util::id
