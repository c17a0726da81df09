#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <ratio>
#include <type_traits>

namespace uuid7util::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Millisecond-precision instant. Holds every 48-bit millisecond value
// (system_clock's native nanosecond time_point tops out in year 2262).
using MillisTimestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::floor<std::chrono::milliseconds>(ts).time_since_epoch().count();
}

inline MillisTimestamp from_unix_millis(const std::int64_t millis) {
  return MillisTimestamp{std::chrono::milliseconds{millis}};
}

// UnixInstant splits an instant into floored milliseconds since the epoch and
// the nanoseconds remaining inside that millisecond (always 0..999'999).
struct UnixInstant {
  std::int64_t millis{0};            // NOLINT(readability-identifier-naming)
  std::uint32_t sub_millis_nanos{0};  // NOLINT(readability-identifier-naming)

  bool operator==(const UnixInstant&) const = default;
};

namespace detail {

// Ratio of one Duration tick to one millisecond.
template <typename Duration>
using TickToMillis = std::ratio_divide<typename Duration::period, std::milli>;

template <typename Duration>
constexpr void require_integral_ticks() {
  using Rep = typename Duration::rep;
  static_assert(std::is_integral_v<Rep> && std::is_signed_v<Rep> && sizeof(Rep) <= 8,
                "instant ticks must be a signed integer of at most 64 bits");
  static_assert(TickToMillis<Duration>::num == 1 || TickToMillis<Duration>::den == 1,
                "a tick must divide one millisecond or span whole milliseconds");
}

}  // namespace detail

// to_unix_instant floors toward negative infinity, so instants before the epoch
// still get a non-negative sub-millisecond remainder.
// Returns nullopt when the instant lies outside the int64 millisecond range,
// which only coarse ticks (seconds, hours, ...) can reach. Works on tick counts
// directly so no intermediate conversion can overflow.
template <typename Duration>
std::optional<UnixInstant> to_unix_instant(const std::chrono::time_point<Clock, Duration> ts) {
  detail::require_integral_ticks<Duration>();
  using Ratio = detail::TickToMillis<Duration>;
  const auto count = static_cast<std::int64_t>(ts.time_since_epoch().count());

  if constexpr (Ratio::den == 1) {
    // Each tick spans Ratio::num whole milliseconds.
    constexpr auto kMillisPerTick = static_cast<std::int64_t>(Ratio::num);
    if (count > std::numeric_limits<std::int64_t>::max() / kMillisPerTick ||
        count < std::numeric_limits<std::int64_t>::min() / kMillisPerTick) {
      return std::nullopt;
    }
    return UnixInstant{count * kMillisPerTick, 0};
  } else {
    constexpr auto kTicksPerMilli = static_cast<std::int64_t>(Ratio::den);
    std::int64_t millis = count / kTicksPerMilli;
    std::int64_t ticks = count % kTicksPerMilli;
    if (ticks < 0) {
      --millis;
      ticks += kTicksPerMilli;
    }
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        Duration{static_cast<typename Duration::rep>(ticks)});
    return UnixInstant{millis, static_cast<std::uint32_t>(nanos.count())};
  }
}

// to_wrapped_unix_instant is to_unix_instant with out-of-range milliseconds
// reduced modulo 2^64 in unsigned arithmetic. The low 48 bits stay exact,
// which is all the timestamp field keeps.
template <typename Duration>
UnixInstant to_wrapped_unix_instant(const std::chrono::time_point<Clock, Duration> ts) {
  if (const auto exact = to_unix_instant(ts)) {
    return *exact;
  }
  using Ratio = detail::TickToMillis<Duration>;
  const auto ticks = static_cast<std::uint64_t>(ts.time_since_epoch().count());
  const std::uint64_t millis = ticks * static_cast<std::uint64_t>(Ratio::num);
  return UnixInstant{static_cast<std::int64_t>(millis), 0};
}

}  // namespace uuid7util::core
