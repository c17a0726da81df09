#include "uuid7util/core/clock.h"

namespace uuid7util::core {

Timestamp SystemClock::now() {
  return now_utc();
}

Timestamp FixedClock::now() {
  return fixed_time_;
}

}  // namespace uuid7util::core
