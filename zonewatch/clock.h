#pragma once

#include <stdint.h>

namespace zonewatch {

// Monotonic millisecond clock. Wraps after ~49 days, callers compare with
// unsigned subtraction (now - then).
class Clock {
 public:
  virtual ~Clock() {}
  virtual uint32_t nowMs() const = 0;
};

}  // namespace zonewatch

namespace zonewatch {

// Age of a timestamp. A stamp taken slightly after nowMs was read (the radio
// task stamps frames on its own) counts as zero, not as a wrapped age.
inline uint32_t elapsedMs(uint32_t nowMs, uint32_t thenMs) {
  const int32_t d = static_cast<int32_t>(nowMs - thenMs);
  return d > 0 ? static_cast<uint32_t>(d) : 0;
}

}  // namespace zonewatch
