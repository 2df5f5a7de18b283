#pragma once

#include <Arduino.h>

#include "clock.h"

namespace zonewatch {

class ArduinoClock : public Clock {
 public:
  uint32_t nowMs() const override { return millis(); }
};

}  // namespace zonewatch
