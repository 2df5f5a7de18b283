#pragma once

#include <stdint.h>

namespace zonewatch {

typedef void (*TickFn)(void* ctx);

// Runs fn(ctx) every periodMs on its own task until stop().
class Ticker {
 public:
  virtual ~Ticker() {}

  // Returns false if the task could not be created. Starting a running
  // ticker is a no-op that returns true.
  virtual bool start(uint32_t periodMs, TickFn fn, void* ctx) = 0;

  // Blocks until the tick callback is no longer running. Safe when not started.
  virtual void stop() = 0;

  // Requests one extra tick as soon as possible, on the ticker's own task.
  virtual void triggerNow() = 0;
};

}  // namespace zonewatch
