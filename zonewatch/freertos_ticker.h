#pragma once

#include <Arduino.h>

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"

#include "spin_lock.h"
#include "ticker.h"

namespace zonewatch {

// Ticker backed by its own FreeRTOS task. The task sleeps on a task
// notification with the period as timeout, so triggerNow() and stop()
// wake it immediately.
class FreeRtosTicker : public Ticker {
 public:
  FreeRtosTicker(const char* name, uint32_t stackBytes = 4096, UBaseType_t priority = 1,
                 BaseType_t core = 1);
  ~FreeRtosTicker();

  bool start(uint32_t periodMs, TickFn fn, void* ctx) override;
  void stop() override;
  void triggerNow() override;

 private:
  static void taskEntry(void* param);
  bool keepRunning();

  const char* name_;
  uint32_t stackBytes_;
  UBaseType_t priority_;
  BaseType_t core_;

  uint32_t periodMs_ = 1000;
  TickFn fn_ = nullptr;
  void* ctx_ = nullptr;

  // stop() clears task_ and running_ in one critical section, and the task
  // leaves its loop only after reading running_ false under lock_. A handle
  // read under lock_ therefore always names a live task.
  SpinLock lock_;
  TaskHandle_t task_ = nullptr;
  SemaphoreHandle_t taskDone_ = nullptr;
  bool running_ = false;
};

}  // namespace zonewatch
