#include "freertos_ticker.h"

#include "zw_log.h"

namespace zonewatch {

FreeRtosTicker::FreeRtosTicker(const char* name, uint32_t stackBytes, UBaseType_t priority,
                               BaseType_t core)
    : name_(name), stackBytes_(stackBytes), priority_(priority), core_(core) {}

FreeRtosTicker::~FreeRtosTicker() {
  stop();
  if (taskDone_) vSemaphoreDelete(taskDone_);
}

bool FreeRtosTicker::start(uint32_t periodMs, TickFn fn, void* ctx) {
  if (!fn) return false;
  {
    SpinLockGuard g(lock_);
    if (task_) return true;
  }

  if (!taskDone_) taskDone_ = xSemaphoreCreateBinary();
  if (!taskDone_) return false;
  xSemaphoreTake(taskDone_, 0);  // left over from a stop() issued inside a tick

  periodMs_ = periodMs;
  fn_ = fn;
  ctx_ = ctx;

  {
    SpinLockGuard g(lock_);
    running_ = true;
  }

  TaskHandle_t task = nullptr;
  const BaseType_t ok = xTaskCreatePinnedToCore(
    taskEntry,
    name_,
    stackBytes_,
    this,
    priority_,
    &task,
    core_
  );
  if (ok != pdPASS) {
    {
      SpinLockGuard g(lock_);
      running_ = false;
    }
    ZW_LOGE(name_, "task create failed");
    return false;
  }

  // Published after creation; triggerNow() before this is a no-op.
  SpinLockGuard g(lock_);
  task_ = task;
  return true;
}

void FreeRtosTicker::stop() {
  TaskHandle_t task;
  {
    SpinLockGuard g(lock_);
    task = task_;
    if (!task) return;
    task_ = nullptr;
    running_ = false;
    xTaskNotifyGive(task);
  }

  // Called from inside our own tick: the loop exits once fn_ returns.
  if (xTaskGetCurrentTaskHandle() != task) {
    xSemaphoreTake(taskDone_, portMAX_DELAY);
  }
}

void FreeRtosTicker::triggerNow() {
  SpinLockGuard g(lock_);
  if (task_ && running_) xTaskNotifyGive(task_);
}

bool FreeRtosTicker::keepRunning() {
  SpinLockGuard g(lock_);
  return running_;
}

void FreeRtosTicker::taskEntry(void* param) {
  FreeRtosTicker* self = static_cast<FreeRtosTicker*>(param);

  while (self->keepRunning()) {
    ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(self->periodMs_));
    if (!self->keepRunning()) break;
    self->fn_(self->ctx_);
  }

  xSemaphoreGive(self->taskDone_);
  vTaskDelete(nullptr);
}

}  // namespace zonewatch
