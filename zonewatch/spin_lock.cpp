#include "spin_lock.h"

#include <Arduino.h>

namespace zonewatch {

struct SpinLock::Impl {
  portMUX_TYPE mux = portMUX_INITIALIZER_UNLOCKED;
};

SpinLock::SpinLock() : impl_(new Impl) {}

SpinLock::~SpinLock() {}

void SpinLock::lock() {
  portENTER_CRITICAL(&impl_->mux);
}

void SpinLock::unlock() {
  portEXIT_CRITICAL(&impl_->mux);
}

}  // namespace zonewatch
