#include "spin_lock.h"

#include <mutex>

namespace zonewatch {

struct SpinLock::Impl {
  std::mutex mu;
};

SpinLock::SpinLock() : impl_(new Impl) {}

SpinLock::~SpinLock() {}

void SpinLock::lock() {
  impl_->mu.lock();
}

void SpinLock::unlock() {
  impl_->mu.unlock();
}

}  // namespace zonewatch
