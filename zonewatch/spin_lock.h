#pragma once

#include <memory>

namespace zonewatch {

// Short critical section around the shared tables.
// On the ESP32 this is a portMUX spinlock, so locked regions must only copy
// fixed-size data: no heap, no logging, no callbacks.
class SpinLock {
 public:
  SpinLock();
  ~SpinLock();

  SpinLock(const SpinLock&) = delete;
  SpinLock& operator=(const SpinLock&) = delete;

  void lock();
  void unlock();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Scope guard.
class SpinLockGuard {
 public:
  explicit SpinLockGuard(SpinLock& lock) : lock_(lock) { lock_.lock(); }
  ~SpinLockGuard() { lock_.unlock(); }

  SpinLockGuard(const SpinLockGuard&) = delete;
  SpinLockGuard& operator=(const SpinLockGuard&) = delete;

 private:
  SpinLock& lock_;
};

}  // namespace zonewatch
