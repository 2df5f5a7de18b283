#include <gtest/gtest.h>

#include <thread>
#include <type_traits>

#include "spin_lock.h"

namespace zonewatch {
namespace {

static_assert(!std::is_copy_constructible<SpinLock>::value, "SpinLock must not be copyable");
static_assert(!std::is_copy_assignable<SpinLock>::value, "SpinLock must not be assignable");
static_assert(!std::is_copy_constructible<SpinLockGuard>::value, "guard must not be copyable");

TEST(SpinLock, GuardSerializesWriters) {
  SpinLock lock;
  long counter = 0;

  auto work = [&]() {
    for (int i = 0; i < 20000; i++) {
      SpinLockGuard g(lock);
      counter++;
    }
  };
  std::thread a(work);
  std::thread b(work);
  a.join();
  b.join();

  EXPECT_EQ(40000, counter);
}

TEST(SpinLock, ReleasedWhenGuardLeavesScope) {
  SpinLock lock;
  { SpinLockGuard g(lock); }
  // Would deadlock if the guard had not unlocked.
  lock.lock();
  lock.unlock();
  SUCCEED();
}

}  // namespace
}  // namespace zonewatch
