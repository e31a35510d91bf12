#include "test_support.hpp"

#include "runtime/rw_lock.hpp"

#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>
#include <gtest/gtest.h>

using namespace rp::engine;
using rp::engine::testing::run;
using rp::engine::testing::wait_for_condition;

namespace {

auto hold_two_readers(AsyncRwLock *lock) -> exec::task<int> {
  auto first = co_await lock->lock_shared();
  auto second = co_await lock->lock_shared();
  co_return lock->readers();
}

auto take_exclusive(AsyncRwLock *lock, std::atomic<bool> *acquired,
                    std::atomic<bool> *overlapped) -> exec::task<void> {
  auto guard = co_await lock->lock();
  if (lock->readers() > 0) {
    overlapped->store(true);
  }
  acquired->store(true);
}

auto take_shared(AsyncRwLock *lock, std::atomic<int> *counter) -> exec::task<void> {
  auto guard = co_await lock->lock_shared();
  counter->fetch_add(1);
}

auto writer_blocked(AsyncRwLock &lock) -> bool {
  return !lock.try_lock_shared().owns_lock();
}

} // namespace

TEST(AsyncRwLock, SharedHoldersCoexist) {
  AsyncRwLock lock;
  EXPECT_EQ(run(hold_two_readers(&lock)), 2);
  EXPECT_EQ(lock.readers(), 0);
}

TEST(AsyncRwLock, GuardReleasesOnDestruction) {
  AsyncRwLock lock;
  {
    auto guard = lock.try_lock_shared();
    ASSERT_TRUE(guard.owns_lock());
    EXPECT_EQ(lock.readers(), 1);
  }
  EXPECT_EQ(lock.readers(), 0);

  auto guard = lock.try_lock_shared();
  auto moved = std::move(guard);
  EXPECT_FALSE(guard.owns_lock());
  EXPECT_TRUE(moved.owns_lock());
  moved.release();
  EXPECT_EQ(lock.readers(), 0);
}

TEST(AsyncRwLock, WriterWaitsForReadersAndBlocksNewOnes) {
  AsyncRwLock lock;
  exec::static_thread_pool pool(2);
  exec::async_scope scope;
  std::atomic<bool> acquired{false};
  std::atomic<bool> overlapped{false};
  std::atomic<int> late_readers{0};

  auto reader = lock.try_lock_shared();
  ASSERT_TRUE(reader.owns_lock());
  scope.spawn(stdexec::on(pool.get_scheduler(),
                          take_exclusive(&lock, &acquired, &overlapped)));

  // Once the writer is queued, new readers line up behind it.
  ASSERT_TRUE(wait_for_condition([&] { return writer_blocked(lock); },
                                 std::chrono::seconds(5)));
  scope.spawn(stdexec::on(pool.get_scheduler(), take_shared(&lock, &late_readers)));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(acquired.load());
  EXPECT_EQ(late_readers.load(), 0);

  reader.release();
  ASSERT_TRUE(wait_for_condition([&] { return late_readers.load() == 1; },
                                 std::chrono::seconds(5)));
  EXPECT_TRUE(acquired.load());
  EXPECT_FALSE(overlapped.load());

  stdexec::sync_wait(scope.on_empty());
  EXPECT_EQ(lock.readers(), 0);
  EXPECT_FALSE(lock.writer_active());
}

TEST(AsyncRwLock, ExclusiveHolderExcludesReaders) {
  AsyncRwLock lock;
  std::atomic<bool> acquired{false};
  std::atomic<bool> overlapped{false};
  run(take_exclusive(&lock, &acquired, &overlapped));
  EXPECT_TRUE(acquired.load());
  EXPECT_FALSE(lock.writer_active());
  EXPECT_TRUE(lock.try_lock_shared().owns_lock());
}
