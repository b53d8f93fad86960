#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include "sync/keyed_lock_manager.hpp"

using namespace vault::sync;

class KeyedLockManagerTest : public ::testing::Test {
protected:
  boost::asio::io_context io_context;
  KeyedLockManager locks{io_context, 2};

  // Takes the lock and stores it in the given handle
  void hold(const std::string& key, KeyedLockManager::KeyLock& handle) {
    boost::asio::spawn(io_context, [this, key, &handle](boost::asio::yield_context yield) {
      CancellationSignal cancel;
      handle = locks.lock(key, cancel, yield);
    });
    io_context.poll();
    io_context.restart();
  }
};

TEST_F(KeyedLockManagerTest, SameKeyIsExclusive) {
  KeyedLockManager::KeyLock first;
  hold("obj", first);
  ASSERT_TRUE(first.owns_lock());
  EXPECT_TRUE(locks.is_locked("obj"));

  bool second_acquired = false;
  boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
    CancellationSignal cancel;
    auto second = locks.lock("obj", cancel, yield);
    second_acquired = true;
  });

  io_context.poll();
  EXPECT_FALSE(second_acquired);

  first.release();
  io_context.run();
  EXPECT_TRUE(second_acquired);
  EXPECT_FALSE(locks.is_locked("obj"));
}

TEST_F(KeyedLockManagerTest, DistinctKeysDoNotContend) {
  KeyedLockManager::KeyLock a;
  KeyedLockManager::KeyLock b;
  hold("a", a);
  hold("b", b);

  EXPECT_TRUE(a.owns_lock());
  EXPECT_TRUE(b.owns_lock());
  EXPECT_EQ(locks.size(), 2u);
}

TEST_F(KeyedLockManagerTest, IdleEntriesAreRecycledIntoBoundedPool) {
  for (int i = 0; i < 5; ++i) {
    KeyedLockManager::KeyLock handle;
    hold("key-" + std::to_string(i), handle);
    EXPECT_EQ(handle.key(), "key-" + std::to_string(i));
  }

  EXPECT_EQ(locks.size(), 0u);
  EXPECT_LE(locks.pooled(), 2u);
}

TEST_F(KeyedLockManagerTest, MemoryFollowsKeysInUse) {
  std::vector<KeyedLockManager::KeyLock> handles(10);
  for (int i = 0; i < 10; ++i) {
    hold("k" + std::to_string(i), handles[i]);
  }
  EXPECT_EQ(locks.size(), 10u);

  handles.clear();
  EXPECT_EQ(locks.size(), 0u);
  EXPECT_EQ(locks.pooled(), 2u);
}

TEST_F(KeyedLockManagerTest, CancelledWaiterReleasesItsReference) {
  KeyedLockManager::KeyLock held;
  hold("busy", held);

  CancellationSignal cancel;
  bool cancelled = false;
  boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
    try {
      locks.lock("busy", cancel, yield);
    } catch (const OperationCancelled&) {
      cancelled = true;
    }
  });

  io_context.poll();
  cancel.cancel();
  io_context.run();

  EXPECT_TRUE(cancelled);
  EXPECT_TRUE(locks.is_locked("busy"));
  held.release();
  EXPECT_EQ(locks.size(), 0u);
}
