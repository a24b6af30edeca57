#include "supervisor/execution_pool.hpp"

#include <thread>
#include <vector>

#include "gtest/gtest.h"

namespace {

using supervisor::ExecutionPool;

// NOLINTNEXTLINE
TEST(ExecutionPoolTest, RejectsOverCapacity) {
  ExecutionPool pool(2);
  auto first = pool.Admit();
  auto second = pool.Admit();
  EXPECT_NE(first, nullptr);
  EXPECT_NE(second, nullptr);
  EXPECT_EQ(pool.Admit(), nullptr);
  EXPECT_EQ(pool.Running(), 2);
}

// NOLINTNEXTLINE
TEST(ExecutionPoolTest, ReleaseOnDestruction) {
  ExecutionPool pool(1);
  {
    auto slot = pool.Admit();
    EXPECT_NE(slot, nullptr);
    EXPECT_EQ(pool.Admit(), nullptr);
  }
  EXPECT_EQ(pool.Running(), 0);
  EXPECT_NE(pool.Admit(), nullptr);
}

// NOLINTNEXTLINE
TEST(ExecutionPoolTest, MovedSlotReleasesOnce) {
  ExecutionPool pool(1);
  kj::Maybe<ExecutionPool::Slot> kept;
  {
    auto slot = pool.Admit();
    kept = kj::mv(slot);
  }
  EXPECT_EQ(pool.Running(), 1);
  kept = nullptr;
  EXPECT_EQ(pool.Running(), 0);
}

// NOLINTNEXTLINE
TEST(ExecutionPoolTest, ZeroCapacity) {
  ExecutionPool pool(0);
  EXPECT_EQ(pool.Admit(), nullptr);
}

// NOLINTNEXTLINE
TEST(ExecutionPoolTest, ConcurrentAdmissionNeverExceedsCapacity) {
  const int kCapacity = 3;
  const int kThreads = 16;
  ExecutionPool pool(kCapacity);
  std::vector<kj::Maybe<ExecutionPool::Slot>> slots(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&pool, &slots, i]() { slots[i] = pool.Admit(); });
  }
  for (auto& thread : threads) thread.join();
  int admitted = 0;
  for (const auto& slot : slots) {
    if (slot != nullptr) admitted++;
  }
  EXPECT_EQ(admitted, kCapacity);
  EXPECT_EQ(pool.Running(), kCapacity);
  slots.clear();
  EXPECT_EQ(pool.Running(), 0);
}

}  // namespace
