#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "core/PermitPool.hpp"

namespace aniflow_tests {

using aniflow::core::PermitPool;

TEST(PermitPoolTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(PermitPool(0), std::invalid_argument);
}

TEST(PermitPoolTest, GuardReleasesOnScopeExit) {
  PermitPool pool(2);
  {
    PermitPool::Guard first(pool);
    EXPECT_EQ(pool.available(), 1u);
    {
      PermitPool::Guard second(pool);
      EXPECT_EQ(pool.available(), 0u);
    }
    EXPECT_EQ(pool.available(), 1u);
  }
  EXPECT_EQ(pool.available(), pool.capacity());
}

TEST(PermitPoolTest, BoundsConcurrentHolders) {
  PermitPool pool(3);
  std::atomic<int> holders{0};
  std::atomic<int> peak{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 10; ++i) {
    threads.emplace_back([&] {
      PermitPool::Guard guard(pool);
      int now = ++holders;
      int previous = peak.load();
      while (now > previous && !peak.compare_exchange_weak(previous, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      --holders;
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_LE(peak.load(), 3);
  EXPECT_EQ(pool.available(), 3u);
}

}  // namespace aniflow_tests
