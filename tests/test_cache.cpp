/**
 * @file test_cache.cpp
 * @brief Tests for SnapshotCache and VersionSignal.
 *
 * Validates:
 *  - update() swaps the table and advances the version by one
 *  - query() consults dynamic then static objects, skips unknown names
 *  - wait_for_next() wakes on update, returns at once when already behind,
 *    and reports cancellation / timeout
 *  - Readers never observe a partially replaced table
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <map>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "trellis/cache/cache_set.hpp"
#include "trellis/cache/snapshot_cache.hpp"
#include "trellis/cache/version_signal.hpp"

using namespace std::chrono_literals;
using trellis::cache::SnapshotCache;
using trellis::cache::VersionSignal;
using trellis::cache::WaitError;

using IntCache = SnapshotCache<int>;

// --------------------------- Tables -----------------------------------------

/**
 * @test Cache_Update_AdvancesVersion
 * @brief Each update bumps the version and replaces the dynamic table wholesale.
 */
TEST(SnapshotCache, Cache_Update_AdvancesVersion) {
  IntCache cache("test/int");
  EXPECT_EQ(cache.version(), 0u);
  EXPECT_TRUE(cache.contents().empty());

  EXPECT_EQ(cache.update({{"a", 1}, {"b", 2}}), 1u);
  EXPECT_EQ(cache.contents(), (std::vector<int>{1, 2}));

  EXPECT_EQ(cache.update({{"c", 3}}), 2u);
  EXPECT_EQ(cache.contents(), (std::vector<int>{3}));
  EXPECT_EQ(cache.version(), 2u);
  EXPECT_EQ(cache.type_url(), "test/int");
}

/**
 * @test Cache_Query_NamesAndStatic
 * @brief Named queries return dynamic objects first, then static ones; unknown names are skipped.
 */
TEST(SnapshotCache, Cache_Query_NamesAndStatic) {
  IntCache cache("test/int", {{"static", 100}, {"shadowed", 200}});
  (void)cache.update({{"b", 2}, {"a", 1}, {"shadowed", 7}});

  EXPECT_EQ(cache.query({"b", "a"}), (std::vector<int>{1, 2}));
  EXPECT_EQ(cache.query({"static", "missing", "a", "a"}), (std::vector<int>{1, 100}));
  EXPECT_EQ(cache.query({"shadowed"}), (std::vector<int>{7}));
  EXPECT_TRUE(cache.query({}).empty());

  // Contents merge both tables; dynamic wins on a name clash.
  EXPECT_EQ(cache.contents(), (std::vector<int>{1, 2, 7, 100}));
}

/**
 * @test CacheSet_TypeUrls
 * @brief Each cache in the set serves its own type.
 */
TEST(SnapshotCache, CacheSet_TypeUrls) {
  trellis::cache::CacheSet caches;
  EXPECT_EQ(caches.listeners.type_url(), "type.googleapis.com/envoy.api.v2.Listener");
  EXPECT_EQ(caches.routes.type_url(), "type.googleapis.com/envoy.api.v2.RouteConfiguration");
  EXPECT_EQ(caches.clusters.type_url(), "type.googleapis.com/envoy.api.v2.Cluster");
  EXPECT_EQ(caches.secrets.type_url(), "type.googleapis.com/envoy.api.v2.auth.Secret");
}

// --------------------------- Waiting ----------------------------------------

/**
 * @test Cache_Wait_ReturnsImmediatelyWhenBehind
 * @brief A caller that is already behind does not block.
 */
TEST(SnapshotCache, Cache_Wait_ReturnsImmediatelyWhenBehind) {
  IntCache cache("test/int");
  (void)cache.update({{"a", 1}});
  (void)cache.update({{"a", 2}});

  std::stop_source stop;
  const auto v = cache.wait_for_next(0, stop.get_token());
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, 2u);
}

/**
 * @test Cache_Wait_WakesOnUpdate
 * @brief A blocked waiter observes the next version published by another thread.
 */
TEST(SnapshotCache, Cache_Wait_WakesOnUpdate) {
  IntCache cache("test/int");
  std::atomic<std::uint64_t> seen{0};

  std::jthread waiter([&](std::stop_token stop) {
    const auto v = cache.wait_for_next(0, stop);
    if (v) seen.store(*v);
  });

  std::this_thread::sleep_for(20ms);
  (void)cache.update({{"a", 1}});
  waiter.join();

  EXPECT_EQ(seen.load(), 1u);
}

/**
 * @test Cache_Wait_Cancelled
 * @brief A stop request wakes a blocked waiter with Cancelled.
 */
TEST(SnapshotCache, Cache_Wait_Cancelled) {
  IntCache cache("test/int");
  std::atomic<bool> cancelled{false};

  std::jthread waiter([&](std::stop_token stop) {
    const auto v = cache.wait_for_next(cache.version(), stop);
    cancelled.store(!v && v.error() == WaitError::Cancelled);
  });

  std::this_thread::sleep_for(20ms);
  waiter.request_stop();
  waiter.join();

  EXPECT_TRUE(cancelled.load());
  EXPECT_EQ(cache.version(), 0u);
}

/**
 * @test Cache_Wait_TimedOut
 * @brief The bounded wait reports TimedOut when nothing is published.
 */
TEST(SnapshotCache, Cache_Wait_TimedOut) {
  IntCache cache("test/int");
  std::stop_source stop;

  const auto v = cache.wait_for_next_for(0, 10ms, stop.get_token());
  ASSERT_FALSE(v.has_value());
  EXPECT_EQ(v.error(), WaitError::TimedOut);

  stop.request_stop();
  const auto c = cache.wait_for_next_for(0, 1s, stop.get_token());
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error(), WaitError::Cancelled);
}

/**
 * @test Signal_Advance_Monotonic
 * @brief advance() and publish() share one counter.
 */
TEST(VersionSignal, Signal_Advance_Monotonic) {
  VersionSignal sig;
  int guarded = 0;
  EXPECT_EQ(sig.advance(), 1u);
  EXPECT_EQ(sig.publish([&] { guarded = 5; }), 2u);
  EXPECT_EQ(sig.with_lock([&] { return guarded; }), 5);
  EXPECT_EQ(sig.current(), 2u);
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Cache_Concurrency_1W_MR
 * @brief One writer alternates two tables; readers only ever see one of them whole.
 */
TEST(SnapshotCache, Cache_Concurrency_1W_MR) {
  IntCache cache("test/int");
  const IntCache::Map table_a{{"a", 1}, {"b", 1}, {"c", 1}};
  const IntCache::Map table_b{{"x", 2}};

  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) {
      (void)cache.update((i & 1) == 0 ? table_a : table_b);
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&] {
    while (running.load(std::memory_order_relaxed)) {
      const auto all = cache.contents();
      if (all.empty()) continue;
      if (all == std::vector<int>{1, 1, 1} || all == std::vector<int>{2}) {
        ok_reads.fetch_add(1, std::memory_order_relaxed);
      } else {
        ADD_FAILURE() << "Observed mixed table of size " << all.size();
        break;
      }
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn);
  writer.join();
  r1.join(); r2.join();

  EXPECT_EQ(cache.version(), 2000u);
  EXPECT_GE(ok_reads.load(), 0);
}
