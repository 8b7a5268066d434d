/**
 * @file test_rebuilder.cpp
 * @brief End-to-end tests: store -> build -> project -> caches.
 *
 * Validates:
 *  - One pass fills every cache and reports counts to the observer
 *  - Status records reach the status writer
 *  - The loop rebuilds on store changes and stops on request
 */

#include <gtest/gtest.h>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "trellis/pipeline/rebuilder.hpp"

using namespace std::chrono_literals;
using trellis::source::ResourceId;
using trellis::source::StoreErr;

namespace {

struct CountingObserver final : trellis::obs::Observer {
  mutable std::mutex mu;
  std::vector<trellis::obs::BuildEvent> events;
  trellis::obs::Counters totals;

  void record(const trellis::obs::BuildEvent& e) override {
    std::lock_guard<std::mutex> lk(mu);
    events.push_back(e);
    ++totals.passes;
    totals.invalid_resources += e.invalid;
    totals.orphaned_resources += e.orphaned;
  }
  trellis::obs::Counters snapshot() const override {
    std::lock_guard<std::mutex> lk(mu);
    return totals;
  }
};

struct RecordingWriter final : trellis::dag::StatusWriter {
  std::vector<trellis::dag::Status> seen;
  void set_status(const trellis::dag::Status& s) override { seen.push_back(s); }
};

trellis::source::RouteResource tls_root(std::string name, std::string fqdn) {
  using namespace trellis::source;
  RouteResource r;
  r.id = {"default", std::move(name)};
  TlsSpec tls;
  tls.secret_name = "cert";
  r.virtual_host = VirtualHostSpec{std::move(fqdn), tls};
  RouteSpec route;
  route.match = "/";
  route.services.push_back(ServiceRef{"kuard", 8080, 0, "", {}, {}, {}});
  r.routes.push_back(route);
  return r;
}

trellis::source::Snapshot world() {
  using namespace trellis::source;
  Snapshot s;
  s.services.emplace(ResourceId{"default", "kuard"}, Service{{"default", "kuard"}, {{"http", 8080, ""}}});
  s.secrets.emplace(ResourceId{"default", "cert"},
                    Secret{{"default", "cert"}, {{"tls.crt", "CERT"}, {"tls.key", "KEY"}}});
  auto root = tls_root("site", "example.com");
  s.route_resources.emplace(root.id, root);
  return s;
}

} // namespace

/**
 * @test Rebuild_FillsCaches
 * @brief A single pass publishes listeners, routes, clusters and secrets.
 */
TEST(Rebuilder, Rebuild_FillsCaches) {
  trellis::cache::CacheSet caches;
  CountingObserver observer;
  RecordingWriter writer;
  trellis::pipeline::Rebuilder rebuilder(trellis::config::Loader::defaults(), caches, observer, &writer);

  auto snap = world();
  trellis::source::RouteResource orphan;
  orphan.id = {"default", "orphan"};
  snap.route_resources.emplace(orphan.id, orphan);

  const auto e = rebuilder.rebuild(snap, 7);

  EXPECT_EQ(e.store_version, 7u);
  EXPECT_EQ(e.virtual_hosts, 1u);
  EXPECT_EQ(e.secure_hosts, 1u);
  EXPECT_EQ(e.valid, 1u);
  EXPECT_EQ(e.orphaned, 1u);
  EXPECT_EQ(e.listeners, 2u);
  EXPECT_EQ(e.route_configs, 2u);
  EXPECT_EQ(e.clusters, 1u);
  EXPECT_EQ(e.secrets, 1u);

  EXPECT_EQ(caches.listeners.version(), 1u);
  EXPECT_EQ(caches.secrets.version(), 1u);
  EXPECT_EQ(caches.listeners.contents().size(), 2u);
  EXPECT_EQ(caches.routes.query({"ingress_https"}).size(), 1u);
  EXPECT_EQ(caches.clusters.contents().size(), 1u);
  ASSERT_EQ(caches.secrets.contents().size(), 1u);
  EXPECT_EQ(caches.secrets.contents()[0].certificate_chain, "CERT");

  ASSERT_EQ(writer.seen.size(), 2u);
  EXPECT_EQ(writer.seen[0].id.name, "orphan");
  EXPECT_EQ(writer.seen[1].kind, trellis::dag::StatusKind::Valid);
  EXPECT_EQ(rebuilder.last_result().count(trellis::dag::StatusKind::Orphaned), 1u);
  EXPECT_EQ(observer.snapshot().passes, 1u);
  EXPECT_EQ(observer.snapshot().orphaned_resources, 1u);
}

/**
 * @test Rebuild_RemovedHostDisappears
 * @brief Each pass replaces cache contents wholesale.
 */
TEST(Rebuilder, Rebuild_RemovedHostDisappears) {
  trellis::cache::CacheSet caches;
  CountingObserver observer;
  trellis::pipeline::Rebuilder rebuilder(trellis::config::Loader::defaults(), caches, observer);

  (void)rebuilder.rebuild(world());
  ASSERT_EQ(caches.secrets.contents().size(), 1u);

  (void)rebuilder.rebuild(trellis::source::Snapshot{});
  EXPECT_TRUE(caches.listeners.contents().empty());
  EXPECT_TRUE(caches.clusters.contents().empty());
  EXPECT_TRUE(caches.secrets.contents().empty());
  // Both route tables are always present, possibly empty.
  EXPECT_EQ(caches.routes.contents().size(), 2u);
  EXPECT_EQ(caches.secrets.version(), 2u);
}

/**
 * @test Run_RebuildsOnChange
 * @brief The loop runs one pass up front, another after a store write, and exits on stop.
 */
TEST(Rebuilder, Run_RebuildsOnChange) {
  trellis::source::ResourceStore store;
  store.replace_all(world());

  trellis::cache::CacheSet caches;
  CountingObserver observer;
  trellis::pipeline::Rebuilder rebuilder(trellis::config::Loader::defaults(), caches, observer);

  std::uint64_t passes = 0;
  std::jthread loop([&](std::stop_token stop) { passes = rebuilder.run(store, stop); });

  std::stop_source never;
  const auto first = caches.secrets.wait_for_next_for(0, 5s, never.get_token());
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(caches.clusters.contents().size(), 1u);

  ASSERT_EQ(store.add(tls_root("second", "second.example.com")), StoreErr::Ok);
  const auto second = caches.secrets.wait_for_next_for(*first, 5s, never.get_token());
  ASSERT_TRUE(second.has_value());

  const auto routes = caches.routes.query({"ingress_https"});
  ASSERT_EQ(routes.size(), 1u);
  EXPECT_EQ(routes[0].virtual_hosts.size(), 2u);

  loop.request_stop();
  loop.join();
  EXPECT_GE(passes, 2u);
  EXPECT_EQ(observer.snapshot().passes, passes);
}
