/**
 * @file test_store.cpp
 * @brief Tests for ResourceStore RCU semantics and the YAML resource loader.
 *
 * Validates:
 *  - Snapshot publication via atomic_load/store on shared_ptr (RCU pattern)
 *  - add / upsert / replace / remove behavior and identity validation
 *  - Every successful mutation advances the change signal
 *  - No torn reads under 1 writer / many readers
 *  - Multi-document YAML parsing into a Snapshot
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "trellis/source/resource_store.hpp"
#include "trellis/source/yaml_loader.hpp"

using namespace std::chrono_literals;
using trellis::source::ResourceId;
using trellis::source::ResourceStore;
using trellis::source::RouteResource;
using trellis::source::Secret;
using trellis::source::Service;
using trellis::source::StoreErr;

///
/// Helpers
///
static Service service(std::string ns, std::string name, std::uint32_t port = 8080) {
  return Service{{std::move(ns), std::move(name)}, {{"http", port, ""}}};
}

// --------------------------- Basic construction ----------------------------

/**
 * @test Store_Construct_Empty
 * @brief Fresh store publishes a valid empty snapshot at version 0.
 */
TEST(ResourceStore, Store_Construct_Empty) {
  ResourceStore store;

  auto snap = store.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_EQ(snap->size(), 0u);
  EXPECT_EQ(store.version(), 0u);
}

// --------------------------- Add / Upsert / Replace ------------------------

/**
 * @test Store_Add_And_Lookup
 * @brief Added objects are visible through the EntityStore lookups of the next snapshot.
 */
TEST(ResourceStore, Store_Add_And_Lookup) {
  ResourceStore store;

  EXPECT_EQ(store.add(service("default", "kuard")), StoreErr::Ok);
  EXPECT_EQ(store.add(Secret{{"default", "tls"}, {{"tls.crt", "c"}, {"tls.key", "k"}}}), StoreErr::Ok);

  auto snap = store.snapshot();
  ASSERT_NE(snap->service(ResourceId{"default", "kuard"}), nullptr);
  EXPECT_EQ(snap->service(ResourceId{"default", "kuard"})->ports[0].port, 8080u);
  ASSERT_NE(snap->secret(ResourceId{"default", "tls"}), nullptr);
  EXPECT_EQ(snap->secret(ResourceId{"other", "tls"}), nullptr);
  EXPECT_EQ(store.version(), 2u);
}

/**
 * @test Store_Add_Duplicate_Fails
 * @brief A second add of the same identity is rejected and does not publish.
 */
TEST(ResourceStore, Store_Add_Duplicate_Fails) {
  ResourceStore store;

  ASSERT_EQ(store.add(service("default", "kuard", 80)), StoreErr::Ok);
  const auto v = store.version();
  EXPECT_EQ(store.add(service("default", "kuard", 81)), StoreErr::Exists);
  EXPECT_EQ(store.version(), v);
  EXPECT_EQ(store.snapshot()->service(ResourceId{"default", "kuard"})->ports[0].port, 80u);
}

/**
 * @test Store_Replace_Content
 * @brief Replace swaps existing content and fails for unknown identities.
 */
TEST(ResourceStore, Store_Replace_Content) {
  ResourceStore store;

  EXPECT_EQ(store.replace(service("default", "kuard")), StoreErr::NotFound);
  ASSERT_EQ(store.add(service("default", "kuard", 80)), StoreErr::Ok);

  auto before = store.snapshot();
  EXPECT_EQ(store.replace(service("default", "kuard", 9000)), StoreErr::Ok);
  auto after = store.snapshot();

  // Old readers keep their snapshot.
  EXPECT_EQ(before->service(ResourceId{"default", "kuard"})->ports[0].port, 80u);
  EXPECT_EQ(after->service(ResourceId{"default", "kuard"})->ports[0].port, 9000u);
}

/**
 * @test Store_Upsert_Idempotent
 * @brief Upserting identical content keeps logical contents but still advances the version.
 */
TEST(ResourceStore, Store_Upsert_Idempotent) {
  ResourceStore store;

  EXPECT_EQ(store.upsert(service("default", "kuard")), StoreErr::Ok);
  auto s1 = store.snapshot();
  EXPECT_EQ(store.upsert(service("default", "kuard")), StoreErr::Ok);
  auto s2 = store.snapshot();

  EXPECT_EQ(*s1, *s2);
  EXPECT_EQ(store.version(), 2u);
}

// --------------------------- Remove / Clear --------------------------------

/**
 * @test Store_Remove
 * @brief Removing erases only the named kind; removing a missing object changes nothing.
 */
TEST(ResourceStore, Store_Remove) {
  ResourceStore store;

  ASSERT_EQ(store.add(service("default", "x")), StoreErr::Ok);
  ASSERT_EQ(store.add(Secret{{"default", "x"}, {}}), StoreErr::Ok);

  EXPECT_TRUE(store.remove<Service>(ResourceId{"default", "x"}));
  EXPECT_EQ(store.snapshot()->service(ResourceId{"default", "x"}), nullptr);
  EXPECT_NE(store.snapshot()->secret(ResourceId{"default", "x"}), nullptr);

  const auto v = store.version();
  EXPECT_FALSE(store.remove<Service>(ResourceId{"default", "x"}));
  EXPECT_EQ(store.version(), v);
}

/**
 * @test Store_ReplaceAll_And_Clear
 * @brief Whole-snapshot swaps publish once each.
 */
TEST(ResourceStore, Store_ReplaceAll_And_Clear) {
  ResourceStore store;

  trellis::source::Snapshot next;
  next.services.emplace(ResourceId{"a", "one"}, service("a", "one"));
  next.services.emplace(ResourceId{"b", "two"}, service("b", "two"));
  store.replace_all(next);
  EXPECT_EQ(store.snapshot()->size(), 2u);
  EXPECT_EQ(store.version(), 1u);

  store.clear();
  EXPECT_EQ(store.snapshot()->size(), 0u);
  EXPECT_EQ(store.version(), 2u);
}

// --------------------------- validation guard -------------------------------

/**
 * @test Store_Validation_Rejections_DoNotPublish
 * @brief Malformed identities are rejected without publishing a new snapshot.
 */
TEST(ResourceStore, Store_Validation_Rejections_DoNotPublish) {
  ResourceStore store;

  EXPECT_EQ(store.add(service("", "kuard")), StoreErr::Invalid);
  EXPECT_EQ(store.add(service("default", "")), StoreErr::Invalid);
  EXPECT_EQ(store.add(service("Default", "kuard")), StoreErr::Invalid);
  EXPECT_EQ(store.add(service("default", "-kuard")), StoreErr::Invalid);
  EXPECT_EQ(store.add(service("default", "ku_ard")), StoreErr::Invalid);
  EXPECT_EQ(store.upsert(service("default", std::string(254, 'a'))), StoreErr::Invalid);
  EXPECT_EQ(store.version(), 0u);
  EXPECT_EQ(store.snapshot()->size(), 0u);

  // Positive control: dots and dashes inside a name are fine.
  EXPECT_EQ(store.add(service("kube-system", "api.v1-svc")), StoreErr::Ok);

  const auto st = store.stats();
  EXPECT_EQ(st.failures, 6u);
  EXPECT_EQ(st.adds, 1u);
}

/**
 * @test Store_Stats_Counters
 * @brief Counters accumulate per operation kind.
 */
TEST(ResourceStore, Store_Stats_Counters) {
  ResourceStore store;

  (void)store.add(service("default", "a"));
  (void)store.add(service("default", "a"));
  (void)store.replace(service("default", "a"));
  (void)store.upsert(service("default", "b"));
  (void)store.remove<Service>(ResourceId{"default", "b"});

  const auto st = store.stats();
  EXPECT_EQ(st.adds, 1u);
  EXPECT_EQ(st.replaces, 1u);
  EXPECT_EQ(st.upserts, 1u);
  EXPECT_EQ(st.removes, 1u);
  EXPECT_EQ(st.failures, 1u);
}

// --------------------------- Change signal ---------------------------------

/**
 * @test Store_Changes_WakeWaiter
 * @brief A waiter blocked on changes() wakes on the next mutation.
 */
TEST(ResourceStore, Store_Changes_WakeWaiter) {
  ResourceStore store;
  std::atomic<std::uint64_t> seen{0};

  std::jthread waiter([&](std::stop_token stop) {
    const auto v = store.changes().wait_past(0, stop);
    if (v) seen.store(*v);
  });

  std::this_thread::sleep_for(20ms);
  ASSERT_EQ(store.upsert(service("default", "kuard")), StoreErr::Ok);
  waiter.join();

  EXPECT_EQ(seen.load(), 1u);
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Store_Concurrency_1W_MR
 * @brief One writer toggles content; readers only observe whole states.
 *
 * This is a lightweight sanity test (not a full linearizability proof).
 */
TEST(ResourceStore, Store_Concurrency_1W_MR) {
  ResourceStore store;

  Service two_ports{{"default", "svc"}, {{"http", 80, ""}, {"https", 443, "tls"}}};
  Service one_port{{"default", "svc"}, {{"grpc", 9090, "h2c"}}};

  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&]{
    for (int i = 0; i < 4000; ++i) {
      if ((i & 1) == 0) (void)store.upsert(two_ports);
      else              (void)store.upsert(one_port);
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&]{
    while (running.load(std::memory_order_relaxed)) {
      auto s = store.snapshot();
      if (!s) continue;
      const auto* svc = s->service(ResourceId{"default", "svc"});
      if (svc != nullptr) {
        // Must be exactly one of the published values; never torn
        if (*svc == two_ports || *svc == one_port) {
          ok_reads.fetch_add(1, std::memory_order_relaxed);
        } else {
          ADD_FAILURE() << "Observed invalid service with " << svc->ports.size() << " ports";
          break;
        }
      }
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn), r3(reader_fn);
  writer.join();
  r1.join(); r2.join(); r3.join();

  EXPECT_EQ(store.version(), 4000u);
}

// --------------------------- YAML loader -----------------------------------

/**
 * @test Loader_MultiDocument
 * @brief Every supported kind is read; unknown kinds are skipped; namespace defaults to "default".
 */
TEST(YamlLoader, Loader_MultiDocument) {
  const std::string text = R"(
kind: IngressRoute
metadata:
  name: root
  namespace: web
spec:
  virtualhost:
    fqdn: example.com
    tls:
      secretName: cert
      minimumProtocolVersion: "1.3"
  routes:
    - match: /
      services:
        - name: kuard
          port: 8080
          weight: 10
          strategy: WeightedLeastRequest
      timeoutPolicy:
        request: 5s
      retryPolicy:
        count: 2
        perTryTimeout: 150ms
      idleTimeout: 30s
      requestHeadersPolicy:
        set:
          - name: x-a
            value: b
        remove: [x-b]
    - match: /api
      delegate:
        name: api
        namespace: teams
---
kind: Service
metadata:
  name: kuard
  namespace: web
spec:
  ports:
    - name: http
      port: 8080
---
kind: Secret
metadata:
  name: cert
spec: {}
data:
  tls.crt: CERT
  tls.key: KEY
---
kind: TLSCertificateDelegation
metadata:
  name: grants
spec:
  delegations:
    - secretName: cert
      targetNamespaces: ["*"]
---
kind: ConfigMap
metadata:
  name: ignored
)";

  const auto snap = trellis::source::load_resources(text);
  ASSERT_TRUE(snap.has_value()) << snap.error();
  EXPECT_EQ(snap->size(), 4u);

  const auto* root = snap->route(ResourceId{"web", "root"});
  ASSERT_NE(root, nullptr);
  ASSERT_TRUE(root->is_root());
  EXPECT_EQ(root->virtual_host->fqdn, "example.com");
  ASSERT_TRUE(root->virtual_host->tls.has_value());
  EXPECT_EQ(root->virtual_host->tls->minimum_protocol_version, "1.3");
  ASSERT_EQ(root->routes.size(), 2u);

  const auto& r0 = root->routes[0];
  ASSERT_EQ(r0.services.size(), 1u);
  EXPECT_EQ(r0.services[0].weight, 10u);
  EXPECT_EQ(r0.services[0].strategy, "WeightedLeastRequest");
  EXPECT_EQ(r0.timeout_policy->request, "5s");
  EXPECT_EQ(r0.retry_policy->count, 2u);
  EXPECT_EQ(r0.retry_policy->per_try_timeout, "150ms");
  EXPECT_EQ(r0.idle_timeout, trellis::util::Duration{30s});
  ASSERT_TRUE(r0.request_headers_policy.has_value());
  EXPECT_EQ(r0.request_headers_policy->remove, (std::vector<std::string>{"x-b"}));

  ASSERT_TRUE(root->routes[1].delegate.has_value());
  EXPECT_EQ(root->routes[1].delegate->ns, "teams");

  const auto* secret = snap->secret(ResourceId{"default", "cert"});
  ASSERT_NE(secret, nullptr);
  EXPECT_EQ(secret->data.at("tls.crt"), "CERT");

  EXPECT_TRUE(snap->delegation_permitted(ResourceId{"default", "cert"}, "web"));
  EXPECT_FALSE(snap->delegation_permitted(ResourceId{"default", "other"}, "web"));
}

/**
 * @test Loader_Errors
 * @brief Missing names, bad durations and duplicates fail the load with the document index;
 *        syntax errors report the parser position.
 */
TEST(YamlLoader, Loader_Errors) {
  const auto missing_name = trellis::source::load_resources("kind: Service\nmetadata: {}\n");
  ASSERT_FALSE(missing_name.has_value());
  EXPECT_EQ(missing_name.error(), "document 1: metadata.name is required");

  const auto dup = trellis::source::load_resources(
      "kind: Service\nmetadata: {name: a}\n---\nkind: Service\nmetadata: {name: a}\n");
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error(), "document 2: duplicate Service default/a");

  const auto bad_duration = trellis::source::load_resources(
      "kind: IngressRoute\nmetadata: {name: r}\nspec:\n  routes:\n    - match: /\n      idleTimeout: soon\n");
  ASSERT_FALSE(bad_duration.has_value());
  EXPECT_EQ(bad_duration.error().rfind("document 1: default/r route \"/\".idleTimeout: ", 0), 0u);

  const std::string huge_idle = "kind: IngressRoute\nmetadata: {name: r}\nspec:\n  routes:\n    - match: /\n"
                                "      idleTimeout: \"" + std::string(400, '9') + "s\"\n";
  const auto huge = trellis::source::load_resources(huge_idle);
  ASSERT_FALSE(huge.has_value());
  EXPECT_EQ(huge.error().rfind("document 1: default/r route \"/\".idleTimeout: ", 0), 0u);
  EXPECT_NE(huge.error().find("out of range"), std::string::npos);

  const auto syntax = trellis::source::load_resources("kind: Service\n---\nkind: [unterminated\n");
  ASSERT_FALSE(syntax.has_value());
  EXPECT_EQ(syntax.error().rfind("syntax error at line ", 0), 0u) << syntax.error();

  const auto scalar = trellis::source::load_resources("just a string\n");
  ASSERT_FALSE(scalar.has_value());
  EXPECT_EQ(scalar.error(), "document 1: document is not a mapping");

  const auto missing_file = trellis::source::load_resources_file("/nonexistent/resources.yaml");
  ASSERT_FALSE(missing_file.has_value());
  EXPECT_EQ(missing_file.error(), "cannot open /nonexistent/resources.yaml");
}

/**
 * @test Loader_SubMillisecondIdleTimeout
 * @brief A positive idle timeout below 1ms is kept positive and the route builds.
 */
TEST(YamlLoader, Loader_SubMillisecondIdleTimeout) {
  const auto snap = trellis::source::load_resources(R"(
kind: IngressRoute
metadata: {name: r}
spec:
  routes:
    - match: /
      idleTimeout: 500us
)");
  ASSERT_TRUE(snap.has_value()) << snap.error();
  const auto* r = snap->route(ResourceId{"default", "r"});
  ASSERT_NE(r, nullptr);
  ASSERT_EQ(r->routes.size(), 1u);
  EXPECT_EQ(r->routes[0].idle_timeout, trellis::util::Duration{1ms});
}

/**
 * @test Loader_EmptyStream
 * @brief An empty stream yields an empty snapshot.
 */
TEST(YamlLoader, Loader_EmptyStream) {
  const auto snap = trellis::source::load_resources("");
  ASSERT_TRUE(snap.has_value());
  EXPECT_EQ(snap->size(), 0u);
}
