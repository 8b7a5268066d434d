/**
 * @file build_bench.cpp
 * @brief Microbenchmark for a full rebuild pass (graph build + projection).
 *
 * Generates a synthetic resource set of N roots, each with a TLS virtual host,
 * a few routes and one delegated fragment, and measures:
 *   1) Builder::build() alone
 *   2) build() plus the four projection visitors
 *
 * Reports: passes/sec and ms per pass.
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "trellis/dag/builder.hpp"
#include "trellis/source/entity_store.hpp"
#include "trellis/xds/cluster.hpp"
#include "trellis/xds/listener.hpp"
#include "trellis/xds/route.hpp"
#include "trellis/xds/secret.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;             // e.g., "build@100"
  std::size_t passes = 0;       // number of passes timed
  double      seconds = 0.0;    // wall time
  double      passes_per_s = 0.0;
  double      ms_per_pass  = 0.0;
};

// -----------------------------------------------------------------------------
// Synthetic resources
// -----------------------------------------------------------------------------

trellis::source::Snapshot make_snapshot(std::size_t roots) {
  using namespace trellis::source;
  Snapshot snap;
  for (std::size_t i = 0; i < roots; ++i) {
    const std::string ns = "team" + std::to_string(i % 16);
    const std::string app = "app" + std::to_string(i);

    snap.services.emplace(ResourceId{ns, app}, Service{{ns, app}, {{"http", 8080, ""}}});
    snap.services.emplace(ResourceId{ns, app + "-api"}, Service{{ns, app + "-api"}, {{"grpc", 9090, "h2c"}}});
    snap.secrets.emplace(ResourceId{ns, app + "-tls"},
                         Secret{{ns, app + "-tls"}, {{"tls.crt", "cert-" + app}, {"tls.key", "key-" + app}}});

    RouteResource root;
    root.id = {ns, app};
    root.virtual_host = VirtualHostSpec{app + ".example.com", TlsSpec{app + "-tls", "1.2", "", false, false, {}}};
    RouteSpec web;
    web.match = "/";
    web.services.push_back(ServiceRef{app, 8080, 90, "", {}, {}, {}});
    web.services.push_back(ServiceRef{app + "-api", 9090, 10, "", {}, {}, {}});
    root.routes.push_back(web);
    RouteSpec api;
    api.match = "/api";
    api.delegate = DelegateRef{app + "-api", ""};
    root.routes.push_back(api);
    snap.route_resources.emplace(root.id, root);

    RouteResource child;
    child.id = {ns, app + "-api"};
    for (const char* p : {"/api", "/api/v1", "/api/v2"}) {
      RouteSpec r;
      r.match = p;
      r.services.push_back(ServiceRef{app + "-api", 9090, 0, "WeightedLeastRequest", {}, {}, {}});
      r.retry_policy = RetryPolicySpec{3, "2s"};
      child.routes.push_back(r);
    }
    snap.route_resources.emplace(child.id, child);
  }
  return snap;
}

// -----------------------------------------------------------------------------
// Runner
// -----------------------------------------------------------------------------

template <class Fn>
Result run_one(std::string name, std::size_t passes, Fn&& pass) {
  const auto t_start = clock::now();
  for (std::size_t i = 0; i < passes; ++i) pass();
  const auto t_end = clock::now();

  const double seconds = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  Result r;
  r.name         = std::move(name);
  r.passes       = passes;
  r.seconds      = seconds;
  r.passes_per_s = (seconds > 0.0) ? (static_cast<double>(passes) / seconds) : 0.0;
  r.ms_per_pass  = (passes > 0) ? 1e3 * seconds / static_cast<double>(passes) : 0.0;
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(18) << r.name
            << "  passes=" << std::setw(6) << r.passes
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  passes/s=" << std::setw(10) << r.passes_per_s
            << "  ms/pass=" << std::setw(10) << r.ms_per_pass
            << '\n';
}

} // namespace bench

int main() {
  using bench::print;
  using bench::run_one;

  constexpr std::size_t kPasses = 20;
  const std::vector<std::size_t> sizes = {100, 1000};

  const trellis::dag::Builder builder{};
  const trellis::xds::ListenerVisitorConfig listener_cfg{};

  std::cout << "Rebuild pass microbenchmark (roots with TLS + one delegate each)\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto n : sizes) {
    const auto snap = bench::make_snapshot(n);
    std::size_t sink = 0;

    print(run_one("build@" + std::to_string(n), kPasses, [&] {
      sink += builder.build(snap).statuses.size();
    }));

    print(run_one("build+project@" + std::to_string(n), kPasses, [&] {
      const auto result = builder.build(snap);
      sink += trellis::xds::visit_listeners(result.graph, listener_cfg).size();
      sink += trellis::xds::visit_routes(result.graph).size();
      sink += trellis::xds::visit_clusters(result.graph).size();
      sink += trellis::xds::visit_secrets(result.graph).size();
    }));

    if (sink == 0) std::cout << "(no output produced)\n";
  }

  std::cout << std::flush;
  return 0;
}
