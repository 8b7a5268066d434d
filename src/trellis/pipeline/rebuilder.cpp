/**
 * @file rebuilder.cpp
 * @brief Rebuild pass and change-driven loop.
 */
#include "trellis/pipeline/rebuilder.hpp"

#include <chrono>

#include "trellis/obs/log.hpp"
#include "trellis/xds/cluster.hpp"
#include "trellis/xds/listener.hpp"
#include "trellis/xds/route.hpp"
#include "trellis/xds/secret.hpp"

namespace trellis::pipeline {

Rebuilder::Rebuilder(const config::Config& cfg, cache::CacheSet& caches, obs::Observer& observer,
                     dag::StatusWriter* status)
    : builder_(cfg.builder), listener_cfg_(cfg.listeners), route_cfg_(cfg.routes),
      caches_(caches), observer_(observer), status_(status) {}

obs::BuildEvent Rebuilder::rebuild(const source::EntityStore& snap, std::uint64_t store_version) {
    const auto start = std::chrono::steady_clock::now();

    auto result = builder_.build(snap);
    auto listeners = xds::visit_listeners(result.graph, listener_cfg_);
    auto routes = xds::visit_routes(result.graph, route_cfg_);
    auto clusters = xds::visit_clusters(result.graph);
    auto secrets = xds::visit_secrets(result.graph);

    obs::BuildEvent e;
    e.store_version = store_version;
    e.virtual_hosts = result.graph.virtual_host_count();
    e.secure_hosts = result.graph.secure_virtual_host_count();
    e.valid = result.count(dag::StatusKind::Valid);
    e.invalid = result.count(dag::StatusKind::Invalid);
    e.orphaned = result.count(dag::StatusKind::Orphaned);
    e.listeners = listeners.size();
    e.route_configs = routes.size();
    e.clusters = clusters.size();
    e.secrets = secrets.size();

    caches_.listeners.update(std::move(listeners));
    caches_.routes.update(std::move(routes));
    caches_.clusters.update(std::move(clusters));
    caches_.secrets.update(std::move(secrets));

    if (status_ != nullptr) result.publish(*status_);
    last_ = std::move(result);

    e.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    observer_.record(e);
    return e;
}

std::uint64_t Rebuilder::run(const source::ResourceStore& store, std::stop_token stop) {
    std::uint64_t passes = 0;
    while (!stop.stop_requested()) {
        // Read the version before the snapshot so a concurrent write always triggers another pass.
        const auto seen = store.version();
        const auto snap = store.snapshot();
        rebuild(*snap, seen);
        ++passes;

        const auto next = store.changes().wait_past(seen, stop);
        if (!next) break;
    }
    obs::logger()->info("rebuild loop stopped after {} passes", passes);
    return passes;
}

} // namespace trellis::pipeline
