#pragma once
/**
 * @file rebuilder.hpp
 * @brief One rebuild pass (build, project, publish) and the loop that repeats it on store changes.
 *
 * Concurrency model:
 *   - A single thread owns the Rebuilder and runs passes back to back.
 *   - Each pass reads one immutable store snapshot, so the graph never mixes versions.
 *   - Caches are updated one after another (listeners, routes, clusters, secrets);
 *     readers of different caches may briefly observe different passes.
 */

#include <cstdint>
#include <stop_token>

#include "trellis/cache/cache_set.hpp"
#include "trellis/config/config_loader.hpp"
#include "trellis/dag/builder.hpp"
#include "trellis/dag/status.hpp"
#include "trellis/obs/observability.hpp"
#include "trellis/source/resource_store.hpp"

namespace trellis::pipeline {

class Rebuilder final {
public:
    /**
     * @param cfg      Builder and visitor settings (copied).
     * @param caches   Destination of every pass; must outlive the Rebuilder.
     * @param observer Receives one event per pass; must outlive the Rebuilder.
     * @param status   Optional sink for per-resource status records.
     */
    Rebuilder(const config::Config& cfg, cache::CacheSet& caches, obs::Observer& observer,
              dag::StatusWriter* status = nullptr);

    /// Build @p snap, project it and replace every cache's contents.
    obs::BuildEvent rebuild(const source::EntityStore& snap, std::uint64_t store_version = 0);

    /**
     * @brief Rebuild now, then again after every store change, until @p stop fires.
     * @return Number of passes run.
     */
    std::uint64_t run(const source::ResourceStore& store, std::stop_token stop);

    /// Result of the most recent pass (statuses are kept for inspection).
    const dag::BuildResult& last_result() const noexcept { return last_; }

private:
    dag::Builder builder_;
    xds::ListenerVisitorConfig listener_cfg_;
    xds::RouteVisitorConfig route_cfg_;
    cache::CacheSet& caches_;
    obs::Observer& observer_;
    dag::StatusWriter* status_;
    dag::BuildResult last_;
};

} // namespace trellis::pipeline
