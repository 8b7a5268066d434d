#pragma once
/**
 * @file cache_set.hpp
 * @brief The four proxy object caches served to the streaming layer.
 */

#include <string>
#include <utility>

#include "trellis/cache/snapshot_cache.hpp"
#include "trellis/config/constants.hpp"
#include "trellis/xds/types.hpp"

namespace trellis::cache {

using ListenerCache = SnapshotCache<xds::Listener>;
using RouteCache    = SnapshotCache<xds::RouteConfiguration>;
using ClusterCache  = SnapshotCache<xds::Cluster>;
using SecretCache   = SnapshotCache<xds::Secret>;

/** @struct CacheSet
 *  @brief One cache per object type, each with its own lock and version.
 */
struct CacheSet {
    ListenerCache listeners;
    RouteCache    routes;
    ClusterCache  clusters;
    SecretCache   secrets;

    explicit CacheSet(ListenerCache::Map static_listeners = {}, ClusterCache::Map static_clusters = {})
        : listeners(std::string{config::constants::LISTENER_TYPE_URL}, std::move(static_listeners)),
          routes(std::string{config::constants::ROUTE_TYPE_URL}),
          clusters(std::string{config::constants::CLUSTER_TYPE_URL}, std::move(static_clusters)),
          secrets(std::string{config::constants::SECRET_TYPE_URL}) {}
};

} // namespace trellis::cache
