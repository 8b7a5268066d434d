#pragma once
/**
 * @file cluster.hpp
 * @brief Cluster projection: one cluster per distinct upstream binding.
 */

#include <map>
#include <string>
#include <string_view>

#include "trellis/dag/graph.hpp"
#include "trellis/xds/types.hpp"

namespace trellis::xds {

/// Map a resource load balancing strategy name onto the proxy's policy.
LbPolicy lb_policy(std::string_view strategy) noexcept;

/// Convert one graph cluster.
Cluster make_cluster(const dag::Cluster& c);

/// Every cluster reachable from a valid host, deduplicated by generated name.
std::map<std::string, Cluster> visit_clusters(const dag::Graph& g);

} // namespace trellis::xds
