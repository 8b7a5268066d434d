#pragma once
/**
 * @file route.hpp
 * @brief Route projection: one route configuration per listener plus the fallback table.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "trellis/config/constants.hpp"
#include "trellis/dag/graph.hpp"
#include "trellis/xds/types.hpp"

namespace trellis::xds {

/** @struct RouteVisitorConfig
 *  @brief Listener ports advertised in each virtual host's domain list.
 */
struct RouteVisitorConfig {
    std::uint32_t http_port{config::constants::DEFAULT_HTTP_PORT};
    std::uint32_t https_port{config::constants::DEFAULT_HTTPS_PORT};

    bool operator==(const RouteVisitorConfig&) const = default;
};

/**
 * @brief Precedence order used inside a virtual host.
 *
 * Lexicographically greater prefixes first (so longer prefixes beat their own
 * prefixes), then more header conditions first, then header conditions
 * compared pairwise by (name, value) ascending.
 */
bool route_precedes(const Route& a, const Route& b);

/// Stable sort by route_precedes(); ties keep insertion order.
void sort_routes(std::vector<Route>& routes);

/// Build the weighted cluster list: all-zero weights become 1 each; sorted by name then weight.
std::vector<WeightedCluster> weighted_clusters(const std::vector<dag::Cluster>& clusters, std::uint32_t& total_weight);

/**
 * @brief Project the graph into route configurations keyed by name.
 *
 * ingress_http and ingress_https are always present; ingress_fallbackcert is
 * present when a secure host enabled the fallback certificate.
 */
std::map<std::string, RouteConfiguration> visit_routes(const dag::Graph& g, const RouteVisitorConfig& cfg = {});

} // namespace trellis::xds
