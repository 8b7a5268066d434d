#pragma once
/**
 * @file secret.hpp
 * @brief Secret projection: TLS certificates referenced by secure hosts.
 */

#include <map>
#include <string>

#include "trellis/dag/graph.hpp"
#include "trellis/xds/types.hpp"

namespace trellis::xds {

/// Every certificate/key pair reachable from a valid host, keyed by secret_name().
/// CA-only secrets are inlined into validation contexts and are not emitted.
std::map<std::string, Secret> visit_secrets(const dag::Graph& g);

} // namespace trellis::xds
