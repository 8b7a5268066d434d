#pragma once
/**
 * @file naming.hpp
 * @brief Stable, length-bounded names for generated proxy objects.
 *
 * Names embed a short SHA-1 of the settings that distinguish otherwise
 * identical objects, so two clusters for the same service port with different
 * policies never collide while equal ones always share a name.
 */

#include <string>
#include <string_view>

#include "trellis/dag/graph.hpp"

namespace trellis::xds {

/// "namespace/name/port/<hash>", shortened to fit the name limit.
std::string cluster_name(const dag::Cluster& c);

/// "namespace_name_port", for stats.
std::string cluster_stat_name(const dag::Service& s);

/// "namespace/name/port-name" (or port number when unnamed), the endpoint set this cluster consumes.
std::string eds_service_name(const dag::Service& s);

/// "namespace/name/<hash of material>", shortened to fit the name limit.
std::string secret_name(const dag::Secret& s);

/// Route virtual host name for an FQDN.
std::string vhost_name(std::string_view fqdn);

} // namespace trellis::xds
