#pragma once
/**
 * @file ip_filter.hpp
 * @brief Loads the source address allow/deny list attached to every listener.
 *
 * The file is JSON or YAML:
 * @code
 * { "allow_cidrs": [ { "address_prefix": "10.0.0.0", "prefix_len": 8 } ],
 *   "deny_cidrs":  [ { "address_prefix": "10.1.0.0", "prefix_len": 16 } ] }
 * @endcode
 */

#include <string>

#include "trellis/compat/expected.hpp"
#include "trellis/config/error.hpp"
#include "trellis/xds/types.hpp"

namespace trellis::config {

/// Parse a CIDR list document held in memory.
trellis_detail::expected<xds::IpAllowDenyConfig, ConfigError> parse_ip_filter(const std::string& text);

/// Read and parse the CIDR list at @p path.
trellis_detail::expected<xds::IpAllowDenyConfig, ConfigError> load_ip_filter(const std::string& path);

/// True if @p prefix is an IPv4/IPv6 address and @p len fits its family.
bool valid_cidr(const std::string& prefix, std::uint32_t len) noexcept;

} // namespace trellis::config
