#pragma once
/**
 * @file listener.hpp
 * @brief Listener projection: the insecure and secure listeners and their filter chains.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "trellis/config/constants.hpp"
#include "trellis/dag/graph.hpp"
#include "trellis/xds/types.hpp"

namespace trellis::xds {

/** @struct ListenerVisitorConfig
 *  @brief Addresses, logging and TLS policy for the projected listeners.
 */
struct ListenerVisitorConfig {
    std::string   http_address{config::constants::DEFAULT_HTTP_ADDRESS};
    std::uint32_t http_port{config::constants::DEFAULT_HTTP_PORT};
    std::string   http_access_log{config::constants::DEFAULT_HTTP_ACCESS_LOG};
    std::string   https_address{config::constants::DEFAULT_HTTPS_ADDRESS};
    std::uint32_t https_port{config::constants::DEFAULT_HTTPS_PORT};
    std::string   https_access_log{config::constants::DEFAULT_HTTPS_ACCESS_LOG};

    /// Expect a PROXY protocol preamble on every listener.
    bool use_proxy_protocol{false};
    /// Floor for every TLS context; never below TLS 1.1.
    dag::TlsVersion minimum_tls_version{dag::TlsVersion::V1_1};
    /// Certificate served on a catch-all chain to clients that send no SNI.
    std::optional<source::ResourceId> default_certificate;

    AccessLogFormat access_log_format{AccessLogFormat::Envoy};
    /// JSON access log fields; empty means default_access_log_fields().
    std::vector<std::string> access_log_fields;
    /// Request timeout for every connection manager; negative values disable it.
    util::Duration request_timeout{0};
    /// Source address filter attached to every listener.
    IpAllowDenyConfig ip_filter;

    dag::TlsVersion min_proto_version() const noexcept;
    util::Duration effective_request_timeout() const noexcept;
    std::vector<AccessLog> insecure_access_log() const;
    std::vector<AccessLog> secure_access_log() const;

    bool operator==(const ListenerVisitorConfig&) const = default;
};

/// Fields written by the JSON access log when none are configured.
const std::vector<std::string>& default_access_log_fields();

/**
 * @brief Project the graph into listeners keyed by name.
 *
 * The insecure listener exists only if an insecure virtual host was visited;
 * the secure listener is dropped when it ends up with no filter chains.
 */
std::map<std::string, Listener> visit_listeners(const dag::Graph& g, const ListenerVisitorConfig& cfg);

} // namespace trellis::xds
