#pragma once
/**
 * @file types.hpp
 * @brief Typed proxy configuration objects produced by the projection visitors.
 *
 * These are plain values modelled on the proxy's listener, route, cluster and
 * secret resources. Every top-level object carries a `name`, which is the key
 * the snapshot caches index by. Equality is structural so visitors can group
 * identical TLS contexts and tests can compare whole snapshots.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "trellis/config/constants.hpp"
#include "trellis/dag/graph.hpp"
#include "trellis/util/duration.hpp"

namespace trellis::xds {

// -----------------------------------------------------------------------------
// Common
// -----------------------------------------------------------------------------

struct SocketAddress {
    std::string   address;
    std::uint32_t port{0};
    bool          ipv4_compat{false};  ///< set for the "::" wildcard

    bool operator==(const SocketAddress&) const = default;
};

enum class AccessLogFormat : std::uint8_t { Envoy, Json };

/// File access log. json_fields is only used by the Json format.
struct AccessLog {
    std::string              path;
    AccessLogFormat          format{AccessLogFormat::Envoy};
    std::vector<std::string> json_fields;

    bool operator==(const AccessLog&) const = default;
};

struct HeaderValueOption {
    std::string key;
    std::string value;
    bool        append{true};

    bool operator==(const HeaderValueOption&) const = default;
};

// -----------------------------------------------------------------------------
// CIDR allow/deny
// -----------------------------------------------------------------------------

struct CidrRange {
    std::string   address_prefix;
    std::uint32_t prefix_len{0};

    bool operator==(const CidrRange&) const = default;
};

/// Source address filter shared by every listener. Empty lists mean "no filter".
struct IpAllowDenyConfig {
    std::vector<CidrRange> allow_cidrs;
    std::vector<CidrRange> deny_cidrs;

    bool empty() const noexcept { return allow_cidrs.empty() && deny_cidrs.empty(); }

    bool operator==(const IpAllowDenyConfig&) const = default;
};

// -----------------------------------------------------------------------------
// TLS
// -----------------------------------------------------------------------------

struct TlsParameters {
    dag::TlsVersion min_version{dag::TlsVersion::V1_1};
    dag::TlsVersion max_version{dag::TlsVersion::V1_3};
    std::vector<std::string> cipher_suites;

    bool operator==(const TlsParameters&) const = default;
};

/// CA material inlined into the context, plus an optional SAN to match.
struct CertificateValidationContext {
    std::string trusted_ca;
    std::string subject_name;

    bool operator==(const CertificateValidationContext&) const = default;
};

/// Server-side TLS. Certificates are referenced by secret name (SDS).
struct DownstreamTlsContext {
    TlsParameters params;
    std::vector<std::string> certificate_secrets;
    std::vector<std::string> alpn_protocols;
    std::optional<CertificateValidationContext> validation;
    bool require_client_certificate{false};

    bool operator==(const DownstreamTlsContext&) const = default;
};

struct UpstreamTlsContext {
    std::string sni;
    std::vector<std::string> alpn_protocols;
    std::optional<CertificateValidationContext> validation;

    bool operator==(const UpstreamTlsContext&) const = default;
};

// -----------------------------------------------------------------------------
// HTTP filters
// -----------------------------------------------------------------------------

struct HealthCheckFilter {
    std::string path;

    bool operator==(const HealthCheckFilter&) const = default;
};

struct HeaderSizeFilter {
    std::uint32_t max_bytes{0};

    bool operator==(const HeaderSizeFilter&) const = default;
};

struct RouterFilter {
    bool suppress_envoy_headers{true};

    bool operator==(const RouterFilter&) const = default;
};

/// The allow/deny HTTP filter takes its CIDRs from the listener filter.
struct IpAllowDenyHttpFilter {
    bool operator==(const IpAllowDenyHttpFilter&) const = default;
};

using HttpFilterConfig = std::variant<IpAllowDenyHttpFilter, HealthCheckFilter, HeaderSizeFilter, RouterFilter>;

struct HttpFilter {
    std::string      name;
    HttpFilterConfig config;

    bool operator==(const HttpFilter&) const = default;
};

// -----------------------------------------------------------------------------
// Network filters
// -----------------------------------------------------------------------------

/**
 * @struct HttpConnectionManagerConfig
 * @brief Every option of the HTTP connection manager with its default.
 */
struct HttpConnectionManagerConfig {
    std::string route_config_name;
    std::string stat_prefix;                       ///< empty means route_config_name
    std::vector<AccessLog> access_logs;
    util::Duration request_timeout{0};             ///< 0 disables the timeout
    bool default_filters{true};                    ///< ip_allow_deny, health check, header size, router
    std::uint32_t max_request_headers_kb{config::constants::HCM_MAX_REQUEST_HEADERS_KB};
    std::string server_name{config::constants::HCM_SERVER_NAME};
    bool generate_request_id{false};
    bool use_remote_address{true};
    bool normalize_path{true};
    bool merge_slashes{true};
    bool accept_http_10{true};
    bool tracing{true};

    bool operator==(const HttpConnectionManagerConfig&) const = default;
};

struct HttpConnectionManager {
    std::string route_config_name;
    std::string stat_prefix;
    std::vector<AccessLog> access_logs;
    util::Duration request_timeout{0};
    std::vector<HttpFilter> http_filters;
    std::uint32_t max_request_headers_kb{0};
    std::string server_name;
    bool generate_request_id{false};
    bool use_remote_address{false};
    bool normalize_path{false};
    bool merge_slashes{false};
    bool accept_http_10{false};
    bool tracing{false};

    bool operator==(const HttpConnectionManager&) const = default;
};

/// Materialise a connection manager from its config.
HttpConnectionManager make_http_connection_manager(const HttpConnectionManagerConfig& cfg);

/// The default HTTP filter chain in order.
std::vector<HttpFilter> default_http_filters();

struct TcpClusterWeight {
    std::string   name;
    std::uint32_t weight{0};

    bool operator==(const TcpClusterWeight&) const = default;
};

struct TcpProxyFilter {
    std::string stat_prefix;
    std::string cluster;                          ///< single upstream
    std::vector<TcpClusterWeight> weighted_clusters; ///< several upstreams
    std::vector<AccessLog> access_logs;
    util::Duration idle_timeout{0};

    bool operator==(const TcpProxyFilter&) const = default;
};

using NetworkFilter = std::variant<HttpConnectionManager, TcpProxyFilter>;

struct Filter {
    std::string   name;
    NetworkFilter config;

    bool is_tcp_proxy() const noexcept { return std::holds_alternative<TcpProxyFilter>(config); }

    bool operator==(const Filter&) const = default;
};

// -----------------------------------------------------------------------------
// Listeners
// -----------------------------------------------------------------------------

enum class ListenerFilterKind : std::uint8_t { ProxyProtocol, TlsInspector, IpAllowDeny };

struct ListenerFilter {
    std::string        name;
    ListenerFilterKind kind{ListenerFilterKind::TlsInspector};
    IpAllowDenyConfig  ip_allow_deny;  ///< only for IpAllowDeny

    bool operator==(const ListenerFilter&) const = default;
};

struct FilterChainMatch {
    std::vector<std::string> server_names;
    std::string transport_protocol;

    bool operator==(const FilterChainMatch&) const = default;
};

struct FilterChain {
    std::string name;
    FilterChainMatch match;
    std::optional<DownstreamTlsContext> tls;
    std::vector<Filter> filters;

    bool has_tcp_proxy() const noexcept;

    bool operator==(const FilterChain&) const = default;
};

struct Listener {
    std::string name;
    SocketAddress address;
    std::vector<ListenerFilter> listener_filters;
    std::vector<FilterChain> filter_chains;

    bool operator==(const Listener&) const = default;
};

// -----------------------------------------------------------------------------
// Routes
// -----------------------------------------------------------------------------

struct HeaderMatcher {
    std::string name;
    std::string value;
    dag::HeaderMatchType type{dag::HeaderMatchType::Present};
    bool invert{false};

    bool operator==(const HeaderMatcher&) const = default;
};

struct RouteMatch {
    std::string prefix;
    std::vector<HeaderMatcher> headers;

    bool operator==(const RouteMatch&) const = default;
};

struct WeightedCluster {
    std::string   name;
    std::uint32_t weight{0};
    std::vector<HeaderValueOption> request_headers_to_add;
    std::vector<std::string>       request_headers_to_remove;
    std::vector<HeaderValueOption> response_headers_to_add;
    std::vector<std::string>       response_headers_to_remove;

    bool operator==(const WeightedCluster&) const = default;
};

struct RetryPolicy {
    std::string   retry_on;
    std::uint32_t num_retries{0};
    std::optional<util::Duration> per_try_timeout;

    bool operator==(const RetryPolicy&) const = default;
};

struct RouteAction {
    std::string cluster;                           ///< single upstream
    std::vector<WeightedCluster> weighted_clusters;///< several upstreams
    std::uint32_t total_weight{0};
    std::optional<util::Duration> timeout;         ///< 0 means disabled
    std::optional<util::Duration> idle_timeout;
    std::optional<RetryPolicy> retry_policy;
    std::vector<dag::HashPolicy> hash_policy;
    bool websocket{false};
    std::string prefix_rewrite;
    std::string host_rewrite;
    std::vector<HeaderValueOption> request_headers_to_add;

    bool operator==(const RouteAction&) const = default;
};

struct RedirectAction {
    bool https_redirect{true};

    bool operator==(const RedirectAction&) const = default;
};

struct Route {
    RouteMatch match;
    std::variant<RouteAction, RedirectAction> action;
    std::vector<HeaderValueOption> request_headers_to_add;
    std::vector<std::string>       request_headers_to_remove;
    std::vector<HeaderValueOption> response_headers_to_add;
    std::vector<std::string>       response_headers_to_remove;
    std::optional<dag::TracingPolicy> tracing;

    bool operator==(const Route&) const = default;
};

struct VirtualHost {
    std::string name;
    std::vector<std::string> domains;
    std::vector<Route> routes;

    bool operator==(const VirtualHost&) const = default;
};

struct RouteConfiguration {
    std::string name;
    std::vector<VirtualHost> virtual_hosts;

    bool operator==(const RouteConfiguration&) const = default;
};

// -----------------------------------------------------------------------------
// Clusters / secrets
// -----------------------------------------------------------------------------

enum class LbPolicy : std::uint8_t { RoundRobin, LeastRequest, Random, RingHash };

struct HealthCheck {
    util::Duration timeout{0};
    util::Duration interval{0};
    std::uint32_t unhealthy_threshold{0};
    std::uint32_t healthy_threshold{0};
    std::string path;
    std::string host;

    bool operator==(const HealthCheck&) const = default;
};

struct Cluster {
    std::string name;
    std::string alt_stat_name;
    std::string eds_service_name;
    util::Duration connect_timeout{0};
    LbPolicy lb_policy{LbPolicy::RoundRobin};
    std::optional<HealthCheck> health_check;
    std::optional<UpstreamTlsContext> tls;
    bool http2{false};
    std::optional<util::Duration> idle_timeout;

    bool operator==(const Cluster&) const = default;
};

struct Secret {
    std::string name;
    std::string certificate_chain;
    std::string private_key;

    bool operator==(const Secret&) const = default;
};

} // namespace trellis::xds
