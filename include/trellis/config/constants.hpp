#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the control plane.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (YAML) in production deployments.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace trellis::config::constants {

// =====================
// Listener / route configuration names (externally visible in proxy stats)
// =====================
inline constexpr std::string_view HTTP_LISTENER_NAME         = "ingress_http";
inline constexpr std::string_view HTTPS_LISTENER_NAME        = "ingress_https";
inline constexpr std::string_view FALLBACK_ROUTE_CONFIG_NAME = "ingress_fallbackcert";
inline constexpr std::string_view FALLBACK_FILTER_CHAIN_NAME = "fallback-certificate";

// =====================
// Listener Defaults
// =====================
inline constexpr std::string_view DEFAULT_HTTP_ADDRESS   = "0.0.0.0";
inline constexpr int              DEFAULT_HTTP_PORT      = 8080;
inline constexpr std::string_view DEFAULT_HTTP_ACCESS_LOG  = "/dev/stdout";
inline constexpr std::string_view DEFAULT_HTTPS_ADDRESS  = "0.0.0.0";
inline constexpr int              DEFAULT_HTTPS_PORT     = 8443;
inline constexpr std::string_view DEFAULT_HTTPS_ACCESS_LOG = "/dev/stdout";
inline constexpr std::string_view DEFAULT_ACCESS_LOG_TYPE  = "envoy";

// =====================
// HTTP connection manager defaults
// =====================
inline constexpr std::uint32_t    HCM_MAX_REQUEST_HEADERS_KB = 64;
inline constexpr std::string_view HCM_SERVER_NAME            = "trellis";
inline constexpr std::string_view HEALTH_CHECK_PATH          = "/envoy_health_94eaa5a6ba44fc17d1da432d4a1e2d73";
inline constexpr std::uint32_t    HEADER_SIZE_MAX_BYTES      = 64 * 1024;

// =====================
// Route / cluster policy limits
// =====================
/// Idle timeouts above this value are clamped.
inline constexpr std::chrono::milliseconds MAX_IDLE_TIMEOUT{std::chrono::hours(1)};
/// Tracing sample rates are percentages.
inline constexpr int MAX_TRACING_SAMPLING = 100;
/// Default retry trigger when a retry policy is present.
inline constexpr std::string_view DEFAULT_RETRY_ON = "5xx";
/// Idle timeout for raw TCP proxying (2.5h).
inline constexpr std::chrono::seconds TCP_PROXY_IDLE_TIMEOUT{9001};
/// Upstream connect timeout for every cluster.
inline constexpr std::chrono::milliseconds CLUSTER_CONNECT_TIMEOUT{250};
/// Weights of one route or tcp proxy must sum to a 32-bit value.
inline constexpr std::uint64_t MAX_TOTAL_WEIGHT = 0xFFFF'FFFFu;
inline constexpr std::uint32_t MIN_PORT = 1;
inline constexpr std::uint32_t MAX_PORT = 65535;

// =====================
// Upstream health check defaults (used when a field is left at zero)
// =====================
inline constexpr std::chrono::milliseconds HC_DEFAULT_TIMEOUT{std::chrono::seconds(2)};
inline constexpr std::chrono::milliseconds HC_DEFAULT_INTERVAL{std::chrono::seconds(10)};
inline constexpr std::uint32_t    HC_DEFAULT_UNHEALTHY_THRESHOLD = 3;
inline constexpr std::uint32_t    HC_DEFAULT_HEALTHY_THRESHOLD   = 2;
inline constexpr std::string_view HC_DEFAULT_HOST                = "trellis-envoy-healthcheck";

// =====================
// Well-known filter names
// =====================
inline constexpr std::string_view HTTP_CONNECTION_MANAGER_FILTER = "envoy.http_connection_manager";
inline constexpr std::string_view TCP_PROXY_FILTER               = "envoy.tcp_proxy";
inline constexpr std::string_view TLS_INSPECTOR_FILTER           = "envoy.listener.tls_inspector";
inline constexpr std::string_view PROXY_PROTOCOL_FILTER          = "envoy.listener.proxy_protocol";
inline constexpr std::string_view IP_ALLOW_DENY_LISTENER_FILTER  = "envoy.listener.ip_allow_deny";
inline constexpr std::string_view IP_ALLOW_DENY_HTTP_FILTER      = "envoy.filters.http.ip_allow_deny";
inline constexpr std::string_view HEALTH_CHECK_HTTP_FILTER       = "envoy.filters.http.health_check_simple";
inline constexpr std::string_view HEADER_SIZE_HTTP_FILTER        = "envoy.filters.http.header_size";
inline constexpr std::string_view ROUTER_HTTP_FILTER             = "envoy.router";
inline constexpr std::string_view REQUEST_START_HEADER           = "x-request-start";
inline constexpr std::string_view REQUEST_START_VALUE            = "t=%START_TIME(%s.%3f)%";

// =====================
// Resource type identifiers served by the caches
// =====================
inline constexpr std::string_view LISTENER_TYPE_URL = "type.googleapis.com/envoy.api.v2.Listener";
inline constexpr std::string_view ROUTE_TYPE_URL    = "type.googleapis.com/envoy.api.v2.RouteConfiguration";
inline constexpr std::string_view CLUSTER_TYPE_URL  = "type.googleapis.com/envoy.api.v2.Cluster";
inline constexpr std::string_view SECRET_TYPE_URL   = "type.googleapis.com/envoy.api.v2.auth.Secret";

// =====================
// Naming
// =====================
/// Maximum length of generated cluster / virtual host / secret names.
inline constexpr std::size_t MAX_NAME_LEN = 60;
/// Length of the hex hash suffix used when shortening names.
inline constexpr std::size_t SHORT_HASH_LEN = 6;
/// Bytes of the SHA-1 digest rendered into cluster/secret names (10 hex chars).
inline constexpr std::size_t NAME_DIGEST_BYTES = 5;

// =====================
// Secret data keys
// =====================
inline constexpr std::string_view TLS_CERT_KEY = "tls.crt";
inline constexpr std::string_view TLS_KEY_KEY  = "tls.key";
inline constexpr std::string_view CA_CERT_KEY  = "ca.crt";

// =====================
// Logging defaults
// =====================
inline constexpr std::string_view DEFAULT_LOG_LEVEL  = "info";
inline constexpr std::string_view DEFAULT_LOGGER     = "trellis";

} // namespace trellis::config::constants
