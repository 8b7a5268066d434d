/**
 * @file types.cpp
 * @brief HTTP connection manager construction and small helpers on proxy types.
 */
#include "trellis/xds/types.hpp"

#include <algorithm>

namespace trellis::xds {

using namespace trellis::config::constants;

std::vector<HttpFilter> default_http_filters() {
    return {
        HttpFilter{std::string{IP_ALLOW_DENY_HTTP_FILTER}, IpAllowDenyHttpFilter{}},
        HttpFilter{std::string{HEALTH_CHECK_HTTP_FILTER}, HealthCheckFilter{std::string{HEALTH_CHECK_PATH}}},
        HttpFilter{std::string{HEADER_SIZE_HTTP_FILTER}, HeaderSizeFilter{HEADER_SIZE_MAX_BYTES}},
        HttpFilter{std::string{ROUTER_HTTP_FILTER}, RouterFilter{true}},
    };
}

HttpConnectionManager make_http_connection_manager(const HttpConnectionManagerConfig& cfg) {
    HttpConnectionManager m;
    m.route_config_name      = cfg.route_config_name;
    m.stat_prefix            = cfg.stat_prefix.empty() ? cfg.route_config_name : cfg.stat_prefix;
    m.access_logs            = cfg.access_logs;
    m.request_timeout        = cfg.request_timeout.count() < 0 ? util::Duration{0} : cfg.request_timeout;
    if (cfg.default_filters) m.http_filters = default_http_filters();
    m.max_request_headers_kb = cfg.max_request_headers_kb;
    m.server_name            = cfg.server_name;
    m.generate_request_id    = cfg.generate_request_id;
    m.use_remote_address     = cfg.use_remote_address;
    m.normalize_path         = cfg.normalize_path;
    m.merge_slashes          = cfg.merge_slashes;
    m.accept_http_10         = cfg.accept_http_10;
    m.tracing                = cfg.tracing;
    return m;
}

bool FilterChain::has_tcp_proxy() const noexcept {
    return std::any_of(filters.begin(), filters.end(), [](const Filter& f) { return f.is_tcp_proxy(); });
}

} // namespace trellis::xds
