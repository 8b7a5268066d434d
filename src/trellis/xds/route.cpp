/**
 * @file route.cpp
 * @brief Route visitor: virtual host entries, route actions, precedence ordering.
 */
#include "trellis/xds/route.hpp"

#include <algorithm>

#include "trellis/xds/naming.hpp"

namespace trellis::xds {

using namespace trellis::config::constants;

//------------------------------- Ordering -------------------------------------

bool route_precedes(const Route& a, const Route& b) {
    if (a.match.prefix != b.match.prefix) return a.match.prefix > b.match.prefix;
    const auto& ha = a.match.headers;
    const auto& hb = b.match.headers;
    if (ha.size() != hb.size()) return ha.size() > hb.size();
    for (std::size_t i = 0; i < ha.size(); ++i) {
        if (ha[i].name != hb[i].name) return ha[i].name < hb[i].name;
        if (ha[i].value != hb[i].value) return ha[i].value < hb[i].value;
    }
    return false;
}

void sort_routes(std::vector<Route>& routes) {
    std::stable_sort(routes.begin(), routes.end(), route_precedes);
}

//------------------------------- Actions --------------------------------------

namespace {

HeaderValueOption request_start_header() {
    return HeaderValueOption{std::string{REQUEST_START_HEADER}, std::string{REQUEST_START_VALUE}, true};
}

std::optional<util::Duration> to_duration(const dag::Timeout& t) {
    switch (t.mode) {
        case dag::Timeout::Mode::Default:  return std::nullopt;
        case dag::Timeout::Mode::Disabled: return util::Duration{0};
        case dag::Timeout::Mode::Value:    return t.value;
    }
    return std::nullopt;
}

std::vector<HeaderValueOption> set_headers(const std::optional<dag::HeadersPolicy>& p) {
    std::vector<HeaderValueOption> out;
    if (!p) return out;
    for (const auto& [k, v] : p->set) out.push_back(HeaderValueOption{k, v, false});
    return out;
}

std::vector<std::string> removed_headers(const std::optional<dag::HeadersPolicy>& p) {
    return p ? p->remove : std::vector<std::string>{};
}

RouteMatch route_match(const dag::Route& r) {
    RouteMatch m{r.prefix, {}};
    for (const auto& h : r.headers) m.headers.push_back(HeaderMatcher{h.name, h.value, h.type, h.invert});
    return m;
}

RouteAction route_action(const dag::Route& r) {
    RouteAction a;
    a.websocket = r.websocket;
    a.prefix_rewrite = r.prefix_rewrite;
    a.idle_timeout = r.idle_timeout;
    a.hash_policy = r.hash_policy;
    if (r.timeout_policy) a.timeout = to_duration(r.timeout_policy->response_timeout);
    if (r.timeout) a.timeout = r.timeout;
    if (r.retry_policy) {
        a.retry_policy = RetryPolicy{r.retry_policy->retry_on, r.retry_policy->num_retries,
                                     r.retry_policy->per_try_timeout.mode == dag::Timeout::Mode::Value
                                         ? std::optional<util::Duration>{r.retry_policy->per_try_timeout.value}
                                         : std::nullopt};
    }
    if (r.request_headers_policy) a.host_rewrite = r.request_headers_policy->host_rewrite;

    if (r.clusters.size() == 1) {
        a.cluster = cluster_name(r.clusters.front());
        a.request_headers_to_add = {request_start_header()};
    } else {
        a.weighted_clusters = weighted_clusters(r.clusters, a.total_weight);
    }
    return a;
}

Route project_route(const dag::Route& r, bool allow_redirect) {
    Route out;
    out.match = route_match(r);
    if (allow_redirect && r.https_upgrade) {
        out.action = RedirectAction{true};
        return out;
    }
    out.action = route_action(r);
    out.request_headers_to_add = set_headers(r.request_headers_policy);
    out.request_headers_to_remove = removed_headers(r.request_headers_policy);
    out.response_headers_to_add = set_headers(r.response_headers_policy);
    out.response_headers_to_remove = removed_headers(r.response_headers_policy);
    out.tracing = r.tracing;
    return out;
}

VirtualHost project_vhost(const dag::VirtualHost& vh, std::uint32_t port, bool allow_redirect) {
    VirtualHost out;
    out.name = vhost_name(vh.name);
    out.domains = {vh.name};
    if (vh.name != "*") out.domains.push_back(vh.name + ":" + std::to_string(port));
    for (const auto& r : vh.routes) out.routes.push_back(project_route(r, allow_redirect));
    sort_routes(out.routes);
    return out;
}

void sort_vhosts(RouteConfiguration& rc) {
    std::stable_sort(rc.virtual_hosts.begin(), rc.virtual_hosts.end(),
                     [](const VirtualHost& a, const VirtualHost& b) { return a.name < b.name; });
}

} // namespace

std::vector<WeightedCluster> weighted_clusters(const std::vector<dag::Cluster>& clusters, std::uint32_t& total_weight) {
    std::vector<WeightedCluster> out;
    std::uint64_t total = 0;
    for (const auto& c : clusters) {
        total += c.weight;
        WeightedCluster wc;
        wc.name = cluster_name(c);
        wc.weight = c.weight;
        wc.request_headers_to_add = {request_start_header()};
        out.push_back(std::move(wc));
    }
    if (total == 0) {
        for (auto& wc : out) wc.weight = 1;
        total = out.size();
    }
    total_weight = static_cast<std::uint32_t>(total);

    std::stable_sort(out.begin(), out.end(), [](const WeightedCluster& a, const WeightedCluster& b) {
        if (a.name != b.name) return a.name < b.name;
        return a.weight < b.weight;
    });
    return out;
}

//------------------------------- Visitor --------------------------------------

std::map<std::string, RouteConfiguration> visit_routes(const dag::Graph& g, const RouteVisitorConfig& cfg) {
    std::map<std::string, RouteConfiguration> out;
    auto& http = out[std::string{HTTP_LISTENER_NAME}];
    http.name = std::string{HTTP_LISTENER_NAME};
    auto& https = out[std::string{HTTPS_LISTENER_NAME}];
    https.name = std::string{HTTPS_LISTENER_NAME};

    dag::Dispatch dispatch;
    dispatch
        .on(dag::Kind::VirtualHost,
            [&](const dag::Vertex& v) {
                auto vh = project_vhost(dag::node<dag::VirtualHost>(v), cfg.http_port, true);
                if (!vh.routes.empty()) http.virtual_hosts.push_back(std::move(vh));
            })
        .on(dag::Kind::SecureVirtualHost, [&](const dag::Vertex& v) {
            const auto& svh = dag::node<dag::SecureVirtualHost>(v);
            if (svh.vhost.routes.empty()) return;
            auto vh = project_vhost(svh.vhost, cfg.https_port, false);
            if (svh.fallback_certificate) {
                auto& fb = out[std::string{FALLBACK_ROUTE_CONFIG_NAME}];
                fb.name = std::string{FALLBACK_ROUTE_CONFIG_NAME};
                fb.virtual_hosts.push_back(vh);
            }
            https.virtual_hosts.push_back(std::move(vh));
        });
    g.visit([&dispatch](const dag::Vertex& v) { dispatch(v); });

    for (auto& [name, rc] : out) sort_vhosts(rc);
    return out;
}

} // namespace trellis::xds
