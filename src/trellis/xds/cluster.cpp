/**
 * @file cluster.cpp
 * @brief Cluster visitor.
 */
#include "trellis/xds/cluster.hpp"

#include "trellis/config/constants.hpp"
#include "trellis/xds/naming.hpp"

namespace trellis::xds {

using namespace trellis::config::constants;

LbPolicy lb_policy(std::string_view strategy) noexcept {
    if (strategy == "WeightedLeastRequest") return LbPolicy::LeastRequest;
    if (strategy == "Random") return LbPolicy::Random;
    if (strategy == "Cookie" || strategy == "RequestHash") return LbPolicy::RingHash;
    return LbPolicy::RoundRobin;
}

namespace {
HealthCheck health_check(const dag::HealthCheckPolicy& hc) {
    HealthCheck out;
    out.timeout   = hc.timeout.count() > 0 ? hc.timeout : util::Duration{HC_DEFAULT_TIMEOUT};
    out.interval  = hc.interval.count() > 0 ? hc.interval : util::Duration{HC_DEFAULT_INTERVAL};
    out.unhealthy_threshold = hc.unhealthy_threshold > 0 ? hc.unhealthy_threshold : HC_DEFAULT_UNHEALTHY_THRESHOLD;
    out.healthy_threshold   = hc.healthy_threshold > 0 ? hc.healthy_threshold : HC_DEFAULT_HEALTHY_THRESHOLD;
    out.path = hc.path;
    out.host = hc.host.empty() ? std::string{HC_DEFAULT_HOST} : hc.host;
    return out;
}

UpstreamTlsContext upstream_tls(const dag::Cluster& c, std::vector<std::string> alpn) {
    UpstreamTlsContext ctx;
    ctx.alpn_protocols = std::move(alpn);
    if (c.upstream_validation) {
        ctx.validation = CertificateValidationContext{c.upstream_validation->ca_certificate.ca(),
                                                      c.upstream_validation->subject_name};
        ctx.sni = c.upstream_validation->subject_name;
    }
    return ctx;
}
} // namespace

Cluster make_cluster(const dag::Cluster& c) {
    Cluster out;
    out.name = cluster_name(c);
    out.alt_stat_name = cluster_stat_name(c.upstream);
    out.eds_service_name = eds_service_name(c.upstream);
    out.connect_timeout = CLUSTER_CONNECT_TIMEOUT;
    out.lb_policy = lb_policy(c.load_balancer_policy);
    if (c.health_check) out.health_check = health_check(*c.health_check);
    out.idle_timeout = c.idle_timeout;

    if (c.protocol == "h2") {
        out.http2 = true;
        out.tls = upstream_tls(c, {"h2"});
    } else if (c.protocol == "h2c") {
        out.http2 = true;
    } else if (c.protocol == "tls") {
        out.tls = upstream_tls(c, {});
    }
    return out;
}

std::map<std::string, Cluster> visit_clusters(const dag::Graph& g) {
    std::map<std::string, Cluster> out;
    dag::Dispatch dispatch;
    dispatch.on(dag::Kind::Cluster, [&out](const dag::Vertex& v) {
        const auto& c = dag::node<dag::Cluster>(v);
        auto name = cluster_name(c);
        if (out.contains(name)) return;
        out.emplace(std::move(name), make_cluster(c));
    });
    g.visit([&dispatch](const dag::Vertex& v) { dispatch(v); });
    return out;
}

} // namespace trellis::xds
