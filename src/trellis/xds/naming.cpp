/**
 * @file naming.cpp
 * @brief Cluster / secret / virtual host naming.
 */
#include "trellis/xds/naming.hpp"

#include "trellis/config/constants.hpp"
#include "trellis/util/hash.hpp"

namespace trellis::xds {

using namespace trellis::config::constants;

namespace {
std::string digest_prefix(std::string_view buf) {
    return util::sha1_hex(buf).substr(0, NAME_DIGEST_BYTES * 2);
}
} // namespace

std::string cluster_name(const dag::Cluster& c) {
    std::string buf = c.load_balancer_policy;
    if (const auto& hc = c.health_check) {
        if (hc->timeout.count() > 0) buf += util::format_duration(hc->timeout);
        if (hc->interval.count() > 0) buf += util::format_duration(hc->interval);
        if (hc->unhealthy_threshold > 0) buf += std::to_string(hc->unhealthy_threshold);
        if (hc->healthy_threshold > 0) buf += std::to_string(hc->healthy_threshold);
        buf += hc->path;
    }
    if (const auto& uv = c.upstream_validation) {
        buf += uv->ca_certificate.id.name;
        buf += uv->subject_name;
    }
    if (c.idle_timeout) buf += util::format_duration(*c.idle_timeout);

    const auto& svc = c.upstream;
    return util::hashname(MAX_NAME_LEN, {svc.id.ns, svc.id.name, std::to_string(svc.port), digest_prefix(buf)});
}

std::string cluster_stat_name(const dag::Service& s) {
    return s.id.ns + "_" + s.id.name + "_" + std::to_string(s.port);
}

std::string eds_service_name(const dag::Service& s) {
    const auto port = s.port_name.empty() ? std::to_string(s.port) : s.port_name;
    return s.id.ns + "/" + s.id.name + "/" + port;
}

std::string secret_name(const dag::Secret& s) {
    return util::hashname(MAX_NAME_LEN, {s.id.ns, s.id.name, digest_prefix(s.cert() + s.key())});
}

std::string vhost_name(std::string_view fqdn) {
    return util::hashname(MAX_NAME_LEN, {std::string(fqdn)});
}

} // namespace trellis::xds
