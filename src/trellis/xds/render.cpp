/**
 * @file render.cpp
 * @brief yaml-cpp emitters for proxy objects.
 */
#include "trellis/xds/render.hpp"

#include <type_traits>

namespace trellis::xds {

namespace {

std::string duration(util::Duration d) { return util::format_duration(d); }

const char* to_string(AccessLogFormat f) { return f == AccessLogFormat::Json ? "json" : "envoy"; }

const char* to_string(LbPolicy p) {
    switch (p) {
        case LbPolicy::RoundRobin:   return "ROUND_ROBIN";
        case LbPolicy::LeastRequest: return "LEAST_REQUEST";
        case LbPolicy::Random:       return "RANDOM";
        case LbPolicy::RingHash:     return "RING_HASH";
    }
    return "ROUND_ROBIN";
}

const char* to_string(dag::HeaderMatchType t) {
    switch (t) {
        case dag::HeaderMatchType::Present:  return "present";
        case dag::HeaderMatchType::Contains: return "contains";
        case dag::HeaderMatchType::Exact:    return "exact";
    }
    return "present";
}

void emit_strings(YAML::Emitter& out, const char* key, const std::vector<std::string>& v) {
    if (v.empty()) return;
    out << YAML::Key << key << YAML::Value << YAML::Flow << v;
}

void emit(YAML::Emitter& out, const std::vector<AccessLog>& logs) {
    if (logs.empty()) return;
    out << YAML::Key << "access_log" << YAML::Value << YAML::BeginSeq;
    for (const auto& l : logs) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << l.path;
        out << YAML::Key << "format" << YAML::Value << to_string(l.format);
        emit_strings(out, "json_fields", l.json_fields);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emit(YAML::Emitter& out, const char* key, const std::vector<HeaderValueOption>& headers) {
    if (headers.empty()) return;
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& h : headers) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "key" << YAML::Value << h.key;
        out << YAML::Key << "value" << YAML::Value << h.value;
        out << YAML::Key << "append" << YAML::Value << h.append;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emit(YAML::Emitter& out, const std::vector<CidrRange>& cidrs, const char* key) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& c : cidrs) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "address_prefix" << YAML::Value << c.address_prefix;
        out << YAML::Key << "prefix_len" << YAML::Value << c.prefix_len;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

void emit(YAML::Emitter& out, const CertificateValidationContext& v) {
    out << YAML::Key << "validation_context" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "trusted_ca_bytes" << YAML::Value << v.trusted_ca.size();
    if (!v.subject_name.empty()) out << YAML::Key << "subject_name" << YAML::Value << v.subject_name;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const DownstreamTlsContext& tls) {
    out << YAML::Key << "tls" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "min_version" << YAML::Value << std::string{dag::to_string(tls.params.min_version)};
    out << YAML::Key << "max_version" << YAML::Value << std::string{dag::to_string(tls.params.max_version)};
    emit_strings(out, "cipher_suites", tls.params.cipher_suites);
    emit_strings(out, "certificate_secrets", tls.certificate_secrets);
    emit_strings(out, "alpn_protocols", tls.alpn_protocols);
    if (tls.validation) emit(out, *tls.validation);
    if (tls.require_client_certificate) out << YAML::Key << "require_client_certificate" << YAML::Value << true;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const HttpFilter& f) {
    out << YAML::BeginMap << YAML::Key << "name" << YAML::Value << f.name;
    std::visit(
        [&out](const auto& cfg) {
            using T = std::decay_t<decltype(cfg)>;
            if constexpr (std::is_same_v<T, HealthCheckFilter>) {
                out << YAML::Key << "path" << YAML::Value << cfg.path;
            } else if constexpr (std::is_same_v<T, HeaderSizeFilter>) {
                out << YAML::Key << "max_bytes" << YAML::Value << cfg.max_bytes;
            } else if constexpr (std::is_same_v<T, RouterFilter>) {
                out << YAML::Key << "suppress_envoy_headers" << YAML::Value << cfg.suppress_envoy_headers;
            }
        },
        f.config);
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const HttpConnectionManager& m) {
    out << YAML::Key << "route_config_name" << YAML::Value << m.route_config_name;
    out << YAML::Key << "stat_prefix" << YAML::Value << m.stat_prefix;
    emit(out, m.access_logs);
    out << YAML::Key << "request_timeout" << YAML::Value << duration(m.request_timeout);
    out << YAML::Key << "max_request_headers_kb" << YAML::Value << m.max_request_headers_kb;
    out << YAML::Key << "server_name" << YAML::Value << m.server_name;
    out << YAML::Key << "generate_request_id" << YAML::Value << m.generate_request_id;
    out << YAML::Key << "use_remote_address" << YAML::Value << m.use_remote_address;
    out << YAML::Key << "normalize_path" << YAML::Value << m.normalize_path;
    out << YAML::Key << "merge_slashes" << YAML::Value << m.merge_slashes;
    out << YAML::Key << "accept_http_10" << YAML::Value << m.accept_http_10;
    out << YAML::Key << "tracing" << YAML::Value << m.tracing;
    if (!m.http_filters.empty()) {
        out << YAML::Key << "http_filters" << YAML::Value << YAML::BeginSeq;
        for (const auto& f : m.http_filters) emit(out, f);
        out << YAML::EndSeq;
    }
}

void emit(YAML::Emitter& out, const TcpProxyFilter& t) {
    out << YAML::Key << "stat_prefix" << YAML::Value << t.stat_prefix;
    if (!t.cluster.empty()) out << YAML::Key << "cluster" << YAML::Value << t.cluster;
    if (!t.weighted_clusters.empty()) {
        out << YAML::Key << "weighted_clusters" << YAML::Value << YAML::BeginSeq;
        for (const auto& w : t.weighted_clusters) {
            out << YAML::Flow << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << w.name;
            out << YAML::Key << "weight" << YAML::Value << w.weight;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    emit(out, t.access_logs);
    out << YAML::Key << "idle_timeout" << YAML::Value << duration(t.idle_timeout);
}

void emit(YAML::Emitter& out, const Filter& f) {
    out << YAML::BeginMap << YAML::Key << "name" << YAML::Value << f.name;
    std::visit([&out](const auto& cfg) { emit(out, cfg); }, f.config);
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const FilterChain& fc) {
    out << YAML::BeginMap;
    if (!fc.name.empty()) out << YAML::Key << "name" << YAML::Value << fc.name;
    if (!fc.match.server_names.empty() || !fc.match.transport_protocol.empty()) {
        out << YAML::Key << "filter_chain_match" << YAML::Value << YAML::BeginMap;
        emit_strings(out, "server_names", fc.match.server_names);
        if (!fc.match.transport_protocol.empty()) {
            out << YAML::Key << "transport_protocol" << YAML::Value << fc.match.transport_protocol;
        }
        out << YAML::EndMap;
    }
    if (fc.tls) emit(out, *fc.tls);
    out << YAML::Key << "filters" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : fc.filters) emit(out, f);
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const RouteAction& a) {
    out << YAML::Key << "route" << YAML::Value << YAML::BeginMap;
    if (!a.cluster.empty()) out << YAML::Key << "cluster" << YAML::Value << a.cluster;
    if (!a.weighted_clusters.empty()) {
        out << YAML::Key << "weighted_clusters" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "clusters" << YAML::Value << YAML::BeginSeq;
        for (const auto& w : a.weighted_clusters) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << w.name;
            out << YAML::Key << "weight" << YAML::Value << w.weight;
            emit(out, "request_headers_to_add", w.request_headers_to_add);
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "total_weight" << YAML::Value << a.total_weight;
        out << YAML::EndMap;
    }
    if (a.timeout) out << YAML::Key << "timeout" << YAML::Value << duration(*a.timeout);
    if (a.idle_timeout) out << YAML::Key << "idle_timeout" << YAML::Value << duration(*a.idle_timeout);
    if (a.retry_policy) {
        out << YAML::Key << "retry_policy" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "retry_on" << YAML::Value << a.retry_policy->retry_on;
        out << YAML::Key << "num_retries" << YAML::Value << a.retry_policy->num_retries;
        if (a.retry_policy->per_try_timeout) {
            out << YAML::Key << "per_try_timeout" << YAML::Value << duration(*a.retry_policy->per_try_timeout);
        }
        out << YAML::EndMap;
    }
    if (!a.hash_policy.empty()) {
        out << YAML::Key << "hash_policy" << YAML::Value << YAML::BeginSeq;
        for (const auto& h : a.hash_policy) {
            out << YAML::Flow << YAML::BeginMap;
            if (!h.header_name.empty()) out << YAML::Key << "header_name" << YAML::Value << h.header_name;
            if (!h.cookie_name.empty()) {
                out << YAML::Key << "cookie" << YAML::Value << h.cookie_name;
                if (!h.cookie_path.empty()) out << YAML::Key << "cookie_path" << YAML::Value << h.cookie_path;
                if (h.cookie_ttl) out << YAML::Key << "cookie_ttl" << YAML::Value << duration(*h.cookie_ttl);
            }
            if (h.source_ip) out << YAML::Key << "source_ip" << YAML::Value << true;
            if (h.terminal) out << YAML::Key << "terminal" << YAML::Value << true;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    if (a.websocket) out << YAML::Key << "websocket" << YAML::Value << true;
    if (!a.prefix_rewrite.empty()) out << YAML::Key << "prefix_rewrite" << YAML::Value << a.prefix_rewrite;
    if (!a.host_rewrite.empty()) out << YAML::Key << "host_rewrite" << YAML::Value << a.host_rewrite;
    emit(out, "request_headers_to_add", a.request_headers_to_add);
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const RedirectAction& r) {
    out << YAML::Key << "redirect" << YAML::Value << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "https_redirect" << YAML::Value << r.https_redirect;
    out << YAML::EndMap;
}

void emit(YAML::Emitter& out, const Route& r) {
    out << YAML::BeginMap;
    out << YAML::Key << "match" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "prefix" << YAML::Value << r.match.prefix;
    if (!r.match.headers.empty()) {
        out << YAML::Key << "headers" << YAML::Value << YAML::BeginSeq;
        for (const auto& h : r.match.headers) {
            out << YAML::Flow << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << h.name;
            out << YAML::Key << to_string(h.type) << YAML::Value << h.value;
            if (h.invert) out << YAML::Key << "invert" << YAML::Value << true;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
    std::visit([&out](const auto& a) { emit(out, a); }, r.action);
    emit(out, "request_headers_to_add", r.request_headers_to_add);
    emit_strings(out, "request_headers_to_remove", r.request_headers_to_remove);
    emit(out, "response_headers_to_add", r.response_headers_to_add);
    emit_strings(out, "response_headers_to_remove", r.response_headers_to_remove);
    if (r.tracing) {
        out << YAML::Key << "tracing" << YAML::Value << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "client_sampling" << YAML::Value << r.tracing->client_sampling;
        out << YAML::Key << "random_sampling" << YAML::Value << r.tracing->random_sampling;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
}

} // namespace

YAML::Emitter& operator<<(YAML::Emitter& out, const Listener& l) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << l.name;
    out << YAML::Key << "address" << YAML::Value << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << "address" << YAML::Value << l.address.address;
    out << YAML::Key << "port" << YAML::Value << l.address.port;
    if (l.address.ipv4_compat) out << YAML::Key << "ipv4_compat" << YAML::Value << true;
    out << YAML::EndMap;
    if (!l.listener_filters.empty()) {
        out << YAML::Key << "listener_filters" << YAML::Value << YAML::BeginSeq;
        for (const auto& f : l.listener_filters) {
            out << YAML::BeginMap << YAML::Key << "name" << YAML::Value << f.name;
            if (f.kind == ListenerFilterKind::IpAllowDeny) {
                if (!f.ip_allow_deny.allow_cidrs.empty()) emit(out, f.ip_allow_deny.allow_cidrs, "allow_cidrs");
                if (!f.ip_allow_deny.deny_cidrs.empty()) emit(out, f.ip_allow_deny.deny_cidrs, "deny_cidrs");
            }
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::Key << "filter_chains" << YAML::Value << YAML::BeginSeq;
    for (const auto& fc : l.filter_chains) emit(out, fc);
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out;
}

YAML::Emitter& operator<<(YAML::Emitter& out, const RouteConfiguration& rc) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << rc.name;
    out << YAML::Key << "virtual_hosts" << YAML::Value << YAML::BeginSeq;
    for (const auto& vh : rc.virtual_hosts) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << vh.name;
        out << YAML::Key << "domains" << YAML::Value << YAML::Flow << vh.domains;
        out << YAML::Key << "routes" << YAML::Value << YAML::BeginSeq;
        for (const auto& r : vh.routes) emit(out, r);
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out;
}

YAML::Emitter& operator<<(YAML::Emitter& out, const Cluster& c) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << c.name;
    out << YAML::Key << "alt_stat_name" << YAML::Value << c.alt_stat_name;
    out << YAML::Key << "eds_service_name" << YAML::Value << c.eds_service_name;
    out << YAML::Key << "connect_timeout" << YAML::Value << duration(c.connect_timeout);
    out << YAML::Key << "lb_policy" << YAML::Value << to_string(c.lb_policy);
    if (c.health_check) {
        const auto& hc = *c.health_check;
        out << YAML::Key << "health_check" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "timeout" << YAML::Value << duration(hc.timeout);
        out << YAML::Key << "interval" << YAML::Value << duration(hc.interval);
        out << YAML::Key << "unhealthy_threshold" << YAML::Value << hc.unhealthy_threshold;
        out << YAML::Key << "healthy_threshold" << YAML::Value << hc.healthy_threshold;
        out << YAML::Key << "path" << YAML::Value << hc.path;
        out << YAML::Key << "host" << YAML::Value << hc.host;
        out << YAML::EndMap;
    }
    if (c.tls) {
        out << YAML::Key << "tls" << YAML::Value << YAML::BeginMap;
        if (!c.tls->sni.empty()) out << YAML::Key << "sni" << YAML::Value << c.tls->sni;
        emit_strings(out, "alpn_protocols", c.tls->alpn_protocols);
        if (c.tls->validation) emit(out, *c.tls->validation);
        out << YAML::EndMap;
    }
    if (c.http2) out << YAML::Key << "http2" << YAML::Value << true;
    if (c.idle_timeout) out << YAML::Key << "idle_timeout" << YAML::Value << duration(*c.idle_timeout);
    out << YAML::EndMap;
    return out;
}

YAML::Emitter& operator<<(YAML::Emitter& out, const Secret& s) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << s.name;
    out << YAML::Key << "certificate_chain_bytes" << YAML::Value << s.certificate_chain.size();
    out << YAML::EndMap;
    return out;
}

} // namespace trellis::xds
