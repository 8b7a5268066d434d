/**
 * @file yaml_loader.cpp
 * @brief Multi-document resource parsing with yaml-cpp.
 */
#include "trellis/source/yaml_loader.hpp"

#include <fstream>
#include <sstream>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "trellis/obs/log.hpp"

namespace trellis::source {

namespace {

/// Raised for well-formed YAML that does not describe a valid resource.
struct SchemaError {
    std::string message;
};

template <class T>
void set_if(const YAML::Node& n, const char* key, T& out) {
    if (n[key]) out = n[key].as<T>();
}

util::Duration duration(const YAML::Node& n, const std::string& where) {
    const auto d = util::parse_duration(n.as<std::string>());
    if (!d) throw SchemaError{where + ": " + d.error()};
    return *d;
}

void set_duration_if(const YAML::Node& n, const char* key, std::optional<util::Duration>& out, const std::string& where) {
    if (n[key]) out = duration(n[key], where + "." + key);
}

ResourceId read_metadata(const YAML::Node& doc) {
    ResourceId id{"default", ""};
    const auto md = doc["metadata"];
    if (md) {
        set_if(md, "namespace", id.ns);
        set_if(md, "name", id.name);
    }
    if (id.name.empty()) throw SchemaError{"metadata.name is required"};
    return id;
}

std::optional<DelegateRef> read_delegate(const YAML::Node& n) {
    if (!n) return std::nullopt;
    DelegateRef d;
    set_if(n, "name", d.name);
    set_if(n, "namespace", d.ns);
    return d;
}

std::vector<ServiceRef> read_services(const YAML::Node& n, const std::string& where) {
    std::vector<ServiceRef> out;
    if (!n) return out;
    for (const auto& s : n) {
        ServiceRef ref;
        set_if(s, "name", ref.name);
        set_if(s, "port", ref.port);
        set_if(s, "weight", ref.weight);
        set_if(s, "strategy", ref.strategy);
        if (const auto hc = s["healthCheck"]) {
            HealthCheckSpec h;
            set_if(hc, "path", h.path);
            set_if(hc, "host", h.host);
            set_if(hc, "intervalSeconds", h.interval_seconds);
            set_if(hc, "timeoutSeconds", h.timeout_seconds);
            set_if(hc, "unhealthyThresholdCount", h.unhealthy_threshold_count);
            set_if(hc, "healthyThresholdCount", h.healthy_threshold_count);
            ref.health_check = std::move(h);
        }
        if (const auto v = s["validation"]) {
            UpstreamValidationSpec u;
            set_if(v, "caSecret", u.ca_secret);
            set_if(v, "subjectName", u.subject_name);
            ref.upstream_validation = std::move(u);
        }
        set_duration_if(s, "idleTimeout", ref.idle_timeout, where + " service " + ref.name);
        out.push_back(std::move(ref));
    }
    return out;
}

std::optional<HeadersPolicySpec> read_headers_policy(const YAML::Node& n) {
    if (!n) return std::nullopt;
    HeadersPolicySpec p;
    if (const auto set = n["set"]) {
        for (const auto& h : set) {
            HeaderValue hv;
            set_if(h, "name", hv.name);
            set_if(h, "value", hv.value);
            p.set.push_back(std::move(hv));
        }
    }
    set_if(n, "remove", p.remove);
    return p;
}

RouteSpec read_route(const YAML::Node& n, const std::string& where) {
    RouteSpec r;
    set_if(n, "match", r.match);
    const auto here = where + " route \"" + r.match + "\"";
    if (const auto hm = n["headerMatch"]) {
        for (const auto& h : hm) {
            HeaderMatch m;
            set_if(h, "name", m.name);
            set_if(h, "present", m.present);
            set_if(h, "contains", m.contains);
            set_if(h, "notcontains", m.not_contains);
            set_if(h, "exact", m.exact);
            set_if(h, "notexact", m.not_exact);
            r.header_match.push_back(std::move(m));
        }
    }
    r.services = read_services(n["services"], here);
    r.delegate = read_delegate(n["delegate"]);
    set_if(n, "enableWebsockets", r.enable_websockets);
    set_if(n, "permitInsecure", r.permit_insecure);
    set_if(n, "prefixRewrite", r.prefix_rewrite);
    if (const auto tp = n["timeoutPolicy"]) {
        TimeoutPolicySpec t;
        set_if(tp, "request", t.request);
        r.timeout_policy = std::move(t);
    }
    if (const auto rp = n["retryPolicy"]) {
        RetryPolicySpec rs;
        set_if(rp, "count", rs.count);
        set_if(rp, "perTryTimeout", rs.per_try_timeout);
        r.retry_policy = std::move(rs);
    }
    if (const auto hp = n["hashPolicy"]) {
        for (const auto& h : hp) {
            HashPolicySpec s;
            set_if(h, "headerName", s.header_name);
            set_if(h, "cookieName", s.cookie_name);
            set_if(h, "cookiePath", s.cookie_path);
            set_duration_if(h, "cookieTtl", s.cookie_ttl, here + " hashPolicy");
            set_if(h, "sourceIp", s.source_ip);
            set_if(h, "terminal", s.terminal);
            r.hash_policy.push_back(std::move(s));
        }
    }
    set_duration_if(n, "idleTimeout", r.idle_timeout, here);
    set_duration_if(n, "timeout", r.timeout, here);
    if (const auto t = n["tracing"]) {
        TracingSpec ts;
        set_if(t, "clientSampling", ts.client_sampling);
        set_if(t, "randomSampling", ts.random_sampling);
        r.tracing = ts;
    }
    r.request_headers_policy = read_headers_policy(n["requestHeadersPolicy"]);
    r.response_headers_policy = read_headers_policy(n["responseHeadersPolicy"]);
    return r;
}

RouteResource read_ingress_route(const YAML::Node& doc, ResourceId id) {
    RouteResource rr;
    rr.id = std::move(id);
    const auto where = rr.id.str();
    const auto spec = doc["spec"];
    if (!spec) return rr;

    if (const auto vh = spec["virtualhost"]) {
        VirtualHostSpec v;
        set_if(vh, "fqdn", v.fqdn);
        if (const auto tls = vh["tls"]) {
            TlsSpec t;
            set_if(tls, "secretName", t.secret_name);
            set_if(tls, "minimumProtocolVersion", t.minimum_protocol_version);
            set_if(tls, "maximumProtocolVersion", t.maximum_protocol_version);
            set_if(tls, "passthrough", t.passthrough);
            set_if(tls, "enableFallbackCertificate", t.enable_fallback_certificate);
            if (const auto cv = tls["clientValidation"]) {
                ClientValidationSpec c;
                set_if(cv, "caSecret", c.ca_secret);
                t.client_validation = std::move(c);
            }
            v.tls = std::move(t);
        }
        rr.virtual_host = std::move(v);
    }
    if (const auto routes = spec["routes"]) {
        for (const auto& r : routes) rr.routes.push_back(read_route(r, where));
    }
    if (const auto tcp = spec["tcpproxy"]) {
        TcpProxySpec t;
        t.services = read_services(tcp["services"], where + " tcpproxy");
        t.delegate = read_delegate(tcp["delegate"]);
        rr.tcpproxy = std::move(t);
    }
    return rr;
}

Service read_service(const YAML::Node& doc, ResourceId id) {
    Service s{std::move(id), {}};
    const auto spec = doc["spec"];
    if (!spec || !spec["ports"]) return s;
    for (const auto& p : spec["ports"]) {
        ServicePort sp;
        set_if(p, "name", sp.name);
        set_if(p, "port", sp.port);
        set_if(p, "protocol", sp.protocol);
        s.ports.push_back(std::move(sp));
    }
    return s;
}

Secret read_secret(const YAML::Node& doc, ResourceId id) {
    Secret s{std::move(id), {}};
    set_if(doc, "data", s.data);
    return s;
}

CertificateDelegation read_delegation(const YAML::Node& doc, ResourceId id) {
    CertificateDelegation d{std::move(id), {}};
    const auto spec = doc["spec"];
    if (!spec || !spec["delegations"]) return d;
    for (const auto& e : spec["delegations"]) {
        CertificateDelegationEntry entry;
        set_if(e, "secretName", entry.secret_name);
        set_if(e, "targetNamespaces", entry.target_namespaces);
        d.delegations.push_back(std::move(entry));
    }
    return d;
}

template <class Map, class R>
void insert_unique(Map& table, R obj, const std::string& kind) {
    const auto key = obj.id;
    if (!table.try_emplace(key, std::move(obj)).second) {
        throw SchemaError{"duplicate " + kind + " " + key.str()};
    }
}

} // namespace

trellis_detail::expected<Snapshot, std::string> load_resources(const std::string& text) {
    std::vector<YAML::Node> docs;
    try {
        docs = YAML::LoadAll(text);
    } catch (const YAML::Exception& e) {
        return trellis_detail::unexpected("syntax error at line " + std::to_string(e.mark.line + 1) + ", column " +
                                          std::to_string(e.mark.column + 1) + ": " + e.msg);
    }

    Snapshot snap;
    std::size_t index = 0;
    try {
        for (const auto& doc : docs) {
            ++index;
            if (!doc || doc.IsNull()) continue;
            if (!doc.IsMap()) throw SchemaError{"document is not a mapping"};
            const auto kind = doc["kind"] ? doc["kind"].as<std::string>() : std::string{};
            if (kind == "IngressRoute") {
                insert_unique(snap.route_resources, read_ingress_route(doc, read_metadata(doc)), kind);
            } else if (kind == "Service") {
                insert_unique(snap.services, read_service(doc, read_metadata(doc)), kind);
            } else if (kind == "Secret") {
                insert_unique(snap.secrets, read_secret(doc, read_metadata(doc)), kind);
            } else if (kind == "TLSCertificateDelegation") {
                insert_unique(snap.delegations, read_delegation(doc, read_metadata(doc)), kind);
            } else {
                obs::logger()->debug("skipping document {} of kind \"{}\"", index, kind);
            }
        }
    } catch (const SchemaError& e) {
        return trellis_detail::unexpected("document " + std::to_string(index) + ": " + e.message);
    } catch (const YAML::Exception& e) {
        return trellis_detail::unexpected("document " + std::to_string(index) + ": " + std::string{e.what()});
    }
    return snap;
}

trellis_detail::expected<Snapshot, std::string> load_resources_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return trellis_detail::unexpected("cannot open " + path);
    std::stringstream buf;
    buf << in.rdbuf();
    auto snap = load_resources(buf.str());
    if (!snap) return trellis_detail::unexpected(path + ": " + snap.error());
    obs::logger()->info("loaded {} resources from {}", snap->size(), path);
    return snap;
}

} // namespace trellis::source
