/**
 * @file builder.cpp
 * @brief Graph construction: FQDN grouping, TLS resolution, delegation walk, orphan accounting.
 */
#include "trellis/dag/builder.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "trellis/compat/expected.hpp"
#include "trellis/config/constants.hpp"
#include "trellis/obs/log.hpp"

namespace trellis::dag {

using source::ResourceId;
using source::RouteResource;
using source::RouteSpec;
using source::ServiceRef;
using namespace trellis::config::constants;

//------------------------------- Free helpers ---------------------------------

bool matches_path_prefix(std::string path, std::string prefix) {
    if (prefix.empty()) return true;
    if (path.empty() || path.back() != '/') path += '/';
    if (prefix.back() != '/') prefix += '/';
    return path.starts_with(prefix);
}

namespace {

bool valid_label(std::string_view l) noexcept {
    if (l.empty() || l.size() > 63) return false;
    if (l.front() == '-' || l.back() == '-') return false;
    return std::all_of(l.begin(), l.end(), [](unsigned char c) { return std::isalnum(c) || c == '-'; });
}

bool is_token_char(unsigned char c) noexcept {
    if (std::isalnum(c)) return true;
    constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
    return extra.find(static_cast<char>(c)) != std::string_view::npos;
}

bool valid_header_name(std::string_view name) noexcept {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) { return is_token_char(c); });
}

std::string quote(std::string_view s) { return "\"" + std::string(s) + "\""; }

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Proxy header values treat '%' as a format introducer.
std::string escape_header_value(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        out += c;
        if (c == '%') out += '%';
    }
    return out;
}

ResourceId split_secret(const std::string& name, const std::string& default_ns) {
    const auto pos = name.find('/');
    if (pos == std::string::npos) return ResourceId{default_ns, name};
    return ResourceId{name.substr(0, pos), name.substr(pos + 1)};
}

enum class SecretUse : std::uint8_t { Tls, Ca };

enum class Owner : std::uint8_t { Route, TcpProxy };

} // namespace

bool valid_fqdn(std::string_view host) noexcept {
    if (host.empty() || host.size() > 253) return false;
    if (host.starts_with("*.")) host.remove_prefix(2);
    while (true) {
        const auto dot = host.find('.');
        if (!valid_label(host.substr(0, dot))) return false;
        if (dot == std::string_view::npos) return true;
        host.remove_prefix(dot + 1);
    }
}

std::string canonical_header_key(std::string_view name) {
    if (!valid_header_name(name)) return std::string(name);
    std::string out(name);
    bool upper = true;
    for (auto& c : out) {
        const auto uc = static_cast<unsigned char>(c);
        c = static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
        upper = (c == '-');
    }
    return out;
}

//------------------------------- BuildResult ----------------------------------

std::string_view to_string(StatusKind k) noexcept {
    switch (k) {
        case StatusKind::Valid:    return "valid";
        case StatusKind::Invalid:  return "invalid";
        case StatusKind::Orphaned: return "orphaned";
    }
    return "invalid";
}

std::size_t BuildResult::count(StatusKind k) const noexcept {
    return static_cast<std::size_t>(std::count_if(statuses.begin(), statuses.end(),
                                                  [k](const auto& kv) { return kv.second.kind == k; }));
}

const Status* BuildResult::status(const ResourceId& id) const {
    const auto it = statuses.find(id);
    return it == statuses.end() ? nullptr : &it->second;
}

void BuildResult::publish(StatusWriter& w) const {
    for (const auto& [id, s] : statuses) w.set_status(s);
}

//------------------------------- Build pass -----------------------------------

namespace {

/// Sum of service weights; tcp proxies count a zero weight as 1.
std::uint64_t total_weight(const std::vector<ServiceRef>& services, bool zero_counts_as_one) noexcept {
    std::uint64_t total = 0;
    for (const auto& s : services) total += (zero_counts_as_one && s.weight == 0) ? 1u : s.weight;
    return total;
}

std::string weight_overflow(std::uint64_t total) {
    return "total service weight " + std::to_string(total) + " exceeds " + std::to_string(MAX_TOTAL_WEIGHT);
}

/**
 * One build pass. Owns the result under construction and the orphan set;
 * the store and config are borrowed for the duration of Builder::build().
 */
class Pass final {
public:
    Pass(const source::EntityStore& store, const BuilderConfig& cfg) : store_(store), cfg_(cfg) {}

    BuildResult run();

private:
    const source::EntityStore& store_;
    const BuilderConfig& cfg_;
    BuildResult result_;
    std::set<ResourceId> orphaned_;

    // ---- status recording (Invalid is sticky for the pass, first reason wins)
    void set_invalid(const ResourceId& id, std::string msg, const std::string& vhost);
    void set_valid(const ResourceId& id, const std::string& vhost);

    // ---- roots
    std::vector<const RouteResource*> valid_roots();
    bool root_allowed(const RouteResource& r) const;
    void process_root(const RouteResource& root);
    trellis_detail::expected<bool, std::string> configure_tls(const RouteResource& root);

    // ---- traversal
    void process_routes(const RouteResource& res, const std::string& prefix,
                        std::vector<ResourceId> visited, const std::string& host, bool enforce_tls);
    void process_tcpproxy(const RouteResource& res, std::vector<ResourceId> visited, const std::string& host);
    const RouteResource* resolve_delegate(const RouteResource& from, const source::DelegateRef& d);
    static std::string cycle_path(const std::vector<ResourceId>& visited, const ResourceId& target);

    // ---- lookups
    trellis_detail::expected<Secret, std::string> lookup_secret(const ResourceId& id, SecretUse use) const;
    trellis_detail::expected<std::optional<PeerValidationContext>, std::string>
    lookup_upstream_validation(const std::optional<source::UpstreamValidationSpec>& uv, const std::string& ns) const;

    // ---- route construction
    trellis_detail::expected<Route, std::string>
    build_route(const RouteResource& res, const RouteSpec& spec, bool enforce_tls) const;
    trellis_detail::expected<Cluster, std::string>
    build_cluster(const std::string& ns, const ServiceRef& s, Owner owner, const std::string& context) const;
};

void Pass::set_invalid(const ResourceId& id, std::string msg, const std::string& vhost) {
    auto lg = obs::logger();
    lg->debug("resource {} invalid: {}", id.str(), msg);
    auto [it, inserted] = result_.statuses.try_emplace(id, Status{id, StatusKind::Invalid, msg, vhost});
    if (!inserted && it->second.kind != StatusKind::Invalid) {
        it->second = Status{id, StatusKind::Invalid, std::move(msg), vhost};
    }
}

void Pass::set_valid(const ResourceId& id, const std::string& vhost) {
    result_.statuses.try_emplace(id, Status{id, StatusKind::Valid, "valid IngressRoute", vhost});
}

BuildResult Pass::run() {
    for (const auto* r : store_.routes()) {
        if (!r->is_root()) orphaned_.insert(r->id);
    }

    for (const auto* root : valid_roots()) process_root(*root);

    for (const auto& id : orphaned_) {
        result_.statuses.try_emplace(
            id, Status{id, StatusKind::Orphaned,
                       "this IngressRoute is not part of a delegation chain from a root IngressRoute", ""});
    }

    auto lg = obs::logger();
    lg->debug("build pass: vhosts={} secure_vhosts={} valid={} invalid={} orphaned={}",
              result_.graph.virtual_host_count(), result_.graph.secure_virtual_host_count(),
              result_.count(StatusKind::Valid), result_.count(StatusKind::Invalid),
              result_.count(StatusKind::Orphaned));
    return std::move(result_);
}

//------------------------------- Roots ----------------------------------------

std::vector<const RouteResource*> Pass::valid_roots() {
    std::map<std::string, std::vector<const RouteResource*>> by_fqdn;
    std::vector<const RouteResource*> blank;
    for (const auto* r : store_.routes()) {
        if (!r->is_root()) continue;
        if (r->virtual_host->fqdn.empty()) {
            blank.push_back(r);
            continue;
        }
        by_fqdn[r->virtual_host->fqdn].push_back(r);
    }

    std::vector<const RouteResource*> roots = blank;
    for (const auto& [fqdn, group] : by_fqdn) {
        if (group.size() == 1) {
            roots.push_back(group.front());
            continue;
        }
        std::vector<std::string> names;
        names.reserve(group.size());
        for (const auto* r : group) names.push_back(r->id.str());
        std::sort(names.begin(), names.end());
        std::string joined;
        for (const auto& n : names) {
            if (!joined.empty()) joined += ", ";
            joined += n;
        }
        const auto msg = "fqdn " + quote(fqdn) + " is used in multiple IngressRoutes: " + joined;
        for (const auto* r : group) set_invalid(r->id, msg, fqdn);
    }

    std::sort(roots.begin(), roots.end(),
              [](const RouteResource* a, const RouteResource* b) { return a->id < b->id; });
    return roots;
}

bool Pass::root_allowed(const RouteResource& r) const {
    if (cfg_.root_namespaces.empty()) return true;
    return std::find(cfg_.root_namespaces.begin(), cfg_.root_namespaces.end(), r.id.ns) !=
           cfg_.root_namespaces.end();
}

void Pass::process_root(const RouteResource& root) {
    const auto& host = root.virtual_host->fqdn;

    if (!root_allowed(root)) {
        set_invalid(root.id, "root IngressRoute cannot be defined in this namespace", host);
        return;
    }
    if (host.empty()) {
        set_invalid(root.id, "Spec.VirtualHost.Fqdn must be specified", host);
        return;
    }
    if (!valid_fqdn(host)) {
        set_invalid(root.id, "Spec.VirtualHost.Fqdn " + quote(host) + " is not a valid hostname", host);
        return;
    }

    bool enforce_tls = false;
    bool passthrough = false;
    if (const auto& tls = root.virtual_host->tls) {
        passthrough = tls->secret_name.empty() && tls->passthrough;
        if (!passthrough) {
            auto configured = configure_tls(root);
            if (!configured) {
                set_invalid(root.id, configured.error(), host);
                return;
            }
            enforce_tls = *configured;
        }
    }

    if (root.tcpproxy && (passthrough || enforce_tls)) {
        process_tcpproxy(root, {}, host);
    }
    process_routes(root, "", {}, host, !root.tcpproxy && enforce_tls);
}

trellis_detail::expected<bool, std::string> Pass::configure_tls(const RouteResource& root) {
    const auto& tls = *root.virtual_host->tls;
    const auto& host = root.virtual_host->fqdn;

    const auto secret_id = split_secret(tls.secret_name, root.id.ns);
    auto secret = lookup_secret(secret_id, SecretUse::Tls);
    if (!secret) {
        return trellis_detail::unexpected<std::string>(
            "Spec.VirtualHost.TLS Secret " + quote(tls.secret_name) + " is invalid: " + secret.error());
    }
    if (!store_.delegation_permitted(secret_id, root.id.ns)) {
        return trellis_detail::unexpected<std::string>(
            "Spec.VirtualHost.TLS Secret " + quote(tls.secret_name) + " certificate delegation not permitted");
    }

    std::optional<Secret> fallback;
    if (tls.enable_fallback_certificate) {
        if (tls.client_validation) {
            return trellis_detail::unexpected<std::string>(
                "Spec.Virtualhost.TLS fallback & client validation are incompatible together");
        }
        if (!cfg_.fallback_certificate) {
            return trellis_detail::unexpected<std::string>(
                "Spec.Virtualhost.TLS enabled fallback but the fallback Certificate Secret is not configured.");
        }
        const auto& fb_id = *cfg_.fallback_certificate;
        auto fb = lookup_secret(fb_id, SecretUse::Tls);
        if (!fb) {
            return trellis_detail::unexpected<std::string>(
                "Spec.Virtualhost.TLS Secret " + quote(fb_id.str()) + " fallback certificate is invalid: " + fb.error());
        }
        if (!store_.delegation_permitted(fb_id, root.id.ns)) {
            return trellis_detail::unexpected<std::string>(
                "Spec.VirtualHost.TLS fallback Secret " + quote(fb_id.str()) +
                " is not configured for certificate delegation");
        }
        fallback = std::move(*fb);
    }

    std::optional<PeerValidationContext> client_validation;
    if (tls.client_validation) {
        const ResourceId ca_id{root.id.ns, tls.client_validation->ca_secret};
        auto ca = lookup_secret(ca_id, SecretUse::Ca);
        if (!ca) {
            return trellis_detail::unexpected<std::string>(
                "Spec.VirtualHost.TLS client validation is invalid: invalid CA Secret " + quote(ca_id.str()) +
                ": " + ca.error());
        }
        client_validation = PeerValidationContext{std::move(*ca), ""};
    }

    auto& svh = result_.graph.lookup_secure_virtual_host(host);
    svh.secret = std::move(*secret);
    svh.min_tls_version = std::max(cfg_.minimum_tls_version, parse_min_tls_version(tls.minimum_protocol_version));
    svh.max_tls_version = resolve_max_tls_version(parse_max_tls_version(tls.maximum_protocol_version));
    svh.fallback_certificate = std::move(fallback);
    svh.downstream_validation = std::move(client_validation);
    return true;
}

//------------------------------- Traversal ------------------------------------

const RouteResource* Pass::resolve_delegate(const RouteResource& from, const source::DelegateRef& d) {
    const ResourceId target{d.ns.empty() ? from.id.ns : d.ns, d.name};
    const auto* dest = store_.route(target);
    if (dest == nullptr) {
        obs::logger()->debug("resource {} delegates to missing {}", from.id.str(), target.str());
        return nullptr;
    }
    orphaned_.erase(dest->id);
    return dest;
}

std::string Pass::cycle_path(const std::vector<ResourceId>& visited, const ResourceId& target) {
    std::string path;
    for (const auto& v : visited) {
        path += v.str();
        path += " -> ";
    }
    path += target.str();
    return path;
}

void Pass::process_routes(const RouteResource& res, const std::string& prefix,
                          std::vector<ResourceId> visited, const std::string& host, bool enforce_tls) {
    visited.push_back(res.id);

    for (const auto& spec : res.routes) {
        if (!matches_path_prefix(spec.match, prefix)) {
            set_invalid(res.id,
                        "the path prefix " + quote(spec.match) + " does not match the parent's path prefix " +
                            quote(prefix),
                        host);
            continue;
        }

        if (!spec.services.empty() && spec.delegate) {
            set_invalid(res.id, "route " + quote(spec.match) + ": cannot specify services and delegate in the same route",
                        host);
            continue;
        }

        if (!spec.services.empty()) {
            auto route = build_route(res, spec, enforce_tls);
            if (!route) {
                set_invalid(res.id, route.error(), host);
                continue;
            }
            if (enforce_tls) result_.graph.lookup_secure_virtual_host(host).vhost.add_route(*route);
            result_.graph.lookup_virtual_host(host).add_route(std::move(*route));
            continue;
        }

        if (!spec.delegate) continue;

        const auto* dest = resolve_delegate(res, *spec.delegate);
        if (dest == nullptr) continue;

        if (std::find(visited.begin(), visited.end(), dest->id) != visited.end()) {
            set_invalid(res.id, "route creates a delegation cycle: " + cycle_path(visited, dest->id), host);
            continue;
        }
        process_routes(*dest, spec.match, visited, host, enforce_tls);
    }

    set_valid(res.id, host);
}

void Pass::process_tcpproxy(const RouteResource& res, std::vector<ResourceId> visited, const std::string& host) {
    visited.push_back(res.id);

    if (!res.tcpproxy) {
        set_invalid(res.id, "tcpproxy: delegation target has no tcpproxy", host);
        return;
    }
    const auto& tp = *res.tcpproxy;

    if (!tp.services.empty() && tp.delegate) {
        set_invalid(res.id, "tcpproxy: cannot specify services and delegate in the same tcpproxy", host);
        return;
    }

    if (!tp.services.empty()) {
        if (const auto total = total_weight(tp.services, true); total > MAX_TOTAL_WEIGHT) {
            set_invalid(res.id, "tcpproxy: " + weight_overflow(total), host);
            return;
        }
        TcpProxy proxy;
        for (const auto& s : tp.services) {
            auto cluster = build_cluster(res.id.ns, s, Owner::TcpProxy, "tcpproxy");
            if (!cluster) {
                set_invalid(res.id, cluster.error(), host);
                return;
            }
            proxy.clusters.push_back(std::move(*cluster));
        }
        result_.graph.lookup_secure_virtual_host(host).tcp_proxy = std::move(proxy);
        set_valid(res.id, host);
        return;
    }

    if (tp.delegate) {
        if (const auto* dest = resolve_delegate(res, *tp.delegate)) {
            if (std::find(visited.begin(), visited.end(), dest->id) != visited.end()) {
                set_invalid(res.id, "tcpproxy creates a delegation cycle: " + cycle_path(visited, dest->id), host);
                return;
            }
            process_tcpproxy(*dest, visited, host);
        }
    }
    set_valid(res.id, host);
}

//------------------------------- Lookups --------------------------------------

trellis_detail::expected<Secret, std::string> Pass::lookup_secret(const ResourceId& id, SecretUse use) const {
    const auto* s = store_.secret(id);
    if (s == nullptr) return trellis_detail::unexpected<std::string>("Secret not found");

    Secret out{s->id, s->data};
    switch (use) {
        case SecretUse::Tls:
            if (out.cert().empty() || out.key().empty()) {
                return trellis_detail::unexpected<std::string>("missing TLS certificate or key");
            }
            break;
        case SecretUse::Ca:
            if (out.ca().empty()) {
                return trellis_detail::unexpected<std::string>("empty " + quote(CA_CERT_KEY) + " key");
            }
            break;
    }
    return out;
}

trellis_detail::expected<std::optional<PeerValidationContext>, std::string>
Pass::lookup_upstream_validation(const std::optional<source::UpstreamValidationSpec>& uv, const std::string& ns) const {
    if (!uv) return std::optional<PeerValidationContext>{};

    const ResourceId ca_id{ns, uv->ca_secret};
    auto ca = lookup_secret(ca_id, SecretUse::Ca);
    if (!ca) {
        return trellis_detail::unexpected<std::string>("invalid CA Secret " + quote(ca_id.str()) + ": " + ca.error());
    }
    if (uv->subject_name.empty()) {
        return trellis_detail::unexpected<std::string>("missing subject alternative name");
    }
    return std::optional<PeerValidationContext>{PeerValidationContext{std::move(*ca), uv->subject_name}};
}

//------------------------------- Route construction ---------------------------

namespace {

trellis_detail::expected<std::vector<HeaderCondition>, std::string>
header_conditions(const std::vector<source::HeaderMatch>& matches) {
    std::vector<HeaderCondition> out;
    std::map<std::string, std::string> exact_by_name;

    const auto add = [&out](HeaderCondition c) {
        if (std::find(out.begin(), out.end(), c) == out.end()) out.push_back(std::move(c));
    };

    for (const auto& m : matches) {
        if (m.present) add(HeaderCondition{m.name, "", HeaderMatchType::Present, false});
        if (!m.contains.empty()) add(HeaderCondition{m.name, m.contains, HeaderMatchType::Contains, false});
        if (!m.not_contains.empty()) add(HeaderCondition{m.name, m.not_contains, HeaderMatchType::Contains, true});
        if (!m.exact.empty()) {
            const auto key = to_lower(m.name);
            if (exact_by_name.contains(key)) {
                return trellis_detail::unexpected<std::string>(
                    "cannot specify duplicate header 'exact match' conditions in the same route");
            }
            exact_by_name.emplace(key, m.exact);
            add(HeaderCondition{m.name, m.exact, HeaderMatchType::Exact, false});
        }
        if (!m.not_exact.empty()) {
            const auto it = exact_by_name.find(to_lower(m.name));
            if (it != exact_by_name.end() && it->second == m.not_exact) {
                return trellis_detail::unexpected<std::string>(
                    "cannot specify 'not exact match' header condition for the same value as an 'exact match' "
                    "header condition in the same route");
            }
            add(HeaderCondition{m.name, m.not_exact, HeaderMatchType::Exact, true});
        }
    }
    return out;
}

trellis_detail::expected<std::optional<HeadersPolicy>, std::string>
headers_policy(const std::optional<source::HeadersPolicySpec>& spec, bool allow_host_rewrite) {
    if (!spec) return std::optional<HeadersPolicy>{};

    HeadersPolicy out;
    for (const auto& h : spec->set) {
        const auto key = canonical_header_key(h.name);
        if (out.set.contains(key)) {
            return trellis_detail::unexpected<std::string>("duplicate header addition: " + quote(key));
        }
        if (key == "Host") {
            if (!allow_host_rewrite) {
                return trellis_detail::unexpected<std::string>("rewriting " + quote(key) + " header is not supported");
            }
            out.host_rewrite = h.value;
            continue;
        }
        if (!valid_header_name(key)) {
            return trellis_detail::unexpected<std::string>("invalid set header " + quote(key));
        }
        out.set.emplace(key, escape_header_value(h.value));
    }

    std::set<std::string> removed;
    for (const auto& name : spec->remove) {
        const auto key = canonical_header_key(name);
        if (removed.contains(key)) {
            return trellis_detail::unexpected<std::string>("duplicate header removal: " + quote(key));
        }
        if (!valid_header_name(key)) {
            return trellis_detail::unexpected<std::string>("invalid remove header " + quote(key));
        }
        removed.insert(key);
    }
    out.remove.assign(removed.begin(), removed.end());
    return std::optional<HeadersPolicy>{std::move(out)};
}

trellis_detail::expected<std::optional<util::Duration>, std::string>
clamp_idle_timeout(const std::optional<util::Duration>& d) {
    if (!d) return std::optional<util::Duration>{};
    if (d->count() <= 0) return trellis_detail::unexpected<std::string>("idle timeout can not be disabled");
    return std::optional<util::Duration>{std::min(*d, util::Duration{MAX_IDLE_TIMEOUT})};
}

bool sampling_in_range(std::int64_t v) noexcept { return v >= 0 && v <= MAX_TRACING_SAMPLING; }

} // namespace

trellis_detail::expected<Cluster, std::string>
Pass::build_cluster(const std::string& ns, const ServiceRef& s, Owner owner, const std::string& context) const {
    const auto where = context + ": service " + quote(s.name);

    if (s.port < static_cast<std::int64_t>(MIN_PORT) || s.port > static_cast<std::int64_t>(MAX_PORT)) {
        return trellis_detail::unexpected<std::string>(where + ": port must be in the range 1-65535");
    }
    const auto port = static_cast<std::uint32_t>(s.port);

    const auto* svc = store_.service(ResourceId{ns, s.name});
    const source::ServicePort* sp = nullptr;
    if (svc != nullptr) {
        const auto it = std::find_if(svc->ports.begin(), svc->ports.end(),
                                     [port](const source::ServicePort& p) { return p.port == port; });
        if (it != svc->ports.end()) sp = &*it;
    }
    if (sp == nullptr) {
        if (owner == Owner::TcpProxy) {
            return trellis_detail::unexpected<std::string>(
                "tcpproxy: service " + ns + "/" + s.name + "/" + std::to_string(port) + ": not found");
        }
        return trellis_detail::unexpected<std::string>(
            "Service [" + s.name + ":" + std::to_string(port) + "] is invalid or missing");
    }

    Cluster c;
    c.upstream = Service{svc->id, sp->name, sp->port, sp->protocol};
    c.protocol = sp->protocol;
    c.load_balancer_policy = s.strategy;
    c.weight = s.weight;

    if (s.health_check) {
        const auto& hc = *s.health_check;
        c.health_check = HealthCheckPolicy{
            hc.path, hc.host,
            std::chrono::duration_cast<util::Duration>(std::chrono::seconds(hc.interval_seconds)),
            std::chrono::duration_cast<util::Duration>(std::chrono::seconds(hc.timeout_seconds)),
            hc.unhealthy_threshold_count, hc.healthy_threshold_count};
    }

    // Upstream validation only applies to backends that speak TLS.
    if (c.protocol == "tls") {
        auto uv = lookup_upstream_validation(s.upstream_validation, ns);
        if (!uv) return trellis_detail::unexpected<std::string>(where + ": " + uv.error());
        c.upstream_validation = std::move(*uv);
    }

    auto idle = clamp_idle_timeout(s.idle_timeout);
    if (!idle) return trellis_detail::unexpected<std::string>(where + ": " + idle.error());
    c.idle_timeout = *idle;

    return c;
}

trellis_detail::expected<Route, std::string>
Pass::build_route(const RouteResource& res, const RouteSpec& spec, bool enforce_tls) const {
    const auto where = "route " + quote(spec.match);

    Route r;
    r.prefix = spec.match;
    r.websocket = spec.enable_websockets;
    r.https_upgrade = enforce_tls && !(spec.permit_insecure && !cfg_.disable_permit_insecure);
    r.prefix_rewrite = spec.prefix_rewrite;

    auto headers = header_conditions(spec.header_match);
    if (!headers) return trellis_detail::unexpected<std::string>(where + ": " + headers.error());
    r.headers = std::move(*headers);

    auto req = headers_policy(spec.request_headers_policy, true);
    if (!req) return trellis_detail::unexpected<std::string>(where + ": " + req.error() + " on request headers");
    r.request_headers_policy = std::move(*req);

    auto resp = headers_policy(spec.response_headers_policy, false);
    if (!resp) return trellis_detail::unexpected<std::string>(where + ": " + resp.error() + " on response headers");
    r.response_headers_policy = std::move(*resp);

    auto idle = clamp_idle_timeout(spec.idle_timeout);
    if (!idle) return trellis_detail::unexpected<std::string>(where + ": " + idle.error());
    r.idle_timeout = *idle;

    if (spec.timeout) {
        if (spec.timeout->count() < 0) {
            return trellis_detail::unexpected<std::string>(where + ": timeout value must be >= 0");
        }
        r.timeout = spec.timeout;
    }

    if (spec.tracing) {
        const auto& t = *spec.tracing;
        if (!sampling_in_range(t.client_sampling)) {
            return trellis_detail::unexpected<std::string>(
                where + ": tracing client sampling " + std::to_string(t.client_sampling) + " must be between 0 and 100");
        }
        if (!sampling_in_range(t.random_sampling)) {
            return trellis_detail::unexpected<std::string>(
                where + ": tracing random sampling " + std::to_string(t.random_sampling) + " must be between 0 and 100");
        }
        r.tracing = TracingPolicy{static_cast<std::uint32_t>(t.client_sampling),
                                  static_cast<std::uint32_t>(t.random_sampling)};
    }

    if (spec.timeout_policy) r.timeout_policy = TimeoutPolicy{parse_timeout(spec.timeout_policy->request)};
    if (spec.retry_policy) {
        r.retry_policy = RetryPolicy{std::string{DEFAULT_RETRY_ON}, std::max<std::uint32_t>(1, spec.retry_policy->count),
                                     parse_timeout(spec.retry_policy->per_try_timeout)};
    }
    for (const auto& h : spec.hash_policy) {
        r.hash_policy.push_back(HashPolicy{h.header_name, h.cookie_name, h.cookie_path, h.cookie_ttl, h.source_ip, h.terminal});
    }

    if (const auto total = total_weight(spec.services, false); total > MAX_TOTAL_WEIGHT) {
        return trellis_detail::unexpected<std::string>(where + ": " + weight_overflow(total));
    }
    for (const auto& s : spec.services) {
        auto cluster = build_cluster(res.id.ns, s, Owner::Route, where);
        if (!cluster) return trellis_detail::unexpected<std::string>(cluster.error());
        r.clusters.push_back(std::move(*cluster));
    }
    return r;
}

} // namespace

//------------------------------- Builder --------------------------------------

BuildResult Builder::build(const source::EntityStore& store) const {
    Pass pass(store, cfg_);
    return pass.run();
}

} // namespace trellis::dag
