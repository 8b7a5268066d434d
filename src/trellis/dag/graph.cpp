/**
 * @file graph.cpp
 * @brief Graph node helpers, vertex traversal and TLS version parsing.
 */
#include "trellis/dag/graph.hpp"

#include <algorithm>

#include "trellis/config/constants.hpp"

namespace trellis::dag {

using namespace trellis::config::constants;

//------------------------------- TLS versions ---------------------------------

TlsVersion parse_min_tls_version(std::string_view s) noexcept {
    if (s == "1.3") return TlsVersion::V1_3;
    if (s == "1.2") return TlsVersion::V1_2;
    return TlsVersion::V1_1;
}

TlsVersion parse_max_tls_version(std::string_view s) noexcept {
    if (s == "1.3") return TlsVersion::V1_3;
    if (s == "1.2") return TlsVersion::V1_2;
    return TlsVersion::Auto;
}

TlsVersion resolve_max_tls_version(TlsVersion v) noexcept {
    return v == TlsVersion::Auto ? TlsVersion::V1_3 : v;
}

std::string_view to_string(TlsVersion v) noexcept {
    switch (v) {
        case TlsVersion::Auto: return "TLS_AUTO";
        case TlsVersion::V1_0: return "TLSv1_0";
        case TlsVersion::V1_1: return "TLSv1_1";
        case TlsVersion::V1_2: return "TLSv1_2";
        case TlsVersion::V1_3: return "TLSv1_3";
    }
    return "TLS_AUTO";
}

//------------------------------- Leaves / policies ----------------------------

namespace {
std::string data_or_empty(const std::map<std::string, std::string>& m, std::string_view key) {
    const auto it = m.find(std::string{key});
    return it == m.end() ? std::string{} : it->second;
}
} // namespace

std::string Secret::cert() const { return data_or_empty(data, TLS_CERT_KEY); }
std::string Secret::key() const  { return data_or_empty(data, TLS_KEY_KEY); }
std::string Secret::ca() const   { return data_or_empty(data, CA_CERT_KEY); }

Timeout parse_timeout(std::string_view s) {
    if (s.empty()) return Timeout{};
    if (s == "infinity") return Timeout{Timeout::Mode::Disabled, util::Duration{0}};
    const auto d = util::parse_duration(s);
    // An unusable timeout is treated as infinite rather than rejecting the route.
    if (!d || d->count() <= 0) return Timeout{Timeout::Mode::Disabled, util::Duration{0}};
    return Timeout{Timeout::Mode::Value, *d};
}

std::string Route::condition_key() const {
    std::string key = "prefix:" + prefix;
    for (const auto& h : headers) {
        key += ",header:" + h.name;
        switch (h.type) {
            case HeaderMatchType::Present:  key += h.invert ? ":notpresent" : ":present"; break;
            case HeaderMatchType::Contains: key += (h.invert ? ":notcontains=" : ":contains=") + h.value; break;
            case HeaderMatchType::Exact:    key += (h.invert ? ":notexact=" : ":exact=") + h.value; break;
        }
    }
    return key;
}

void VirtualHost::add_route(Route r) {
    const auto key = r.condition_key();
    const auto it = std::find_if(routes.begin(), routes.end(),
                                 [&](const Route& existing) { return existing.condition_key() == key; });
    if (it != routes.end()) {
        *it = std::move(r);
        return;
    }
    routes.push_back(std::move(r));
}

//------------------------------- Traversal ------------------------------------

void visit_children(const Vertex& v, const VertexFn& fn) {
    switch (kind_of(v)) {
        case Kind::VirtualHost:
            for (const auto& r : node<VirtualHost>(v).routes) fn(Vertex{&r});
            break;
        case Kind::SecureVirtualHost: {
            const auto& svh = node<SecureVirtualHost>(v);
            if (svh.secret) fn(Vertex{&*svh.secret});
            if (svh.fallback_certificate) fn(Vertex{&*svh.fallback_certificate});
            if (svh.downstream_validation) fn(Vertex{&svh.downstream_validation->ca_certificate});
            for (const auto& r : svh.vhost.routes) fn(Vertex{&r});
            if (svh.tcp_proxy) fn(Vertex{&*svh.tcp_proxy});
            break;
        }
        case Kind::Route:
            for (const auto& c : node<Route>(v).clusters) fn(Vertex{&c});
            break;
        case Kind::TcpProxy:
            for (const auto& c : node<TcpProxy>(v).clusters) fn(Vertex{&c});
            break;
        case Kind::Cluster: {
            const auto& c = node<Cluster>(v);
            fn(Vertex{&c.upstream});
            if (c.upstream_validation) fn(Vertex{&c.upstream_validation->ca_certificate});
            break;
        }
        case Kind::Service:
        case Kind::Secret:
            break;
    }
}

void Dispatch::operator()(const Vertex& v) const {
    const auto& handler = table_[static_cast<std::size_t>(kind_of(v))];
    if (handler) {
        handler(v);
        return;
    }
    visit_children(v, [this](const Vertex& child) { (*this)(child); });
}

//------------------------------- Graph ----------------------------------------

VirtualHost& Graph::lookup_virtual_host(const std::string& fqdn) {
    auto [it, inserted] = vhosts_.try_emplace(fqdn);
    if (inserted) it->second.name = fqdn;
    return it->second;
}

SecureVirtualHost& Graph::lookup_secure_virtual_host(const std::string& fqdn) {
    auto [it, inserted] = svhosts_.try_emplace(fqdn);
    if (inserted) it->second.vhost.name = fqdn;
    return it->second;
}

const VirtualHost* Graph::virtual_host(const std::string& fqdn) const {
    const auto it = vhosts_.find(fqdn);
    return it == vhosts_.end() ? nullptr : &it->second;
}

const SecureVirtualHost* Graph::secure_virtual_host(const std::string& fqdn) const {
    const auto it = svhosts_.find(fqdn);
    return it == svhosts_.end() ? nullptr : &it->second;
}

void Graph::visit(const VertexFn& fn) const {
    for (const auto& [name, vh] : vhosts_) {
        if (vh.valid()) fn(Vertex{&vh});
    }
    for (const auto& [name, svh] : svhosts_) {
        if (svh.valid()) fn(Vertex{&svh});
    }
}

} // namespace trellis::dag
