/**
 * @file listener.cpp
 * @brief Listener visitor: filter chain per secure host, TLS context grouping, fallback chain.
 */
#include "trellis/xds/listener.hpp"

#include <algorithm>

#include "trellis/xds/naming.hpp"

namespace trellis::xds {

using namespace trellis::config::constants;

//------------------------------- Config helpers -------------------------------

const std::vector<std::string>& default_access_log_fields() {
    static const std::vector<std::string> fields = {
        "@timestamp", "authority", "bytes_received", "bytes_sent", "downstream_local_address",
        "downstream_remote_address", "duration", "method", "path", "protocol", "request_id",
        "requested_server_name", "response_code", "response_flags", "uber_trace_id",
        "upstream_cluster", "upstream_host", "upstream_local_address", "upstream_service_time",
        "user_agent", "x_forwarded_for"};
    return fields;
}

dag::TlsVersion ListenerVisitorConfig::min_proto_version() const noexcept {
    return std::max(minimum_tls_version, dag::TlsVersion::V1_1);
}

util::Duration ListenerVisitorConfig::effective_request_timeout() const noexcept {
    return request_timeout.count() < 0 ? util::Duration{0} : request_timeout;
}

namespace {
std::vector<AccessLog> file_access_log(const std::string& path, const ListenerVisitorConfig& cfg) {
    AccessLog log{path, cfg.access_log_format, {}};
    if (cfg.access_log_format == AccessLogFormat::Json) {
        log.json_fields = cfg.access_log_fields.empty() ? default_access_log_fields() : cfg.access_log_fields;
    }
    return {log};
}
} // namespace

std::vector<AccessLog> ListenerVisitorConfig::insecure_access_log() const {
    return file_access_log(http_access_log, *this);
}

std::vector<AccessLog> ListenerVisitorConfig::secure_access_log() const {
    return file_access_log(https_access_log, *this);
}

//------------------------------- Visitor --------------------------------------

namespace {

SocketAddress socket_address(const std::string& address, std::uint32_t port) {
    return SocketAddress{address, port, address == "::"};
}

std::vector<ListenerFilter> custom_listener_filters(const ListenerVisitorConfig& cfg) {
    if (cfg.ip_filter.empty()) return {};
    return {ListenerFilter{std::string{IP_ALLOW_DENY_LISTENER_FILTER}, ListenerFilterKind::IpAllowDeny, cfg.ip_filter}};
}

std::vector<ListenerFilter> proxy_protocol(bool use) {
    if (!use) return {};
    return {ListenerFilter{std::string{PROXY_PROTOCOL_FILTER}, ListenerFilterKind::ProxyProtocol, {}}};
}

Filter http_connection_manager(std::string_view route_config, bool default_filters, const ListenerVisitorConfig& cfg,
                               std::vector<AccessLog> logs) {
    HttpConnectionManagerConfig hcm;
    hcm.route_config_name = std::string{route_config};
    hcm.stat_prefix = std::string{route_config == HTTP_LISTENER_NAME ? HTTP_LISTENER_NAME : HTTPS_LISTENER_NAME};
    hcm.access_logs = std::move(logs);
    hcm.request_timeout = cfg.effective_request_timeout();
    hcm.default_filters = default_filters;
    return Filter{std::string{HTTP_CONNECTION_MANAGER_FILTER}, make_http_connection_manager(hcm)};
}

Filter tcp_proxy(const dag::TcpProxy& proxy, std::vector<AccessLog> logs) {
    TcpProxyFilter f;
    f.stat_prefix = std::string{HTTPS_LISTENER_NAME};
    f.access_logs = std::move(logs);
    f.idle_timeout = std::chrono::duration_cast<util::Duration>(TCP_PROXY_IDLE_TIMEOUT);

    if (proxy.clusters.size() == 1) {
        f.cluster = cluster_name(proxy.clusters.front());
    } else {
        for (const auto& c : proxy.clusters) {
            f.weighted_clusters.push_back(TcpClusterWeight{cluster_name(c), c.weight == 0 ? 1u : c.weight});
        }
        std::stable_sort(f.weighted_clusters.begin(), f.weighted_clusters.end(),
                         [](const TcpClusterWeight& a, const TcpClusterWeight& b) {
                             if (a.name != b.name) return a.name < b.name;
                             return a.weight < b.weight;
                         });
    }
    return Filter{std::string{TCP_PROXY_FILTER}, std::move(f)};
}

DownstreamTlsContext downstream_tls(const dag::Secret& secret, dag::TlsVersion min, dag::TlsVersion max,
                                    const std::optional<dag::PeerValidationContext>& peer,
                                    std::vector<std::string> alpn) {
    DownstreamTlsContext ctx;
    ctx.params.min_version = min;
    ctx.params.max_version = dag::resolve_max_tls_version(max);
    ctx.certificate_secrets = {secret_name(secret)};
    ctx.alpn_protocols = std::move(alpn);
    if (peer) {
        ctx.validation = CertificateValidationContext{peer->ca_certificate.ca(), peer->subject_name};
        ctx.require_client_certificate = true;
    }
    return ctx;
}

const std::string& first_server_name(const FilterChain& fc) {
    static const std::string empty;
    return fc.match.server_names.empty() ? empty : fc.match.server_names.front();
}

class ListenerVisitor final {
public:
    explicit ListenerVisitor(const ListenerVisitorConfig& cfg) : cfg_(cfg) {
        https_.name = std::string{HTTPS_LISTENER_NAME};
        https_.address = socket_address(cfg.https_address, cfg.https_port);
        https_.listener_filters = proxy_protocol(cfg.use_proxy_protocol);
        https_.listener_filters.push_back(
            ListenerFilter{std::string{TLS_INSPECTOR_FILTER}, ListenerFilterKind::TlsInspector, {}});
        for (auto& f : custom_listener_filters(cfg)) https_.listener_filters.push_back(std::move(f));
    }

    std::map<std::string, Listener> run(const dag::Graph& g) {
        dag::Dispatch dispatch;
        dispatch.on(dag::Kind::VirtualHost, [this](const dag::Vertex&) { http_ = true; })
                .on(dag::Kind::SecureVirtualHost,
                    [this](const dag::Vertex& v) { on_secure(dag::node<dag::SecureVirtualHost>(v)); });
        g.visit([&dispatch](const dag::Vertex& v) { dispatch(v); });

        std::map<std::string, Listener> out;
        if (http_) {
            Listener l;
            l.name = std::string{HTTP_LISTENER_NAME};
            l.address = socket_address(cfg_.http_address, cfg_.http_port);
            l.listener_filters = proxy_protocol(cfg_.use_proxy_protocol);
            for (auto& f : custom_listener_filters(cfg_)) l.listener_filters.push_back(std::move(f));
            FilterChain fc;
            fc.filters.push_back(http_connection_manager(HTTP_LISTENER_NAME, true, cfg_, cfg_.insecure_access_log()));
            l.filter_chains.push_back(std::move(fc));
            out.emplace(std::string{HTTP_LISTENER_NAME}, std::move(l));
        }

        add_default_certificate_chain();

        if (!https_.filter_chains.empty()) {
            std::stable_sort(https_.filter_chains.begin(), https_.filter_chains.end(),
                             [](const FilterChain& a, const FilterChain& b) {
                                 return first_server_name(a) < first_server_name(b);
                             });
            out.emplace(std::string{HTTPS_LISTENER_NAME}, std::move(https_));
        }
        return out;
    }

private:
    const ListenerVisitorConfig& cfg_;
    Listener https_;
    bool http_{false};
    std::map<source::ResourceId, dag::Secret> secrets_;

    void on_secret(const dag::Secret& s) { secrets_.try_emplace(s.id, s); }

    bool has_fallback_chain() const {
        return std::any_of(https_.filter_chains.begin(), https_.filter_chains.end(),
                           [](const FilterChain& fc) { return fc.name == FALLBACK_FILTER_CHAIN_NAME; });
    }

    void on_secure(const dag::SecureVirtualHost& svh) {
        if (svh.secret) on_secret(*svh.secret);
        if (svh.fallback_certificate) on_secret(*svh.fallback_certificate);

        std::vector<Filter> filters;
        std::vector<std::string> alpn;
        if (!svh.tcp_proxy) {
            filters.push_back(http_connection_manager(HTTPS_LISTENER_NAME, true, cfg_, cfg_.secure_access_log()));
            alpn = {"h2", "http/1.1"};
        } else {
            // No ALPN for TCP proxying; the backend negotiates it.
            filters.push_back(tcp_proxy(*svh.tcp_proxy, cfg_.secure_access_log()));
        }

        std::optional<DownstreamTlsContext> tls;
        if (svh.secret) {
            tls = downstream_tls(*svh.secret, std::max(cfg_.min_proto_version(), svh.min_tls_version),
                                 svh.max_tls_version, svh.downstream_validation, alpn);
        }

        bool grouped = false;
        if (!svh.tcp_proxy && tls) {
            for (auto& fc : https_.filter_chains) {
                if (!fc.tls || fc.has_tcp_proxy()) continue;
                if (*fc.tls == *tls) {
                    fc.match.server_names.push_back(svh.name());
                    std::sort(fc.match.server_names.begin(), fc.match.server_names.end());
                    grouped = true;
                    break;
                }
            }
        }
        if (!grouped) {
            FilterChain fc;
            fc.match.server_names = {svh.name()};
            fc.tls = std::move(tls);
            fc.filters = std::move(filters);
            https_.filter_chains.push_back(std::move(fc));
        }

        if (svh.fallback_certificate && !has_fallback_chain()) {
            FilterChain fc;
            fc.name = std::string{FALLBACK_FILTER_CHAIN_NAME};
            fc.match.transport_protocol = "tls";
            fc.tls = downstream_tls(*svh.fallback_certificate, cfg_.min_proto_version(), dag::TlsVersion::Auto,
                                    svh.downstream_validation, alpn);
            fc.filters.push_back(
                http_connection_manager(FALLBACK_ROUTE_CONFIG_NAME, false, cfg_, cfg_.secure_access_log()));
            https_.filter_chains.push_back(std::move(fc));
        }
    }

    void add_default_certificate_chain() {
        if (!cfg_.default_certificate) return;
        const auto it = secrets_.find(*cfg_.default_certificate);
        if (it == secrets_.end()) return;

        FilterChain fc;
        fc.match.server_names = {""};
        fc.tls = downstream_tls(it->second, cfg_.min_proto_version(), dag::TlsVersion::Auto, std::nullopt,
                                {"h2", "http/1.1"});
        fc.filters.push_back(http_connection_manager(HTTPS_LISTENER_NAME, true, cfg_, cfg_.secure_access_log()));
        https_.filter_chains.push_back(std::move(fc));
    }
};

} // namespace

std::map<std::string, Listener> visit_listeners(const dag::Graph& g, const ListenerVisitorConfig& cfg) {
    ListenerVisitor v(cfg);
    return v.run(g);
}

} // namespace trellis::xds
