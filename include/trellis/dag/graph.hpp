#pragma once
/**
 * @file graph.hpp
 * @brief Compiled configuration graph: virtual hosts, routes, clusters and their leaves.
 *
 * The graph is rebuilt from scratch on every pass and owned by that pass.
 * Leaves (services, secrets) are held by value inside the nodes that use them,
 * so a Graph can be handed off or discarded without dangling references.
 *
 * Traversal uses a closed tagged variant (Vertex) and a dispatch table keyed by
 * Kind rather than runtime type inspection.
 */

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "trellis/source/resources.hpp"
#include "trellis/util/duration.hpp"

namespace trellis::dag {

// -----------------------------------------------------------------------------
// TLS protocol versions
// -----------------------------------------------------------------------------

/// Ordered so std::max picks the stricter version. Auto means "proxy default".
enum class TlsVersion : std::uint8_t { Auto = 0, V1_0, V1_1, V1_2, V1_3 };

/// Requested minimum: "1.3"/"1.2" honoured, anything else is TLS 1.1.
TlsVersion parse_min_tls_version(std::string_view s) noexcept;
/// Requested maximum: "1.3"/"1.2" honoured, anything else is Auto.
TlsVersion parse_max_tls_version(std::string_view s) noexcept;
/// Auto resolves to the highest supported version.
TlsVersion resolve_max_tls_version(TlsVersion v) noexcept;
std::string_view to_string(TlsVersion v) noexcept;

// -----------------------------------------------------------------------------
// Leaves
// -----------------------------------------------------------------------------

/// A resolved backend port.
struct Service final {
    source::ResourceId id;
    std::string   port_name;
    std::uint32_t port{0};
    std::string   protocol;  ///< "", "h2", "h2c", "tls"

    bool operator==(const Service&) const = default;
};

/// Resolved TLS material.
struct Secret final {
    source::ResourceId id;
    std::map<std::string, std::string> data;

    std::string cert() const;
    std::string key() const;
    std::string ca() const;

    bool operator==(const Secret&) const = default;
};

/// CA bundle + optional expected subject name for peer certificate validation.
struct PeerValidationContext final {
    Secret ca_certificate;
    std::string subject_name;

    bool operator==(const PeerValidationContext&) const = default;
};

// -----------------------------------------------------------------------------
// Policies
// -----------------------------------------------------------------------------

/// A timeout that may be left at the proxy default, disabled, or set.
struct Timeout final {
    enum class Mode : std::uint8_t { Default, Disabled, Value };
    Mode mode{Mode::Default};
    util::Duration value{0};

    bool operator==(const Timeout&) const = default;
};

/// "" → Default, "infinity" → Disabled, unparseable or non-positive → Disabled.
Timeout parse_timeout(std::string_view s);

struct HealthCheckPolicy final {
    std::string path;
    std::string host;
    util::Duration interval{0};
    util::Duration timeout{0};
    std::uint32_t unhealthy_threshold{0};
    std::uint32_t healthy_threshold{0};

    bool operator==(const HealthCheckPolicy&) const = default;
};

struct TimeoutPolicy final {
    Timeout response_timeout;

    bool operator==(const TimeoutPolicy&) const = default;
};

struct RetryPolicy final {
    std::string   retry_on;
    std::uint32_t num_retries{0};
    Timeout       per_try_timeout;

    bool operator==(const RetryPolicy&) const = default;
};

struct HashPolicy final {
    std::string header_name;
    std::string cookie_name;
    std::string cookie_path;
    std::optional<util::Duration> cookie_ttl;
    bool source_ip{false};
    bool terminal{false};

    bool operator==(const HashPolicy&) const = default;
};

struct TracingPolicy final {
    std::uint32_t client_sampling{0};
    std::uint32_t random_sampling{0};

    bool operator==(const TracingPolicy&) const = default;
};

/// Header rewrites; names are canonicalised ("X-Foo"), Host is split out.
struct HeadersPolicy final {
    std::map<std::string, std::string> set;
    std::string host_rewrite;
    std::vector<std::string> remove;

    bool operator==(const HeadersPolicy&) const = default;
};

// -----------------------------------------------------------------------------
// Nodes
// -----------------------------------------------------------------------------

struct Cluster final {
    Service upstream;
    std::string protocol;
    std::string load_balancer_policy;
    std::uint32_t weight{0};
    std::optional<HealthCheckPolicy> health_check;
    std::optional<PeerValidationContext> upstream_validation;
    std::optional<util::Duration> idle_timeout;

    bool operator==(const Cluster&) const = default;
};

enum class HeaderMatchType : std::uint8_t { Present, Contains, Exact };

struct HeaderCondition final {
    std::string name;
    std::string value;
    HeaderMatchType type{HeaderMatchType::Present};
    bool invert{false};

    bool operator==(const HeaderCondition&) const = default;
};

struct Route final {
    std::string prefix;
    std::vector<HeaderCondition> headers;
    std::vector<Cluster> clusters;
    bool websocket{false};
    bool https_upgrade{false};
    std::string prefix_rewrite;
    std::optional<TimeoutPolicy> timeout_policy;
    std::optional<RetryPolicy> retry_policy;
    std::vector<HashPolicy> hash_policy;
    std::optional<util::Duration> idle_timeout;
    std::optional<util::Duration> timeout;
    std::optional<TracingPolicy> tracing;
    std::optional<HeadersPolicy> request_headers_policy;
    std::optional<HeadersPolicy> response_headers_policy;

    /// Identity of the match conditions; a later route with the same key replaces the earlier one.
    std::string condition_key() const;

    bool operator==(const Route&) const = default;
};

struct TcpProxy final {
    std::vector<Cluster> clusters;

    bool operator==(const TcpProxy&) const = default;
};

/// Insecure route table for one FQDN. Routes keep insertion order.
struct VirtualHost final {
    std::string name;
    std::vector<Route> routes;

    void add_route(Route r);
    bool valid() const noexcept { return !routes.empty(); }
};

/// TLS counterpart. secret is empty under passthrough.
struct SecureVirtualHost final {
    VirtualHost vhost;
    std::optional<Secret> secret;
    TlsVersion min_tls_version{TlsVersion::V1_1};
    TlsVersion max_tls_version{TlsVersion::Auto};
    std::optional<Secret> fallback_certificate;
    std::optional<PeerValidationContext> downstream_validation;
    std::optional<TcpProxy> tcp_proxy;

    const std::string& name() const noexcept { return vhost.name; }
    /// Terminating hosts need routes or a tcp proxy; passthrough hosts need a tcp proxy.
    bool valid() const noexcept {
        return (secret.has_value() && vhost.valid()) || tcp_proxy.has_value();
    }
};

// -----------------------------------------------------------------------------
// Vertex: closed tagged variant over node kinds
// -----------------------------------------------------------------------------

enum class Kind : std::uint8_t { VirtualHost = 0, SecureVirtualHost, Route, Cluster, TcpProxy, Service, Secret };
inline constexpr std::size_t kKindCount = 7;

/// Alternative order matches Kind.
using Vertex = std::variant<const VirtualHost*, const SecureVirtualHost*, const Route*,
                            const Cluster*, const TcpProxy*, const Service*, const Secret*>;

inline Kind kind_of(const Vertex& v) noexcept { return static_cast<Kind>(v.index()); }

template <class T>
const T& node(const Vertex& v) { return *std::get<const T*>(v); }

using VertexFn = std::function<void(const Vertex&)>;

/// Call @p fn for every direct child of @p v.
void visit_children(const Vertex& v, const VertexFn& fn);

/**
 * @class Dispatch
 * @brief Per-kind handler table. Kinds without a handler are descended into.
 */
class Dispatch final {
public:
    Dispatch& on(Kind k, VertexFn handler) {
        table_[static_cast<std::size_t>(k)] = std::move(handler);
        return *this;
    }

    void operator()(const Vertex& v) const;

private:
    std::array<VertexFn, kKindCount> table_{};
};

// -----------------------------------------------------------------------------
// Graph
// -----------------------------------------------------------------------------

class Graph final {
public:
    /// Find or create the insecure virtual host for @p fqdn.
    VirtualHost& lookup_virtual_host(const std::string& fqdn);
    /// Find or create the secure virtual host for @p fqdn.
    SecureVirtualHost& lookup_secure_virtual_host(const std::string& fqdn);

    const VirtualHost* virtual_host(const std::string& fqdn) const;
    const SecureVirtualHost* secure_virtual_host(const std::string& fqdn) const;

    /**
     * @brief Visit every valid root vertex: insecure hosts by name, then secure hosts by name.
     */
    void visit(const VertexFn& fn) const;

    std::size_t virtual_host_count() const noexcept { return vhosts_.size(); }
    std::size_t secure_virtual_host_count() const noexcept { return svhosts_.size(); }

private:
    std::map<std::string, VirtualHost> vhosts_;
    std::map<std::string, SecureVirtualHost> svhosts_;
};

} // namespace trellis::dag
