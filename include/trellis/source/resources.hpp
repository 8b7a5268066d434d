/**
 * @file resources.hpp
 * @brief User-authored resource model consumed by the graph builder.
 *
 * These types mirror what the watch layer hands over: routing resources
 * (roots declare a virtual host, delegates do not), backend services, TLS
 * secrets and certificate delegation grants. Everything is plain data with
 * defaulted equality so snapshots can be compared and copied freely.
 */
#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "trellis/util/duration.hpp"

namespace trellis::source {

/**
 * @brief Stable identity of a resource: namespace + name.
 *
 * Ordering is (namespace, name) so maps keyed by ResourceId iterate
 * deterministically.
 */
struct ResourceId final {
  std::string ns;
  std::string name;

  /// "namespace/name"
  std::string str() const { return ns + "/" + name; }

  auto operator<=>(const ResourceId&) const = default;
  bool operator==(const ResourceId&) const = default;
};

// --------------------------------------------------------------------------
// Routing resource
// --------------------------------------------------------------------------

/// Header condition on a route. Exactly one matcher is expected to be set.
struct HeaderMatch final {
  std::string name;
  bool present{false};
  std::string contains;
  std::string not_contains;
  std::string exact;
  std::string not_exact;

  bool operator==(const HeaderMatch&) const = default;
};

/// Active health checking of a backend.
struct HealthCheckSpec final {
  std::string path;
  std::string host;
  std::int64_t interval_seconds{0};
  std::int64_t timeout_seconds{0};
  std::uint32_t unhealthy_threshold_count{0};
  std::uint32_t healthy_threshold_count{0};

  bool operator==(const HealthCheckSpec&) const = default;
};

/// Validation of a TLS-speaking backend: CA secret (same namespace) + expected SAN.
struct UpstreamValidationSpec final {
  std::string ca_secret;
  std::string subject_name;

  bool operator==(const UpstreamValidationSpec&) const = default;
};

/// Backend reference inside a route or tcp proxy.
struct ServiceRef final {
  std::string name;
  std::int64_t port{0};
  std::uint32_t weight{0};
  std::string strategy;  ///< load balancing policy, e.g. "RoundRobin", "WeightedLeastRequest"
  std::optional<HealthCheckSpec> health_check;
  std::optional<UpstreamValidationSpec> upstream_validation;
  std::optional<util::Duration> idle_timeout;

  bool operator==(const ServiceRef&) const = default;
};

/// Delegation edge target; an empty namespace means "same namespace as the referrer".
struct DelegateRef final {
  std::string name;
  std::string ns;

  bool operator==(const DelegateRef&) const = default;
};

struct TimeoutPolicySpec final {
  std::string request;  ///< "", "infinity" or a duration string

  bool operator==(const TimeoutPolicySpec&) const = default;
};

struct RetryPolicySpec final {
  std::uint32_t count{0};
  std::string per_try_timeout;

  bool operator==(const RetryPolicySpec&) const = default;
};

struct HashPolicySpec final {
  std::string header_name;
  std::string cookie_name;
  std::string cookie_path;
  std::optional<util::Duration> cookie_ttl;
  bool source_ip{false};
  bool terminal{false};

  bool operator==(const HashPolicySpec&) const = default;
};

struct TracingSpec final {
  std::int64_t client_sampling{0};
  std::int64_t random_sampling{0};

  bool operator==(const TracingSpec&) const = default;
};

struct HeaderValue final {
  std::string name;
  std::string value;

  bool operator==(const HeaderValue&) const = default;
};

struct HeadersPolicySpec final {
  std::vector<HeaderValue> set;
  std::vector<std::string> remove;

  bool operator==(const HeadersPolicySpec&) const = default;
};

/**
 * @brief One route entry: either terminal (services) or a delegation edge.
 * @note Listing services and a delegate in the same entry is invalid.
 */
struct RouteSpec final {
  std::string match;  ///< path prefix
  std::vector<HeaderMatch> header_match;
  std::vector<ServiceRef> services;
  std::optional<DelegateRef> delegate;
  bool enable_websockets{false};
  bool permit_insecure{false};
  std::string prefix_rewrite;
  std::optional<TimeoutPolicySpec> timeout_policy;
  std::optional<RetryPolicySpec> retry_policy;
  std::vector<HashPolicySpec> hash_policy;
  std::optional<util::Duration> idle_timeout;
  std::optional<util::Duration> timeout;
  std::optional<TracingSpec> tracing;
  std::optional<HeadersPolicySpec> request_headers_policy;
  std::optional<HeadersPolicySpec> response_headers_policy;

  bool operator==(const RouteSpec&) const = default;
};

/// Raw TCP forwarding block; same services/delegate duality as a route.
struct TcpProxySpec final {
  std::vector<ServiceRef> services;
  std::optional<DelegateRef> delegate;

  bool operator==(const TcpProxySpec&) const = default;
};

struct ClientValidationSpec final {
  std::string ca_secret;

  bool operator==(const ClientValidationSpec&) const = default;
};

/**
 * @brief TLS block of a virtual host.
 *
 * Passthrough applies only when no secret is named. Protocol versions are
 * strings ("1.2", "1.3"); anything else means "default".
 */
struct TlsSpec final {
  std::string secret_name;  ///< "name" or "namespace/name"
  std::string minimum_protocol_version;
  std::string maximum_protocol_version;
  bool passthrough{false};
  bool enable_fallback_certificate{false};
  std::optional<ClientValidationSpec> client_validation;

  bool operator==(const TlsSpec&) const = default;
};

struct VirtualHostSpec final {
  std::string fqdn;
  std::optional<TlsSpec> tls;

  bool operator==(const VirtualHostSpec&) const = default;
};

/**
 * @brief A routing resource. Roots carry a virtual host; delegates do not.
 */
struct RouteResource final {
  ResourceId id;
  std::optional<VirtualHostSpec> virtual_host;
  std::vector<RouteSpec> routes;
  std::optional<TcpProxySpec> tcpproxy;

  bool is_root() const noexcept { return virtual_host.has_value(); }

  bool operator==(const RouteResource&) const = default;
};

// --------------------------------------------------------------------------
// Services, secrets, delegation grants
// --------------------------------------------------------------------------

/// One exposed port of a backend. Protocol is "", "h2", "h2c" or "tls".
struct ServicePort final {
  std::string name;
  std::uint32_t port{0};
  std::string protocol;

  bool operator==(const ServicePort&) const = default;
};

struct Service final {
  ResourceId id;
  std::vector<ServicePort> ports;

  bool operator==(const Service&) const = default;
};

/// TLS material keyed by data name ("tls.crt", "tls.key", "ca.crt").
struct Secret final {
  ResourceId id;
  std::map<std::string, std::string> data;

  bool operator==(const Secret&) const = default;
};

/// Grants use of a secret to other namespaces ("*" grants every namespace).
struct CertificateDelegationEntry final {
  std::string secret_name;
  std::vector<std::string> target_namespaces;

  bool operator==(const CertificateDelegationEntry&) const = default;
};

struct CertificateDelegation final {
  ResourceId id;  ///< lives in the secret's namespace
  std::vector<CertificateDelegationEntry> delegations;

  bool operator==(const CertificateDelegation&) const = default;
};

} // namespace trellis::source
