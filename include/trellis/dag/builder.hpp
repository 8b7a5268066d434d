#pragma once
/**
 * @file builder.hpp
 * @brief Compiles a point-in-time resource view into a validated Graph.
 *
 * A build is a pure function of its input: roots are grouped by FQDN, each
 * valid root is walked along its delegation edges (cycle-safe), and every
 * resource ends the pass with exactly one status record. Validation failures
 * never throw; they mark the owning resource Invalid and the pass continues.
 */

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "trellis/dag/graph.hpp"
#include "trellis/dag/status.hpp"
#include "trellis/source/entity_store.hpp"

namespace trellis::dag {

/** @struct BuilderConfig
 *  @brief Process-wide policy applied while building.
 */
struct BuilderConfig {
    /// Namespaces allowed to declare roots; empty means any namespace.
    std::vector<std::string> root_namespaces;
    /// Ignore per-route permit_insecure, forcing HTTPS upgrade on every TLS route.
    bool disable_permit_insecure{false};
    /// Floor applied to every secure virtual host's minimum TLS version.
    TlsVersion minimum_tls_version{TlsVersion::V1_1};
    /// Secret served to clients that send no SNI, when a root opts in.
    std::optional<source::ResourceId> fallback_certificate;

    bool operator==(const BuilderConfig&) const = default;
};

/** @struct BuildResult
 *  @brief Graph plus one status per routing resource seen in the pass.
 */
struct BuildResult {
    Graph graph;
    std::map<source::ResourceId, Status> statuses;

    std::size_t count(StatusKind k) const noexcept;
    /// Status for @p id, or nullptr if the resource was not part of the pass.
    const Status* status(const source::ResourceId& id) const;
    /// Write every record to @p w in resource order.
    void publish(StatusWriter& w) const;
};

/** @class Builder
 *  @brief Stateless graph compiler; one instance may serve many passes.
 */
class Builder final {
public:
    explicit Builder(BuilderConfig cfg = {}) : cfg_(std::move(cfg)) {}

    BuildResult build(const source::EntityStore& store) const;

    const BuilderConfig& config() const noexcept { return cfg_; }

private:
    BuilderConfig cfg_;
};

/// Path-segment prefix check: "/foo/bar" extends "/foo", "/foobar" does not. An empty prefix matches all.
bool matches_path_prefix(std::string path, std::string prefix);

/// Hostname check; a single leading "*." wildcard label is accepted.
bool valid_fqdn(std::string_view host) noexcept;

/// Canonical MIME header key ("x-forwarded-for" becomes "X-Forwarded-For").
std::string canonical_header_key(std::string_view name);

} // namespace trellis::dag
