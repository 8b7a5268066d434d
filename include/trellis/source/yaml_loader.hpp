#pragma once
/**
 * @file yaml_loader.hpp
 * @brief Reads resources from a multi-document YAML stream (yaml-cpp).
 *
 * Each document carries `kind`, `metadata` (`name`, `namespace`, defaulting to
 * "default") and `spec` (for Secrets: `data`). Recognised kinds are
 * IngressRoute, Service, Secret and TLSCertificateDelegation; other kinds are
 * skipped with a debug log. Field names follow the resource's camelCase schema.
 */

#include <string>

#include "trellis/compat/expected.hpp"
#include "trellis/source/entity_store.hpp"

namespace trellis::source {

/// Parse every document in @p text. The first malformed document fails the whole load.
trellis_detail::expected<Snapshot, std::string> load_resources(const std::string& text);

/// load_resources() on the contents of @p path.
trellis_detail::expected<Snapshot, std::string> load_resources_file(const std::string& path);

} // namespace trellis::source
