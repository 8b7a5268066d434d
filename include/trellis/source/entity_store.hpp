#pragma once
/**
 * @file entity_store.hpp
 * @brief Read-only, point-in-time view of the watched resources.
 * @details The watch layer owns the live objects; the builder only needs lookups.
 */

#include <map>
#include <string_view>
#include <vector>

#include "trellis/source/resources.hpp"

namespace trellis::source {

    class EntityStore {
    public:
        virtual ~EntityStore() = default;

        /// Every routing resource, ordered by (namespace, name).
        virtual std::vector<const RouteResource*> routes() const = 0;

        /// Routing resource by identity, or nullptr.
        virtual const RouteResource* route(const ResourceId& id) const = 0;

        /// Backend service by identity, or nullptr.
        virtual const Service* service(const ResourceId& id) const = 0;

        /// TLS secret by identity, or nullptr.
        virtual const Secret* secret(const ResourceId& id) const = 0;

        /**
         * @brief May a resource in @p consumer_ns reference @p secret?
         * @note Same-namespace use is always permitted.
         */
        virtual bool delegation_permitted(const ResourceId& secret, std::string_view consumer_ns) const = 0;
    };

    /**
     * @struct Snapshot
     * @brief Immutable-by-convention value implementation of EntityStore.
     */
    struct Snapshot final : EntityStore {
        std::map<ResourceId, RouteResource>         route_resources;
        std::map<ResourceId, Service>               services;
        std::map<ResourceId, Secret>                secrets;
        std::map<ResourceId, CertificateDelegation> delegations;

        std::vector<const RouteResource*> routes() const override;
        const RouteResource* route(const ResourceId& id) const override;
        const Service* service(const ResourceId& id) const override;
        const Secret* secret(const ResourceId& id) const override;
        bool delegation_permitted(const ResourceId& secret, std::string_view consumer_ns) const override;

        /// Total number of stored objects across kinds.
        std::size_t size() const noexcept {
            return route_resources.size() + services.size() + secrets.size() + delegations.size();
        }

        bool operator==(const Snapshot& o) const {
            return route_resources == o.route_resources && services == o.services &&
                   secrets == o.secrets && delegations == o.delegations;
        }
    };

} // namespace trellis::source
