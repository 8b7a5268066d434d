#include "trellis/source/entity_store.hpp"

#include <algorithm>

namespace trellis::source {

namespace {
template <class Map>
const typename Map::mapped_type* find_in(const Map& m, const ResourceId& id) {
    const auto it = m.find(id);
    return it == m.end() ? nullptr : &it->second;
}
} // namespace

std::vector<const RouteResource*> Snapshot::routes() const {
    std::vector<const RouteResource*> out;
    out.reserve(route_resources.size());
    for (const auto& kv : route_resources) out.push_back(&kv.second);
    return out;
}

const RouteResource* Snapshot::route(const ResourceId& id) const { return find_in(route_resources, id); }
const Service* Snapshot::service(const ResourceId& id) const     { return find_in(services, id); }
const Secret* Snapshot::secret(const ResourceId& id) const       { return find_in(secrets, id); }

bool Snapshot::delegation_permitted(const ResourceId& secret, std::string_view consumer_ns) const {
    if (secret.ns == consumer_ns) return true;

    for (const auto& [id, cd] : delegations) {
        if (id.ns != secret.ns) continue;
        for (const auto& d : cd.delegations) {
            if (d.secret_name != secret.name) continue;
            const bool granted = std::any_of(d.target_namespaces.begin(), d.target_namespaces.end(),
                [&](const std::string& t) { return t == "*" || t == consumer_ns; });
            if (granted) return true;
        }
    }
    return false;
}

} // namespace trellis::source
