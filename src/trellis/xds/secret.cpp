/**
 * @file secret.cpp
 * @brief Secret visitor.
 */
#include "trellis/xds/secret.hpp"

#include "trellis/xds/naming.hpp"

namespace trellis::xds {

std::map<std::string, Secret> visit_secrets(const dag::Graph& g) {
    std::map<std::string, Secret> out;
    dag::Dispatch dispatch;
    dispatch.on(dag::Kind::Secret, [&out](const dag::Vertex& v) {
        const auto& s = dag::node<dag::Secret>(v);
        if (s.cert().empty() || s.key().empty()) return;
        auto name = secret_name(s);
        out.try_emplace(name, Secret{name, s.cert(), s.key()});
    });
    g.visit([&dispatch](const dag::Vertex& v) { dispatch(v); });
    return out;
}

} // namespace trellis::xds
