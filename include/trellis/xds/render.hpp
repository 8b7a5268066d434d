#pragma once
/**
 * @file render.hpp
 * @brief YAML rendering of projected proxy objects (yaml-cpp emitter).
 *
 * Rendering is deterministic: fields are emitted in a fixed order and every
 * list is emitted in the order the visitors produced it. Private keys are
 * never rendered.
 */

#include <map>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "trellis/xds/types.hpp"

namespace trellis::xds {

YAML::Emitter& operator<<(YAML::Emitter& out, const Listener& l);
YAML::Emitter& operator<<(YAML::Emitter& out, const RouteConfiguration& rc);
YAML::Emitter& operator<<(YAML::Emitter& out, const Cluster& c);
YAML::Emitter& operator<<(YAML::Emitter& out, const Secret& s);

/// Render a single object.
template <class T>
std::string to_yaml(const T& v) {
    YAML::Emitter out;
    out << v;
    return out.c_str();
}

/// Render a name-keyed set of objects as a sequence in name order.
template <class T>
std::string to_yaml(const std::map<std::string, T>& objects) {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& [name, v] : objects) out << v;
    out << YAML::EndSeq;
    return out.c_str();
}

/// Render a list of objects (e.g. cache contents) as a sequence.
template <class T>
std::string to_yaml(const std::vector<T>& objects) {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& v : objects) out << v;
    out << YAML::EndSeq;
    return out.c_str();
}

} // namespace trellis::xds
