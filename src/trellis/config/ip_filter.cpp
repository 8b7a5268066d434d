/**
 * @file ip_filter.cpp
 * @brief CIDR allow/deny list parsing (yaml-cpp; JSON is accepted as YAML).
 */
#include "trellis/config/ip_filter.hpp"

#include <arpa/inet.h>

#include <yaml-cpp/yaml.h>

#include "trellis/obs/log.hpp"

namespace trellis::config {

namespace {

using Result = trellis_detail::expected<xds::IpAllowDenyConfig, ConfigError>;

Result invalid(std::string msg) {
    return trellis_detail::unexpected(ConfigError{ConfigErrc::InvalidValue, std::move(msg)});
}

/// Append every entry of @p node to @p out; the first bad entry is reported.
trellis_detail::expected<void, ConfigError>
read_cidrs(const YAML::Node& node, const char* key, std::vector<xds::CidrRange>& out) {
    if (!node) return {};
    if (!node.IsSequence()) {
        return trellis_detail::unexpected(ConfigError{ConfigErrc::InvalidValue, std::string{key} + " must be a list"});
    }
    for (const auto& entry : node) {
        if (!entry["address_prefix"] || !entry["prefix_len"]) {
            return trellis_detail::unexpected(
                ConfigError{ConfigErrc::InvalidValue, std::string{key} + ": entries need address_prefix and prefix_len"});
        }
        xds::CidrRange r{entry["address_prefix"].as<std::string>(), entry["prefix_len"].as<std::uint32_t>()};
        if (!valid_cidr(r.address_prefix, r.prefix_len)) {
            return trellis_detail::unexpected(ConfigError{
                ConfigErrc::InvalidValue,
                std::string{key} + ": invalid CIDR " + r.address_prefix + "/" + std::to_string(r.prefix_len)});
        }
        out.push_back(std::move(r));
    }
    return {};
}

Result from_node(const YAML::Node& root) {
    xds::IpAllowDenyConfig cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) return invalid("CIDR list must be a mapping");
    if (auto r = read_cidrs(root["allow_cidrs"], "allow_cidrs", cfg.allow_cidrs); !r) {
        return trellis_detail::unexpected(r.error());
    }
    if (auto r = read_cidrs(root["deny_cidrs"], "deny_cidrs", cfg.deny_cidrs); !r) {
        return trellis_detail::unexpected(r.error());
    }
    return cfg;
}

} // namespace

bool valid_cidr(const std::string& prefix, std::uint32_t len) noexcept {
    unsigned char buf[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, prefix.c_str(), buf) == 1) return len <= 32;
    if (inet_pton(AF_INET6, prefix.c_str(), buf) == 1) return len <= 128;
    return false;
}

Result parse_ip_filter(const std::string& text) {
    try {
        return from_node(YAML::Load(text));
    } catch (const YAML::ParserException& e) {
        return trellis_detail::unexpected(ConfigError{ConfigErrc::ParseError, e.what()});
    } catch (const YAML::Exception& e) {
        return invalid(e.what());
    }
}

Result load_ip_filter(const std::string& path) {
    try {
        auto cfg = from_node(YAML::LoadFile(path));
        if (cfg) {
            obs::logger()->info("loaded CIDR list {}: {} allow, {} deny", path,
                                cfg->allow_cidrs.size(), cfg->deny_cidrs.size());
        }
        return cfg;
    } catch (const YAML::BadFile&) {
        return trellis_detail::unexpected(ConfigError{ConfigErrc::FileNotFound, "cannot open CIDR list " + path});
    } catch (const YAML::ParserException& e) {
        return trellis_detail::unexpected(
            ConfigError{ConfigErrc::ParseError, "could not parse CIDR list " + path + ": " + e.what()});
    } catch (const YAML::Exception& e) {
        return invalid("CIDR list " + path + ": " + e.what());
    }
}

} // namespace trellis::config
