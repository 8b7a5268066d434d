/**
 * @file config_loader.cpp
 * @brief YAML loader (yaml-cpp) that overlays a file onto the named defaults.
 */
#include "trellis/config/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include "trellis/config/constants.hpp"
#include "trellis/config/ip_filter.hpp"

namespace trellis::config {
    using namespace trellis::config::constants;

    using Result = trellis_detail::expected<Config, ConfigError>;

    std::string_view to_string(ConfigErrc c) noexcept {
        switch (c) {
            case ConfigErrc::FileNotFound: return "file not found";
            case ConfigErrc::ParseError:   return "parse error";
            case ConfigErrc::InvalidValue: return "invalid value";
        }
        return "invalid value";
    }

    namespace {

    ConfigError invalid(std::string msg) { return ConfigError{ConfigErrc::InvalidValue, std::move(msg)}; }

    trellis_detail::expected<std::uint32_t, ConfigError> read_port(const YAML::Node& n, const char* what) {
        const auto port = n.as<std::int64_t>();
        if (port < MIN_PORT || port > MAX_PORT) {
            return trellis_detail::unexpected(invalid(std::string{what} + ": port must be in the range 1-65535"));
        }
        return static_cast<std::uint32_t>(port);
    }

    trellis_detail::expected<dag::TlsVersion, ConfigError> read_tls_version(const YAML::Node& n) {
        const auto v = n.as<std::string>();
        if (v == "1.1") return dag::TlsVersion::V1_1;
        if (v == "1.2") return dag::TlsVersion::V1_2;
        if (v == "1.3") return dag::TlsVersion::V1_3;
        return trellis_detail::unexpected(invalid("tls.minimum_protocol_version: unsupported version \"" + v + "\""));
    }

    trellis_detail::expected<source::ResourceId, ConfigError> read_resource_id(const YAML::Node& n, const char* what) {
        source::ResourceId id;
        if (n["namespace"]) id.ns = n["namespace"].as<std::string>();
        if (n["name"]) id.name = n["name"].as<std::string>();
        if (id.ns.empty() || id.name.empty()) {
            return trellis_detail::unexpected(invalid(std::string{what} + ": namespace and name are required"));
        }
        return id;
    }

    trellis_detail::expected<void, ConfigError>
    read_endpoint(const YAML::Node& n, const char* what, std::string& address, std::uint32_t& port, std::string& log) {
        if (!n) return {};
        if (n["address"]) address = n["address"].as<std::string>();
        if (n["port"]) {
            auto p = read_port(n["port"], what);
            if (!p) return trellis_detail::unexpected(p.error());
            port = *p;
        }
        if (n["access_log"]) log = n["access_log"].as<std::string>();
        return {};
    }

    /// Overlay @p root onto the defaults. yaml-cpp conversion errors propagate as exceptions.
    Result from_node(const YAML::Node& root) {
        Config cfg = Loader::defaults();
        if (!root || root.IsNull()) return cfg;
        if (!root.IsMap()) return trellis_detail::unexpected(invalid("configuration must be a mapping"));

        // Logging
        if (const auto n = root["logging"]) {
            if (n["level"]) cfg.logging.level = n["level"].as<std::string>();
            if (n["json"]) cfg.logging.json = n["json"].as<bool>();
            if (!obs::valid_log_level(cfg.logging.level)) {
                return trellis_detail::unexpected(invalid("logging.level: unknown level \"" + cfg.logging.level + "\""));
            }
        }

        // Listeners
        if (const auto n = root["listeners"]) {
            auto& l = cfg.listeners;
            if (auto r = read_endpoint(n["http"], "listeners.http", l.http_address, l.http_port, l.http_access_log); !r) {
                return trellis_detail::unexpected(r.error());
            }
            if (auto r = read_endpoint(n["https"], "listeners.https", l.https_address, l.https_port, l.https_access_log); !r) {
                return trellis_detail::unexpected(r.error());
            }
            if (n["use_proxy_protocol"]) l.use_proxy_protocol = n["use_proxy_protocol"].as<bool>();
            if (n["access_log_format"]) {
                const auto f = n["access_log_format"].as<std::string>();
                if (f == "envoy") l.access_log_format = xds::AccessLogFormat::Envoy;
                else if (f == "json") l.access_log_format = xds::AccessLogFormat::Json;
                else return trellis_detail::unexpected(invalid("listeners.access_log_format: must be envoy or json"));
            }
            if (n["access_log_fields"]) l.access_log_fields = n["access_log_fields"].as<std::vector<std::string>>();
            if (n["request_timeout"]) {
                const auto text = n["request_timeout"].as<std::string>();
                if (text == "infinity") {
                    l.request_timeout = util::Duration{0};
                } else {
                    const auto d = util::parse_duration(text);
                    if (!d) return trellis_detail::unexpected(invalid("listeners.request_timeout: " + d.error()));
                    l.request_timeout = *d;
                }
            }
            if (n["cidr_list_path"]) cfg.cidr_list_path = n["cidr_list_path"].as<std::string>();
        }
        cfg.routes.http_port = cfg.listeners.http_port;
        cfg.routes.https_port = cfg.listeners.https_port;

        // TLS
        if (const auto n = root["tls"]) {
            if (n["minimum_protocol_version"]) {
                auto v = read_tls_version(n["minimum_protocol_version"]);
                if (!v) return trellis_detail::unexpected(v.error());
                cfg.builder.minimum_tls_version = *v;
                cfg.listeners.minimum_tls_version = *v;
            }
            if (n["fallback_certificate"]) {
                auto id = read_resource_id(n["fallback_certificate"], "tls.fallback_certificate");
                if (!id) return trellis_detail::unexpected(id.error());
                cfg.builder.fallback_certificate = *id;
            }
            if (n["default_certificate"]) {
                auto id = read_resource_id(n["default_certificate"], "tls.default_certificate");
                if (!id) return trellis_detail::unexpected(id.error());
                cfg.listeners.default_certificate = *id;
            }
        }

        // Builder policy
        if (root["root_namespaces"]) cfg.builder.root_namespaces = root["root_namespaces"].as<std::vector<std::string>>();
        if (root["disable_permit_insecure"]) cfg.builder.disable_permit_insecure = root["disable_permit_insecure"].as<bool>();

        if (!cfg.cidr_list_path.empty()) {
            auto ips = load_ip_filter(cfg.cidr_list_path);
            if (!ips) return trellis_detail::unexpected(ips.error());
            cfg.listeners.ip_filter = std::move(*ips);
        }
        return cfg;
    }

    } // namespace

    Config Loader::defaults() {
        Config cfg;
        cfg.routes.http_port = cfg.listeners.http_port;
        cfg.routes.https_port = cfg.listeners.https_port;
        return cfg;
    }

    Result Loader::load_from_string(const std::string& text) {
        try {
            return from_node(YAML::Load(text));
        } catch (const YAML::ParserException& e) {
            return trellis_detail::unexpected(ConfigError{ConfigErrc::ParseError, e.what()});
        } catch (const YAML::Exception& e) {
            return trellis_detail::unexpected(invalid(e.what()));
        }
    }

    Result Loader::load_from_file(const std::string& path) {
        try {
            return from_node(YAML::LoadFile(path));
        } catch (const YAML::BadFile&) {
            return trellis_detail::unexpected(ConfigError{ConfigErrc::FileNotFound, "cannot open " + path});
        } catch (const YAML::ParserException& e) {
            return trellis_detail::unexpected(ConfigError{ConfigErrc::ParseError, path + ": " + e.what()});
        } catch (const YAML::Exception& e) {
            return trellis_detail::unexpected(invalid(path + ": " + e.what()));
        }
    }

} // namespace trellis::config
