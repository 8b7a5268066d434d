#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: YAML process configuration on top of named defaults.
 * @details Every field is optional; omitted fields keep the defaults from constants.hpp.
 *
 * @code
 * logging:   { level: info, json: false }
 * listeners:
 *   http:  { address: 0.0.0.0, port: 8080, access_log: /dev/stdout }
 *   https: { address: 0.0.0.0, port: 8443, access_log: /dev/stdout }
 *   use_proxy_protocol: false
 *   access_log_format: envoy          # or json
 *   access_log_fields: [ "@timestamp", method, path ]
 *   request_timeout: 30s
 *   cidr_list_path: /etc/trellis/cidrs.json
 * tls:
 *   minimum_protocol_version: "1.2"
 *   fallback_certificate: { namespace: infra, name: fallback }
 *   default_certificate:  { namespace: infra, name: wildcard }
 * root_namespaces: [ ingress ]
 * disable_permit_insecure: false
 * @endcode
 */

#include <string>

#include "trellis/compat/expected.hpp"
#include "trellis/config/error.hpp"
#include "trellis/dag/builder.hpp"
#include "trellis/obs/log.hpp"
#include "trellis/xds/listener.hpp"
#include "trellis/xds/route.hpp"

namespace trellis::config {

    /** @struct Config
     *  @brief Aggregate of sub-configs required by the control plane.
     */
    struct Config {
        obs::LoggingConfig         logging;   ///< Log level and format
        dag::BuilderConfig         builder;   ///< Root namespaces, TLS floor, fallback certificate
        xds::ListenerVisitorConfig listeners; ///< Addresses, access logs, CIDR filter
        xds::RouteVisitorConfig    routes;    ///< Ports advertised in virtual host domains
        std::string                cidr_list_path; ///< Source of listeners.ip_filter, if any
    };

    /** @class Loader
     *  @brief Source of process configuration (defaults or a parsed file).
     */
    class Loader {
    public:
        /// Built-in defaults.
        static Config defaults();

        /**
         * @brief Load configuration from a YAML file.
         * @param path File path. The CIDR list it names is loaded too.
         * @return Config with populated sub-configs, or the first error found.
         */
        static trellis_detail::expected<Config, ConfigError> load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory document.
        static trellis_detail::expected<Config, ConfigError> load_from_string(const std::string& text);
    };

} // namespace trellis::config
