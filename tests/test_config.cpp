/**
 * @file test_config.cpp
 * @brief Tests for the YAML configuration loader and the CIDR list.
 *
 * Validates:
 *  - Defaults match constants.hpp
 *  - Overrides reach the builder, listener and route sub-configs
 *  - Invalid values and unparsable documents are reported with the right code
 *  - CIDR lists are parsed, validated and loaded through the config file
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "trellis/config/config_loader.hpp"
#include "trellis/config/ip_filter.hpp"

using trellis::config::ConfigErrc;
using trellis::config::Loader;
using trellis::dag::TlsVersion;

///
/// Helpers: write a file under the test temp directory.
///
static std::string write_temp(const std::string& name, const std::string& text) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << text;
  return path.string();
}

// --------------------------- Defaults / overrides --------------------------

/**
 * @test Config_Defaults
 * @brief Built-in defaults mirror the named constants.
 */
TEST(ConfigLoader, Config_Defaults) {
  const auto cfg = Loader::defaults();
  EXPECT_EQ(cfg.logging.level, "info");
  EXPECT_FALSE(cfg.logging.json);
  EXPECT_EQ(cfg.listeners.http_address, "0.0.0.0");
  EXPECT_EQ(cfg.listeners.http_port, 8080u);
  EXPECT_EQ(cfg.listeners.https_port, 8443u);
  EXPECT_EQ(cfg.routes.http_port, 8080u);
  EXPECT_EQ(cfg.routes.https_port, 8443u);
  EXPECT_EQ(cfg.builder.minimum_tls_version, TlsVersion::V1_1);
  EXPECT_TRUE(cfg.builder.root_namespaces.empty());
  EXPECT_FALSE(cfg.builder.fallback_certificate.has_value());
  EXPECT_TRUE(cfg.listeners.ip_filter.empty());
}

/**
 * @test Config_EmptyDocument
 * @brief An empty document keeps every default.
 */
TEST(ConfigLoader, Config_EmptyDocument) {
  const auto cfg = Loader::load_from_string("");
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->listeners, Loader::defaults().listeners);
  EXPECT_EQ(cfg->builder, Loader::defaults().builder);
}

/**
 * @test Config_Overrides
 * @brief Every section overlays the defaults and ports flow into the route config.
 */
TEST(ConfigLoader, Config_Overrides) {
  const auto cfg = Loader::load_from_string(R"(
logging:
  level: debug
  json: true
listeners:
  http:
    address: "::"
    port: 80
  https:
    port: 443
    access_log: /var/log/https.log
  use_proxy_protocol: true
  access_log_format: json
  access_log_fields: [method, path]
  request_timeout: 30s
tls:
  minimum_protocol_version: "1.2"
  fallback_certificate: { namespace: infra, name: fallback }
  default_certificate: { namespace: infra, name: wildcard }
root_namespaces: [ingress, platform]
disable_permit_insecure: true
)");
  ASSERT_TRUE(cfg.has_value()) << cfg.error().message;

  EXPECT_EQ(cfg->logging.level, "debug");
  EXPECT_TRUE(cfg->logging.json);
  EXPECT_EQ(cfg->listeners.http_address, "::");
  EXPECT_EQ(cfg->listeners.http_port, 80u);
  EXPECT_EQ(cfg->listeners.https_port, 443u);
  EXPECT_EQ(cfg->listeners.https_access_log, "/var/log/https.log");
  EXPECT_TRUE(cfg->listeners.use_proxy_protocol);
  EXPECT_EQ(cfg->listeners.access_log_format, trellis::xds::AccessLogFormat::Json);
  EXPECT_EQ(cfg->listeners.access_log_fields, (std::vector<std::string>{"method", "path"}));
  EXPECT_EQ(cfg->listeners.request_timeout, trellis::util::Duration{30000});
  EXPECT_EQ(cfg->routes.http_port, 80u);
  EXPECT_EQ(cfg->routes.https_port, 443u);

  EXPECT_EQ(cfg->builder.minimum_tls_version, TlsVersion::V1_2);
  EXPECT_EQ(cfg->listeners.minimum_tls_version, TlsVersion::V1_2);
  ASSERT_TRUE(cfg->builder.fallback_certificate.has_value());
  EXPECT_EQ(cfg->builder.fallback_certificate->str(), "infra/fallback");
  ASSERT_TRUE(cfg->listeners.default_certificate.has_value());
  EXPECT_EQ(cfg->listeners.default_certificate->str(), "infra/wildcard");
  EXPECT_EQ(cfg->builder.root_namespaces, (std::vector<std::string>{"ingress", "platform"}));
  EXPECT_TRUE(cfg->builder.disable_permit_insecure);

  const auto unbounded = Loader::load_from_string("listeners:\n  request_timeout: infinity\n");
  ASSERT_TRUE(unbounded.has_value()) << unbounded.error().message;
  EXPECT_EQ(unbounded->listeners.request_timeout, trellis::util::Duration{0});
  EXPECT_EQ(unbounded->listeners.effective_request_timeout(), trellis::util::Duration{0});
}

// --------------------------- Errors ----------------------------------------

/**
 * @test Config_InvalidValues
 * @brief Out-of-range or unknown values are InvalidValue.
 */
TEST(ConfigLoader, Config_InvalidValues) {
  const char* cases[] = {
      "logging: { level: loud }\n",
      "listeners: { http: { port: 0 } }\n",
      "listeners: { https: { port: 70000 } }\n",
      "listeners: { access_log_format: xml }\n",
      "listeners: { request_timeout: later }\n",
      "listeners: { request_timeout: 99999999999999999999h }\n",
      "tls: { minimum_protocol_version: \"1.0\" }\n",
      "tls: { fallback_certificate: { name: only-name } }\n",
      "listeners: { http: { port: eighty } }\n",
      "- just\n- a\n- list\n",
  };
  for (const auto* text : cases) {
    const auto cfg = Loader::load_from_string(text);
    ASSERT_FALSE(cfg.has_value()) << text;
    EXPECT_EQ(cfg.error().code, ConfigErrc::InvalidValue) << text;
  }
}

/**
 * @test Config_ParseError
 * @brief Malformed YAML is a ParseError.
 */
TEST(ConfigLoader, Config_ParseError) {
  const auto cfg = Loader::load_from_string("logging: [unterminated\n");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigErrc::ParseError);
  EXPECT_EQ(trellis::config::to_string(cfg.error().code), "parse error");
}

/**
 * @test Config_FileNotFound
 * @brief A missing file is FileNotFound.
 */
TEST(ConfigLoader, Config_FileNotFound) {
  const auto cfg = Loader::load_from_file("/nonexistent/trellis.yaml");
  ASSERT_FALSE(cfg.has_value());
  EXPECT_EQ(cfg.error().code, ConfigErrc::FileNotFound);
}

// --------------------------- CIDR list -------------------------------------

/**
 * @test Cidr_Validation
 * @brief Prefix length bounds follow the address family.
 */
TEST(IpFilter, Cidr_Validation) {
  EXPECT_TRUE(trellis::config::valid_cidr("10.0.0.0", 8));
  EXPECT_TRUE(trellis::config::valid_cidr("192.0.2.1", 32));
  EXPECT_FALSE(trellis::config::valid_cidr("192.0.2.1", 33));
  EXPECT_TRUE(trellis::config::valid_cidr("2001:db8::", 128));
  EXPECT_FALSE(trellis::config::valid_cidr("2001:db8::", 129));
  EXPECT_FALSE(trellis::config::valid_cidr("not-an-ip", 8));
}

/**
 * @test Cidr_Parse
 * @brief JSON input is read as YAML; bad entries are InvalidValue.
 */
TEST(IpFilter, Cidr_Parse) {
  const auto ok = trellis::config::parse_ip_filter(
      R"({"allow_cidrs": [{"address_prefix": "10.0.0.0", "prefix_len": 8}],
          "deny_cidrs":  [{"address_prefix": "10.1.0.0", "prefix_len": 16},
                          {"address_prefix": "2001:db8::", "prefix_len": 32}]})");
  ASSERT_TRUE(ok.has_value()) << ok.error().message;
  ASSERT_EQ(ok->allow_cidrs.size(), 1u);
  EXPECT_EQ(ok->allow_cidrs[0], (trellis::xds::CidrRange{"10.0.0.0", 8}));
  EXPECT_EQ(ok->deny_cidrs.size(), 2u);

  EXPECT_TRUE(trellis::config::parse_ip_filter("")->empty());

  const auto bad = trellis::config::parse_ip_filter(R"({"allow_cidrs": [{"address_prefix": "10.0.0.0", "prefix_len": 40}]})");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code, ConfigErrc::InvalidValue);
  EXPECT_EQ(bad.error().message, "allow_cidrs: invalid CIDR 10.0.0.0/40");

  const auto missing = trellis::config::parse_ip_filter(R"({"deny_cidrs": [{"prefix_len": 8}]})");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ConfigErrc::InvalidValue);

  const auto syntax = trellis::config::parse_ip_filter("{\"allow_cidrs\": [");
  ASSERT_FALSE(syntax.has_value());
  EXPECT_EQ(syntax.error().code, ConfigErrc::ParseError);
}

/**
 * @test Cidr_LoadedThroughConfig
 * @brief listeners.cidr_list_path populates the listener filter; a missing list fails the load.
 */
TEST(IpFilter, Cidr_LoadedThroughConfig) {
  const auto list = write_temp("trellis_test_cidrs.json",
                               R"({"allow_cidrs": [{"address_prefix": "10.0.0.0", "prefix_len": 8}]})");
  const auto cfg_path = write_temp("trellis_test_config.yaml", "listeners:\n  cidr_list_path: " + list + "\n");

  const auto cfg = Loader::load_from_file(cfg_path);
  ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
  EXPECT_EQ(cfg->cidr_list_path, list);
  ASSERT_EQ(cfg->listeners.ip_filter.allow_cidrs.size(), 1u);
  EXPECT_TRUE(cfg->listeners.ip_filter.deny_cidrs.empty());

  const auto broken = Loader::load_from_string("listeners:\n  cidr_list_path: /nonexistent/cidrs.json\n");
  ASSERT_FALSE(broken.has_value());
  EXPECT_EQ(broken.error().code, ConfigErrc::FileNotFound);

  std::filesystem::remove(list);
  std::filesystem::remove(cfg_path);
}
