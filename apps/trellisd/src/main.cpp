/**
 * @file main.cpp
 * @brief trellisd: compile a resource file into proxy configuration and print it.
 *
 * **Bootstrap**
 * - Load the process configuration (and the CIDR list it names); configure logging.
 * - Load the resource file into the ResourceStore.
 *
 * **Control plane**
 * - Start the rebuild loop on its own thread; it builds the graph, projects it
 *   and publishes into the listener/route/cluster/secret caches.
 * - Wait on the cache version like a streaming client would, then stop the loop.
 *
 * **Output**
 * - Per-resource status lines on the log, cache contents as YAML on stdout.
 *
 * Usage: trellisd <config.yaml|-> <resources.yaml>
 */

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "trellis/cache/cache_set.hpp"
#include "trellis/config/config_loader.hpp"
#include "trellis/obs/log.hpp"
#include "trellis/obs/observability.hpp"
#include "trellis/pipeline/rebuilder.hpp"
#include "trellis/source/resource_store.hpp"
#include "trellis/source/yaml_loader.hpp"
#include "trellis/version.hpp"
#include "trellis/xds/render.hpp"

namespace {

/// Writes status records to the process log.
class LogStatusWriter final : public trellis::dag::StatusWriter {
public:
    void set_status(const trellis::dag::Status& s) override {
        const auto lvl = s.kind == trellis::dag::StatusKind::Valid ? spdlog::level::info : spdlog::level::warn;
        trellis::obs::logger()->log(lvl, "status {} {}: {}", s.id.str(), trellis::dag::to_string(s.kind), s.description);
    }
};

constexpr std::chrono::seconds kFirstPassTimeout{10};

} // namespace

int main(int argc, char** argv) {
    using namespace trellis;

    if (argc != 3) {
        std::cerr << "usage: " << argv[0] << " <config.yaml|-> <resources.yaml>\n";
        return 2;
    }
    const std::string config_path = argv[1];
    const std::string resources_path = argv[2];

    auto cfg = config_path == "-" ? trellis_detail::expected<config::Config, config::ConfigError>{config::Loader::defaults()}
                                  : config::Loader::load_from_file(config_path);
    if (!cfg) {
        obs::logger()->critical("configuration: {}: {}", config::to_string(cfg.error().code), cfg.error().message);
        return 1;
    }
    obs::configure_logging(cfg->logging);
    obs::logger()->info("trellisd {} starting", version_string);

    auto resources = source::load_resources_file(resources_path);
    if (!resources) {
        obs::logger()->critical("resources: {}", resources.error());
        return 1;
    }

    source::ResourceStore store;
    store.replace_all(std::move(*resources));

    cache::CacheSet caches;
    auto observer = obs::make_log_observer();
    LogStatusWriter status;
    pipeline::Rebuilder rebuilder(*cfg, caches, *observer, &status);

    std::jthread loop([&](std::stop_token stop) { rebuilder.run(store, stop); });
    // Secrets are published last in a pass.
    const auto first = caches.secrets.wait_for_next_for(0, kFirstPassTimeout, loop.get_stop_token());
    loop.request_stop();
    loop.join();
    if (!first) {
        obs::logger()->critical("no rebuild pass completed within {}s", kFirstPassTimeout.count());
        return 1;
    }

    std::cout << "# " << caches.listeners.type_url() << "\n" << xds::to_yaml(caches.listeners.contents()) << "\n"
              << "# " << caches.routes.type_url() << "\n" << xds::to_yaml(caches.routes.contents()) << "\n"
              << "# " << caches.clusters.type_url() << "\n" << xds::to_yaml(caches.clusters.contents()) << "\n"
              << "# " << caches.secrets.type_url() << "\n" << xds::to_yaml(caches.secrets.contents()) << std::endl;

    const auto counters = observer->snapshot();
    return counters.invalid_resources > 0 ? 3 : 0;
}
