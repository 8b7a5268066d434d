/**
 * @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "trellis/obs/observability.hpp"
#include "trellis/obs/log.hpp"

#include <mutex>

namespace trellis::obs {

    class LogObserver final : public Observer {
    public:
        void record(const BuildEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.passes++;
                ctr_.invalid_resources += e.invalid;
                ctr_.orphaned_resources += e.orphaned;
            }
            const auto lvl = e.invalid > 0 ? spdlog::level::warn : spdlog::level::info;
            logger()->log(lvl,
                "rebuild version={} vhosts={} secure_vhosts={} valid={} invalid={} orphaned={} "
                "listeners={} route_configs={} clusters={} secrets={} elapsed_us={}",
                e.store_version, e.virtual_hosts, e.secure_hosts, e.valid, e.invalid, e.orphaned,
                e.listeners, e.route_configs, e.clusters, e.secrets, e.elapsed.count());
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    std::unique_ptr<Observer> make_log_observer() {
        return std::make_unique<LogObserver>();
    }

} // namespace trellis::obs
