/**
 * @file version_signal.cpp
 * @brief Version counter with blocking, cancellable waits.
 */
#include "trellis/cache/version_signal.hpp"

namespace trellis::cache {

std::uint64_t VersionSignal::current() const {
    std::lock_guard<std::mutex> lk(mu_);
    return version_;
}

std::uint64_t VersionSignal::advance() {
    return publish([] {});
}

trellis_detail::expected<std::uint64_t, WaitError>
VersionSignal::wait_past(std::uint64_t last_seen, std::stop_token stop) const {
    std::unique_lock<std::mutex> lk(mu_);
    // condition_variable_any registers a stop callback, so a stop request wakes us.
    if (!cv_.wait(lk, stop, [&] { return version_ > last_seen; })) {
        return trellis_detail::unexpected(WaitError::Cancelled);
    }
    return version_;
}

trellis_detail::expected<std::uint64_t, WaitError>
VersionSignal::wait_past_for(std::uint64_t last_seen, std::chrono::milliseconds timeout,
                             std::stop_token stop) const {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, stop, timeout, [&] { return version_ > last_seen; })) {
        return trellis_detail::unexpected(stop.stop_requested() ? WaitError::Cancelled
                                                                : WaitError::TimedOut);
    }
    return version_;
}

} // namespace trellis::cache
