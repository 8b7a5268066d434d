#pragma once
/**
 * @file version_signal.hpp
 * @brief Monotonic version counter with broadcast wake-up and cancellable waits.
 *
 * Concurrency model:
 *   - One mutex guards the counter and whatever state the owner mutates inside publish().
 *   - publish() runs the mutation, bumps the version and notifies every waiter.
 *   - wait_past() blocks until the version moves beyond the caller's last seen
 *     value, the caller's stop_token fires, or (timed variant) the deadline passes.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <utility>

#include "trellis/compat/expected.hpp"

namespace trellis::cache {

/// Why a wait returned without observing a new version.
enum class WaitError : std::uint8_t {
    Cancelled,  ///< The caller's stop_token was triggered.
    TimedOut    ///< The relative deadline elapsed.
};

class VersionSignal final {
public:
    /// Current version (0 before the first publish).
    [[nodiscard]] std::uint64_t current() const;

    /// Bump the version without touching guarded state.
    std::uint64_t advance();

    /**
     * @brief Run @p mutate under the lock, then bump the version and wake all waiters.
     * @return The new version.
     */
    template <class Fn>
    std::uint64_t publish(Fn&& mutate) {
        std::uint64_t v = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            std::forward<Fn>(mutate)();
            v = ++version_;
        }
        cv_.notify_all();
        return v;
    }

    /// Run @p fn under the lock (readers of state guarded by this signal).
    template <class Fn>
    decltype(auto) with_lock(Fn&& fn) const {
        std::lock_guard<std::mutex> lk(mu_);
        return std::forward<Fn>(fn)();
    }

    /**
     * @brief Block until current() > @p last_seen or @p stop is requested.
     * @return The observed version, or WaitError::Cancelled.
     */
    trellis_detail::expected<std::uint64_t, WaitError>
    wait_past(std::uint64_t last_seen, std::stop_token stop) const;

    /// Same as wait_past() with a relative deadline.
    trellis_detail::expected<std::uint64_t, WaitError>
    wait_past_for(std::uint64_t last_seen, std::chrono::milliseconds timeout, std::stop_token stop) const;

private:
    mutable std::mutex mu_;
    mutable std::condition_variable_any cv_;
    std::uint64_t version_{0};
};

} // namespace trellis::cache
