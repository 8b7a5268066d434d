#pragma once
/**
 * @file snapshot_cache.hpp
 * @brief Versioned, name-keyed store of one kind of proxy object.
 *
 * Concurrency model:
 *   - The rebuild thread calls update() once per pass; the whole dynamic table
 *     is swapped under the signal's lock, so readers never see a partial table.
 *   - Readers (query/contents) take the same lock for the copy only.
 *   - Streaming waiters block in wait_for_next() until the version moves or
 *     their stop_token fires.
 *
 * A static table is fixed at construction and is served alongside the
 * dynamic one. A dynamic object shadows a static one of the same name.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "trellis/cache/version_signal.hpp"
#include "trellis/compat/expected.hpp"

namespace trellis::cache {

template <class T>
class SnapshotCache final {
public:
    using Map = std::map<std::string, T>;

    explicit SnapshotCache(std::string type_url, Map static_objects = {})
        : type_url_(std::move(type_url)), static_(std::move(static_objects)) {}

    SnapshotCache(const SnapshotCache&) = delete;
    SnapshotCache& operator=(const SnapshotCache&) = delete;

    /**
     * @brief Replace the dynamic table wholesale and wake every waiter.
     * @return The new version.
     */
    std::uint64_t update(Map objects) {
        return signal_.publish([&] { dynamic_ = std::move(objects); });
    }

    /**
     * @brief Objects for @p names in name order.
     * @details The dynamic table is consulted first, then the static one.
     *          Unknown names are skipped; duplicates are returned once.
     */
    std::vector<T> query(const std::vector<std::string>& names) const {
        return signal_.with_lock([&] {
            Map found;
            for (const auto& n : names) {
                if (const auto it = dynamic_.find(n); it != dynamic_.end()) {
                    found.try_emplace(n, it->second);
                } else if (const auto st = static_.find(n); st != static_.end()) {
                    found.try_emplace(n, st->second);
                }
            }
            return values(found);
        });
    }

    /// Every dynamic and static object in name order.
    std::vector<T> contents() const {
        return signal_.with_lock([&] {
            Map all = dynamic_;
            for (const auto& [name, v] : static_) all.try_emplace(name, v);
            return values(all);
        });
    }

    /**
     * @brief Block until the version exceeds @p last_seen.
     * @return The new version, or WaitError::Cancelled once @p stop fires.
     * @note Returns immediately when the cache has already moved past @p last_seen.
     */
    trellis_detail::expected<std::uint64_t, WaitError>
    wait_for_next(std::uint64_t last_seen, std::stop_token stop) const {
        return signal_.wait_past(last_seen, std::move(stop));
    }

    /// wait_for_next() bounded by @p timeout (WaitError::TimedOut on expiry).
    trellis_detail::expected<std::uint64_t, WaitError>
    wait_for_next_for(std::uint64_t last_seen, std::chrono::milliseconds timeout, std::stop_token stop) const {
        return signal_.wait_past_for(last_seen, timeout, std::move(stop));
    }

    [[nodiscard]] std::uint64_t version() const { return signal_.current(); }

    /// Type identifier the streaming layer routes requests by.
    [[nodiscard]] const std::string& type_url() const noexcept { return type_url_; }

private:
    static std::vector<T> values(const Map& m) {
        std::vector<T> out;
        out.reserve(m.size());
        for (const auto& [name, v] : m) out.push_back(v);
        return out;
    }

    const std::string type_url_;
    const Map static_;
    Map dynamic_;
    VersionSignal signal_;
};

} // namespace trellis::cache
