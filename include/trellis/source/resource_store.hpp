#pragma once
// trellis: ResourceStore
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers perform copy-on-write of the whole snapshot and atomically swap with RELEASE semantics.
//   • Writers are serialized by a writer mutex; readers never block.
//   • Every published snapshot advances a VersionSignal so the rebuild loop can wait for changes.

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <type_traits>

#include "trellis/cache/version_signal.hpp"
#include "trellis/source/entity_store.hpp"

namespace trellis::source {

// -----------------------------------------------------------------------------
// Error codes returned by store mutations. Never throw on the write path.
// -----------------------------------------------------------------------------
/// Result codes for store mutations.
enum class StoreErr {
    Ok,         ///< Operation succeeded.
    Exists,     ///< Add failed because the object already exists.
    NotFound,   ///< Replace failed because the object was not found.
    Invalid     ///< Identity validation failed (empty or malformed namespace/name).
};

/// Identity limits (DNS-1123 subdomain).
struct Limits {
    static constexpr std::size_t MaxNameLen = 253;
};

// -----------------------------------------------------------------------------
// ResourceStore class
// -----------------------------------------------------------------------------
///
/// Holds the watched resources as an immutable Snapshot.
/// - Reads: grab shared_ptr snapshot, consistent, non-blocking.
/// - Writes: copy-on-write full snapshot, atomic swap, version advance.
/// - Non-throwing on validation: returns StoreErr codes.
///
/// Thread-safety:
///   - Reads are lock-free.
///   - Writes are serialized, may allocate.
///   - Readers may see slightly stale data, but always a whole snapshot.
//
class ResourceStore final {
public:
    // --------------------------- RCU Snapshot API ----------------------------
    /// Return a consistent snapshot of every stored resource.
    std::shared_ptr<const Snapshot> snapshot() const noexcept;

    /// Monotonic version; advances on every successful mutation.
    [[nodiscard]] std::uint64_t version() const { return changes_.current(); }

    /// Change notification for rebuild loops (wait_past(version(), stop)).
    [[nodiscard]] const cache::VersionSignal& changes() const noexcept { return changes_; }

    // --------------------------- Mutations -----------------------------------
    /// Add a new object. Fails if one with the same identity exists.
    template <class R> StoreErr add(R obj)     { return mutate(Mode::Add, std::move(obj)); }

    /// Replace an existing object. Fails if it is not present.
    template <class R> StoreErr replace(R obj) { return mutate(Mode::Replace, std::move(obj)); }

    /// Insert or replace. Always succeeds if the identity is valid.
    template <class R> StoreErr upsert(R obj)  { return mutate(Mode::Upsert, std::move(obj)); }

    /// Remove an object of kind R. Returns true if it was erased.
    template <class R> bool remove(const ResourceId& id);

    /// Swap in a whole snapshot (initial sync from the watch layer).
    void replace_all(Snapshot next);

    /// Drop everything. Treated as maintenance operation.
    void clear();

    // --------------------------- Observability -------------------------------
    /// Stats counters (atomic, cumulative since start).
    struct Stats {
        std::uint64_t adds{0}, replaces{0}, upserts{0}, removes{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    std::shared_ptr<const Snapshot> snap_{std::make_shared<Snapshot>()};
    std::mutex writer_mu_;
    cache::VersionSignal changes_;

    std::atomic<std::uint64_t> adds_{0}, replaces_{0}, upserts_{0}, removes_{0}, failures_{0};

    static bool validateId(const ResourceId& id) noexcept;
    static bool validateName(std::string_view s) noexcept;

    enum class Mode { Add, Replace, Upsert };

    template <class R, class S>
    static auto& table(S& s) noexcept {
        if constexpr (std::is_same_v<R, RouteResource>) return s.route_resources;
        else if constexpr (std::is_same_v<R, Service>) return s.services;
        else if constexpr (std::is_same_v<R, Secret>) return s.secrets;
        else {
            static_assert(std::is_same_v<R, CertificateDelegation>, "unsupported resource kind");
            return s.delegations;
        }
    }

    void publish(std::shared_ptr<Snapshot> next);

    template <class R>
    StoreErr mutate(Mode mode, R obj);
};

// ------------------------------ Template bodies ------------------------------

template <class R>
StoreErr ResourceStore::mutate(Mode mode, R obj) {
    if (!validateId(obj.id)) { failures_.fetch_add(1, std::memory_order_relaxed); return StoreErr::Invalid; }

    std::lock_guard<std::mutex> lk(writer_mu_);
    auto next = std::make_shared<Snapshot>(*snapshot()); // copy-on-write
    auto& t = table<R>(*next);
    const bool exists = t.find(obj.id) != t.end();

    switch (mode) {
        case Mode::Add:
            if (exists) { failures_.fetch_add(1, std::memory_order_relaxed); return StoreErr::Exists; }
            adds_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Mode::Replace:
            if (!exists) { failures_.fetch_add(1, std::memory_order_relaxed); return StoreErr::NotFound; }
            replaces_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Mode::Upsert:
            upserts_.fetch_add(1, std::memory_order_relaxed);
            break;
    }
    const ResourceId key = obj.id;
    t.insert_or_assign(key, std::move(obj));
    publish(std::move(next));
    return StoreErr::Ok;
}

template <class R>
bool ResourceStore::remove(const ResourceId& id) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    auto snap = snapshot();
    const auto& current = table<R>(*snap);
    if (current.find(id) == current.end()) return false;

    auto next = std::make_shared<Snapshot>(*snap);
    table<R>(*next).erase(id);
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

} // namespace trellis::source
