// ResourceStore: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: copy current snapshot, mutate, atomic_store (RELEASE), then advance the
//     change signal so blocked rebuild loops wake up.
// The shared_ptr reference count naturally provides a grace period:
// old snapshots remain alive until the last reader (often a build pass) drops its ref.

#include "trellis/source/resource_store.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr

namespace trellis::source {

//------------------------------- Validation -----------------------------------

bool ResourceStore::validateName(std::string_view s) noexcept {
    if (s.empty() || s.size() > Limits::MaxNameLen) return false;
    // DNS-1123 subdomain: [a-z0-9]([-a-z0-9.]*[a-z0-9])?
    auto alnum = [](char c) { return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'); };
    if (!alnum(s.front()) || !alnum(s.back())) return false;
    for (char c : s) {
        if (!(alnum(c) || c == '-' || c == '.')) return false;
    }
    return true;
}

bool ResourceStore::validateId(const ResourceId& id) noexcept {
    return validateName(id.ns) && validateName(id.name);
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const Snapshot> ResourceStore::snapshot() const noexcept {
    // RCU read: acquire ensures any reader observing the pointer also observes
    // the fully constructed snapshot published with RELEASE in writer path.
    return std::atomic_load_explicit(&snap_, std::memory_order_acquire);
}

void ResourceStore::publish(std::shared_ptr<Snapshot> next) {
    std::shared_ptr<const Snapshot> cnext = std::move(next); // convert Snapshot -> const Snapshot
    std::atomic_store_explicit(&snap_, std::move(cnext), std::memory_order_release);
    changes_.advance();
}

void ResourceStore::replace_all(Snapshot next) {
    std::lock_guard<std::mutex> lk(writer_mu_);
    publish(std::make_shared<Snapshot>(std::move(next)));
}

void ResourceStore::clear() {
    std::lock_guard<std::mutex> lk(writer_mu_);
    publish(std::make_shared<Snapshot>());
    // Not counting as failure/success here; treated as maintenance op.
}

ResourceStore::Stats ResourceStore::stats() const noexcept {
    return Stats{
        adds_.load(std::memory_order_relaxed),
        replaces_.load(std::memory_order_relaxed),
        upserts_.load(std::memory_order_relaxed),
        removes_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed),
    };
}

} // namespace trellis::source
