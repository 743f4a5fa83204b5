#include "futmon/cache/cache_store.hpp"

#include <mutex>

namespace futmon {

CacheStore::CacheStore(const ITimeProvider& clock) : clock_(clock) {}

CacheStore::SlotPtr CacheStore::findSlot(const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto it = slots_.find(key);
  return it == slots_.end() ? nullptr : it->second;
}

// Built outside the lock: the value is moved into its own heap block once
// and shared from then on.
CacheStore::SlotPtr CacheStore::makeSlot(std::any value,
                                         std::int64_t ttl_ms) const {
  auto slot = std::make_shared<Slot>();
  slot->value = std::make_shared<const std::any>(std::move(value));
  slot->fetched_at_ms = clock_.now_ms();
  slot->ttl_ms = ttl_ms;
  return slot;
}

// -----------------------------------------------------------------------------
// markStale(): copy-on-write of the metadata only
// -----------------------------------------------------------------------------
void CacheStore::markStale(const std::string& key) {
  std::unique_lock lock(mutex_);
  auto it = slots_.find(key);
  if (it == slots_.end() || it->second->stale) {
    return;
  }
  auto marked = std::make_shared<Slot>(*it->second);
  marked->stale = true;
  it->second = std::move(marked);
}

void CacheStore::invalidate(const std::string& key) {
  std::unique_lock lock(mutex_);
  slots_.erase(key);
}

std::size_t CacheStore::invalidatePrefix(const std::string& prefix) {
  std::unique_lock lock(mutex_);
  std::size_t removed = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      it = slots_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

void CacheStore::invalidateAll() {
  std::unique_lock lock(mutex_);
  slots_.clear();
  ++generation_;
}

void CacheStore::clear() {
  std::unique_lock lock(mutex_);
  slots_.clear();
}

std::uint64_t CacheStore::generation() const {
  std::shared_lock lock(mutex_);
  return generation_;
}

bool CacheStore::contains(const std::string& key) const {
  return findSlot(key) != nullptr;
}

bool CacheStore::isFresh(const std::string& key) const {
  SlotPtr slot = findSlot(key);
  return slot && clock_.now_ms() < slot->fetched_at_ms + slot->ttl_ms;
}

CacheStats CacheStore::stats() const {
  const std::int64_t now = clock_.now_ms();
  std::shared_lock lock(mutex_);

  CacheStats stats;
  stats.total_entries = slots_.size();
  for (const auto& [key, slot] : slots_) {
    if (now < slot->fetched_at_ms + slot->ttl_ms) {
      ++stats.valid_entries;
    } else {
      ++stats.expired_entries;
    }
    if (slot->stale) {
      ++stats.stale_entries;
    }
  }
  return stats;
}

std::vector<std::string> CacheStore::keys() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> out;
  out.reserve(slots_.size());
  for (const auto& [key, slot] : slots_) {
    out.push_back(key);
  }
  return out;
}

}  // namespace futmon
