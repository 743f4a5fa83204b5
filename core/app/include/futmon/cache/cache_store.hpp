#pragma once

#include "futmon/cache/cache_entry.hpp"
#include "futmon/time/i_time_provider.hpp"

#include <any>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace futmon {

struct CacheStats {
  std::size_t total_entries{0};
  std::size_t valid_entries{0};
  std::size_t expired_entries{0};
  std::size_t stale_entries{0};
};

// -----------------------------------------------------------------------------
// CacheStore: keyed, per-key-TTL store of heterogeneous values
// -----------------------------------------------------------------------------
//
// @brief  get / put / invalidate over string keys, each key holding a value
//         of its own type (AccountSnapshot, vector<Position>, ...).
//
// @details
// Storage layout:
//   key → shared_ptr<const Slot>, Slot = {shared_ptr<const any>, fetched_at,
//   ttl, stale}
//
// A slot is never modified after it is published. put() builds a complete
// new slot and swaps the pointer under the unique lock; get() copies the
// pointer under the shared lock and reads the slot after releasing it. A
// reader therefore sees the whole old tuple or the whole new tuple, never a
// mix, and never holds the lock while copying a large value out.
//
// TTL is per key and is supplied with every put, so account balances,
// trades and income can each have their own staleness tolerance.
//
// Generations:
//   invalidateAll() bumps generation(). putIfGeneration() refuses to store
//   when the generation moved since the caller sampled it. A refresh started
//   under rotated-away credentials cannot repopulate the cache afterwards.
//   clear() drops the same entries but keeps the generation, so a refresh
//   already running still stores its result for the next reader.
//
// Thread model:
//   All methods are safe from any thread. std::shared_mutex: readers share,
//   writers exclude.
//
// Ownership:
//   Exclusively owns all entries. Callers only ever receive copies.
// -----------------------------------------------------------------------------
class CacheStore {
 public:
  explicit CacheStore(const ITimeProvider& clock);

  CacheStore(const CacheStore&) = delete;
  CacheStore& operator=(const CacheStore&) = delete;

  // ---------------------------------------------------------------------------
  // get<T>(key)
  // ---------------------------------------------------------------------------
  // @brief  Copy of the entry for key, expired or not, or nullopt if absent.
  //
  // @throws std::logic_error if key holds a value of a different type. That
  //         is a programming error in key naming, not a runtime condition.
  // ---------------------------------------------------------------------------
  template <typename T>
  std::optional<CacheEntry<T>> get(const std::string& key) const;

  // Stores value with fetched_at = now. Clears any stale mark.
  template <typename T>
  void put(const std::string& key, T value, std::int64_t ttl_ms);

  // Same as put() but only if generation() still equals `generation`.
  // Returns false (and stores nothing) otherwise.
  template <typename T>
  bool putIfGeneration(const std::string& key, T value, std::int64_t ttl_ms,
                       std::uint64_t generation);

  // Marks an existing entry as being served past its TTL. No-op if absent.
  void markStale(const std::string& key);

  void invalidate(const std::string& key);

  // Removes every key starting with prefix; returns how many were removed.
  std::size_t invalidatePrefix(const std::string& prefix);

  // Removes every entry and bumps generation().
  void invalidateAll();

  // Removes every entry; generation() is unchanged.
  void clear();

  std::uint64_t generation() const;

  bool contains(const std::string& key) const;

  // Present and not expired.
  bool isFresh(const std::string& key) const;

  CacheStats stats() const;

  std::vector<std::string> keys() const;

 private:
  struct Slot {
    std::shared_ptr<const std::any> value;
    std::int64_t fetched_at_ms{0};
    std::int64_t ttl_ms{0};
    bool stale{false};
  };

  using SlotPtr = std::shared_ptr<const Slot>;

  SlotPtr findSlot(const std::string& key) const;
  SlotPtr makeSlot(std::any value, std::int64_t ttl_ms) const;

  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, SlotPtr> slots_;
  std::uint64_t generation_{0};
};

// -----------------------------------------------------------------------------
// Template implementation
// -----------------------------------------------------------------------------
template <typename T>
std::optional<CacheEntry<T>> CacheStore::get(const std::string& key) const {
  SlotPtr slot = findSlot(key);
  if (!slot) {
    return std::nullopt;
  }

  const T* value = std::any_cast<T>(slot->value.get());
  if (value == nullptr) {
    throw std::logic_error("cache key '" + key +
                           "' holds a value of another type");
  }
  return CacheEntry<T>{*value, slot->fetched_at_ms, slot->ttl_ms, slot->stale};
}

template <typename T>
void CacheStore::put(const std::string& key, T value, std::int64_t ttl_ms) {
  SlotPtr slot = makeSlot(std::any(std::move(value)), ttl_ms);
  std::unique_lock lock(mutex_);
  slots_[key] = std::move(slot);
}

template <typename T>
bool CacheStore::putIfGeneration(const std::string& key, T value,
                                 std::int64_t ttl_ms,
                                 std::uint64_t generation) {
  SlotPtr slot = makeSlot(std::any(std::move(value)), ttl_ms);
  std::unique_lock lock(mutex_);
  if (generation != generation_) {
    return false;
  }
  slots_[key] = std::move(slot);
  return true;
}

}  // namespace futmon
