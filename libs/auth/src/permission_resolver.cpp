#include "keyward/auth/permission_resolver.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace keyward::auth {

// ---------------------------------------------------------------------------
// PermissionSet
// ---------------------------------------------------------------------------

PermissionSet::PermissionSet(kj::Array<kj::String> permissions)
    : permissions_(kj::mv(permissions)) {
  for (auto& permission : permissions_) {
    if (!index_.contains(permission)) {
      index_.insert(permission);
    }
  }
}

PermissionSet PermissionSet::everything() {
  PermissionSet set;
  set.all_ = true;
  return set;
}

bool PermissionSet::contains(kj::StringPtr permission) const {
  return all_ || index_.contains(permission);
}

PermissionSet PermissionSet::clone() const {
  if (all_) {
    return everything();
  }
  return PermissionSet(store::clone_strings(permissions_));
}

// ---------------------------------------------------------------------------
// PermissionCache
// ---------------------------------------------------------------------------

namespace {

kj::String cache_key(kj::StringPtr application_id, kj::StringPtr user_id) {
  return kj::str(application_id, "/", user_id);
}

} // namespace

PermissionCache::PermissionCache(size_t capacity) : capacity_(capacity) {
  KJ_REQUIRE(capacity > 0, "PermissionCache capacity must be positive");
}

kj::Maybe<PermissionSet> PermissionCache::get(kj::StringPtr application_id,
                                              kj::StringPtr user_id, uint64_t generation) {
  auto lock = state_.lockExclusive();
  auto key = cache_key(application_id, user_id);
  KJ_IF_SOME(entry, lock->entries.find(key)) {
    if (entry.generation == generation) {
      entry.last_used = ++lock->tick;
      lock->stats.hits++;
      return entry.permissions.clone();
    }
    lock->entries.erase(key);
    lock->stats.stale++;
  }
  lock->stats.misses++;
  return kj::none;
}

void PermissionCache::put(kj::StringPtr application_id, kj::StringPtr user_id,
                          uint64_t generation, const PermissionSet& permissions) {
  auto lock = state_.lockExclusive();
  auto key = cache_key(application_id, user_id);
  if (lock->entries.find(key) == kj::none && lock->entries.size() >= capacity_) {
    evict_locked(*lock, generation);
  }
  Entry entry{generation, ++lock->tick, permissions.clone()};
  lock->entries.upsert(kj::mv(key), kj::mv(entry), [](Entry& existing, Entry&& replacement) {
    // Never overwrite a newer snapshot with an older one.
    if (replacement.generation >= existing.generation) {
      existing = kj::mv(replacement);
    }
  });
}

void PermissionCache::evict_locked(State& state, uint64_t generation) {
  size_t before = state.entries.size();
  state.entries.eraseAll([generation](const kj::String&, const Entry& entry) {
    return entry.generation != generation;
  });

  if (state.entries.size() >= capacity_) {
    kj::Maybe<kj::StringPtr> oldest;
    uint64_t oldest_tick = UINT64_MAX;
    for (auto& entry : state.entries) {
      if (entry.value.last_used < oldest_tick) {
        oldest_tick = entry.value.last_used;
        oldest = entry.key.asPtr();
      }
    }
    KJ_IF_SOME(key, oldest) {
      auto owned = kj::str(key);
      state.entries.erase(owned);
    }
  }
  state.stats.evictions += before - state.entries.size();
}

void PermissionCache::clear() {
  auto lock = state_.lockExclusive();
  lock->entries.clear();
}

CacheStats PermissionCache::stats() const {
  auto lock = state_.lockShared();
  CacheStats stats = lock->stats;
  stats.size = lock->entries.size();
  return stats;
}

// ---------------------------------------------------------------------------
// PermissionResolver
// ---------------------------------------------------------------------------

PermissionResolver::PermissionResolver(const store::CredentialStore& store, size_t cache_size)
    : store_(store) {
  if (cache_size > 0) {
    cache_ = kj::heap<PermissionCache>(cache_size);
  }
}

PermissionSet PermissionResolver::resolve(kj::StringPtr user_id, kj::StringPtr application_id) {
  KJ_IF_SOME(cache, cache_) {
    KJ_IF_SOME(hit, cache->get(application_id, user_id, store_.generation())) {
      return kj::mv(hit);
    }
  }

  auto snapshot = store_.user_roles(application_id, user_id);
  PermissionSet permissions =
      snapshot.active ? PermissionSet(kj::mv(snapshot.permissions)) : PermissionSet();

  KJ_IF_SOME(cache, cache_) {
    cache->put(application_id, user_id, snapshot.generation, permissions);
  }
  return permissions;
}

kj::Maybe<CacheStats> PermissionResolver::cache_stats() const {
  KJ_IF_SOME(cache, cache_) {
    return cache->stats();
  }
  return kj::none;
}

} // namespace keyward::auth
