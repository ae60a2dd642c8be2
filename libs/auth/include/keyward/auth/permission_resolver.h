/**
 * @file permission_resolver.h
 * @brief Effective permission sets per (user, application)
 *
 * A user's permissions are the union of the permission lists of every role granted to
 * them in one application. Membership is literal string equality: "doc:*" is just
 * another permission string, not a wildcard.
 *
 * The optional PermissionCache tags each entry with the store generation it was
 * computed from. Every authorization-relevant store mutation bumps the generation in
 * the same transaction, so a lookup tagged with anything but the current generation is
 * a miss and a grant change is visible to the very next authorize call.
 */

#pragma once

#include "keyward/store/credential_store.h"

#include <cstddef>
#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/string.h>

namespace keyward::auth {

class PermissionSet {
public:
  PermissionSet() = default;
  explicit PermissionSet(kj::Array<kj::String> permissions);

  PermissionSet(PermissionSet&&) = default;
  PermissionSet& operator=(PermissionSet&&) = default;

  // Matches every permission. Only the super-user holds it.
  [[nodiscard]] static PermissionSet everything();

  [[nodiscard]] bool contains(kj::StringPtr permission) const;
  [[nodiscard]] bool is_all() const {
    return all_;
  }
  [[nodiscard]] bool empty() const {
    return !all_ && permissions_.size() == 0;
  }
  [[nodiscard]] size_t size() const {
    return permissions_.size();
  }
  // Insertion order of the underlying grants and roles.
  [[nodiscard]] kj::ArrayPtr<const kj::String> list() const {
    return permissions_;
  }

  [[nodiscard]] PermissionSet clone() const;

private:
  bool all_ = false;
  kj::Array<kj::String> permissions_;
  kj::HashSet<kj::StringPtr> index_; // points into permissions_
};

struct CacheStats {
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t stale{0};
  uint64_t evictions{0};
  size_t size{0};
};

/**
 * @brief Bounded generation-tagged cache of resolved permission sets
 *
 * When full, stale entries are dropped first, then the least recently used one.
 */
class PermissionCache {
public:
  explicit PermissionCache(size_t capacity);

  KJ_DISALLOW_COPY_AND_MOVE(PermissionCache);

  [[nodiscard]] kj::Maybe<PermissionSet> get(kj::StringPtr application_id, kj::StringPtr user_id,
                                             uint64_t generation);
  void put(kj::StringPtr application_id, kj::StringPtr user_id, uint64_t generation,
           const PermissionSet& permissions);
  void clear();

  [[nodiscard]] CacheStats stats() const;
  [[nodiscard]] size_t capacity() const {
    return capacity_;
  }

private:
  struct Entry {
    uint64_t generation;
    uint64_t last_used;
    PermissionSet permissions;
  };
  struct State {
    kj::HashMap<kj::String, Entry> entries;
    uint64_t tick{0};
    CacheStats stats;
  };

  void evict_locked(State& state, uint64_t generation);

  size_t capacity_;
  kj::MutexGuarded<State> state_;
};

class PermissionResolver {
public:
  // cache_size == 0 disables caching.
  explicit PermissionResolver(const store::CredentialStore& store, size_t cache_size = 0);

  KJ_DISALLOW_COPY_AND_MOVE(PermissionResolver);

  /**
   * @brief Resolve the permissions of a user in one application
   *
   * Unknown or disabled users and applications resolve to the empty set.
   */
  [[nodiscard]] PermissionSet resolve(kj::StringPtr user_id, kj::StringPtr application_id);

  [[nodiscard]] static PermissionSet resolve_super_user() {
    return PermissionSet::everything();
  }

  [[nodiscard]] kj::Maybe<CacheStats> cache_stats() const;

private:
  const store::CredentialStore& store_;
  kj::Maybe<kj::Own<PermissionCache>> cache_;
};

} // namespace keyward::auth
