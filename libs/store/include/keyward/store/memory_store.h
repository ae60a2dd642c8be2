#pragma once

#include "keyward/core/time.h"
#include "keyward/store/credential_store.h"
#include "keyward/store/store_journal.h"

#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/vector.h>

namespace keyward::store {

/**
 * @brief In-process credential store with optional write-ahead journal
 *
 * All state lives behind one kj::MutexGuarded. A mutation validates its input, writes
 * its journal entry and applies the change while holding the exclusive lock, so the
 * lock scope is the transaction: readers see either the state before or after it, and a
 * journal failure (core::StoreUnavailable) leaves the state untouched.
 *
 * Without a journal the store is memory-only and lost on exit.
 */
class MemoryCredentialStore final : public CredentialStore {
public:
  explicit MemoryCredentialStore(TableNames tables,
                                 const core::Clock& clock = core::system_clock());

  // Replays `journal` immediately; every later mutation is journaled before it applies.
  MemoryCredentialStore(TableNames tables, kj::Own<StoreJournal> journal,
                        const core::Clock& clock = core::system_clock());

  KJ_DISALLOW_COPY_AND_MOVE(MemoryCredentialStore);

  // Logins that can never be registered (the configured super-user login).
  void reserve_login(kj::StringPtr login);

  // CredentialStore
  Application create_application(kj::StringPtr slug, kj::StringPtr name,
                                 kj::StringPtr description) override;
  [[nodiscard]] kj::Maybe<Application> get_application(kj::StringPtr id) const override;
  [[nodiscard]] kj::Maybe<Application> find_application_by_slug(kj::StringPtr slug) const override;
  [[nodiscard]] kj::Array<Application> list_applications() const override;
  Application update_application(kj::StringPtr id, ApplicationPatch patch) override;
  void delete_application(kj::StringPtr id) override;

  User create_user(kj::StringPtr application_id, kj::StringPtr login,
                   kj::StringPtr password_hash) override;
  [[nodiscard]] kj::Maybe<User> get_user(kj::StringPtr application_id,
                                         kj::StringPtr user_id) const override;
  [[nodiscard]] kj::Maybe<User> find_user_by_login(kj::StringPtr application_id,
                                                   kj::StringPtr login) const override;
  [[nodiscard]] kj::Array<User> list_users(kj::StringPtr application_id) const override;
  User set_user_enabled(kj::StringPtr application_id, kj::StringPtr user_id,
                        bool enabled) override;
  User set_user_password_hash(kj::StringPtr application_id, kj::StringPtr user_id,
                              kj::StringPtr password_hash) override;
  void delete_user(kj::StringPtr application_id, kj::StringPtr user_id) override;

  Role create_role(kj::StringPtr application_id, kj::StringPtr name,
                   kj::ArrayPtr<const kj::String> permissions,
                   kj::StringPtr description) override;
  [[nodiscard]] kj::Maybe<Role> get_role(kj::StringPtr application_id,
                                         kj::StringPtr role_id) const override;
  [[nodiscard]] kj::Maybe<Role> find_role_by_name(kj::StringPtr application_id,
                                                  kj::StringPtr name) const override;
  [[nodiscard]] kj::Array<Role> list_roles(kj::StringPtr application_id) const override;
  Role update_role(kj::StringPtr application_id, kj::StringPtr role_id,
                   RolePatch patch) override;
  void delete_role(kj::StringPtr application_id, kj::StringPtr role_id) override;

  Grant grant_role(kj::StringPtr application_id, kj::StringPtr user_id,
                   kj::StringPtr role_id) override;
  void revoke_role(kj::StringPtr application_id, kj::StringPtr user_id,
                   kj::StringPtr role_id) override;
  [[nodiscard]] kj::Array<Grant> list_user_grants(kj::StringPtr application_id,
                                                  kj::StringPtr user_id) const override;
  [[nodiscard]] kj::Array<Grant> list_role_grants(kj::StringPtr application_id,
                                                  kj::StringPtr role_id) const override;

  [[nodiscard]] UserRoles user_roles(kj::StringPtr application_id,
                                     kj::StringPtr user_id) const override;
  [[nodiscard]] uint64_t generation() const override;

  bool insert_revoked(kj::StringPtr jti, int64_t expires_at, int64_t revoked_at) override;
  [[nodiscard]] bool is_revoked(kj::StringPtr jti) const override;
  size_t prune_revoked(int64_t now) override;

  [[nodiscard]] StoreStats stats() const override;
  [[nodiscard]] const TableNames& tables() const override {
    return tables_;
  }

  // Rewrite the journal as one checkpoint of the current state. No-op when memory-only.
  void compact();

  [[nodiscard]] kj::Maybe<JournalStats> journal_stats() const;

  struct State {
    kj::HashMap<kj::String, Application> applications;
    kj::HashMap<kj::String, kj::String> application_slugs; // slug -> id
    kj::HashMap<kj::String, User> users;
    kj::HashMap<kj::String, kj::String> user_logins; // "<application id>/<login>" -> id
    kj::HashMap<kj::String, Role> roles;
    kj::HashMap<kj::String, kj::String> role_names;           // "<application id>/<name>" -> id
    kj::HashMap<kj::String, kj::Vector<Grant>> user_grants;   // user id -> grants, oldest first
    kj::HashMap<kj::String, RevokedToken> revoked_tokens;
    kj::Vector<kj::String> reserved_logins;
    uint64_t generation{0};
  };

private:
  TableNames tables_;
  const core::Clock& clock_;
  kj::Maybe<kj::Own<StoreJournal>> journal_;
  kj::MutexGuarded<State> state_;
};

} // namespace keyward::store
