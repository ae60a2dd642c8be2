#include "keyward/store/memory_store.h"

#include "keyward/core/crypto.h"
#include "keyward/core/error.h"

#include <algorithm>
#include <kj/debug.h>

namespace keyward::store {

using core::Conflict;
using core::NotFound;
using core::ValidationException;
using State = MemoryCredentialStore::State;

namespace {

kj::String scoped_key(kj::StringPtr application_id, kj::StringPtr name) {
  return kj::str(application_id, "/", name);
}

void validate_text(kj::StringPtr field, kj::StringPtr value, bool required) {
  if (required && value.size() == 0) {
    throw ValidationException(kj::str(field, " must not be empty"));
  }
  if (value.size() > MAX_NAME_LENGTH) {
    throw ValidationException(kj::str(field, " must be at most ", MAX_NAME_LENGTH, " characters"));
  }
}

// ---------------------------------------------------------------------------
// State transitions shared by live mutations and journal replay. None of them
// validate; callers have already done so.
// ---------------------------------------------------------------------------

void put_application(State& state, Application record) {
  KJ_IF_SOME(existing, state.applications.find(record.id)) {
    if (existing.slug != record.slug) {
      state.application_slugs.erase(existing.slug);
    }
  }
  state.application_slugs.upsert(kj::str(record.slug), kj::str(record.id),
                                 [](kj::String& old, kj::String&& id) { old = kj::mv(id); });
  auto id = kj::str(record.id);
  state.applications.upsert(kj::mv(id), kj::mv(record),
                            [](Application& old, Application&& next) { old = kj::mv(next); });
  state.generation++;
}

void remove_user(State& state, kj::StringPtr id) {
  KJ_IF_SOME(user, state.users.find(id)) {
    state.user_logins.erase(scoped_key(user.application_id, user.login));
  }
  state.user_grants.erase(id);
  state.users.erase(id);
  state.generation++;
}

void remove_role(State& state, kj::StringPtr id) {
  KJ_IF_SOME(role, state.roles.find(id)) {
    state.role_names.erase(scoped_key(role.application_id, role.name));
  }
  for (auto& entry : state.user_grants) {
    auto& grants = entry.value;
    kj::Vector<Grant> kept(grants.size());
    for (auto& grant : grants) {
      if (grant.role_id != id) {
        kept.add(kj::mv(grant));
      }
    }
    grants = kj::mv(kept);
  }
  state.roles.erase(id);
  state.generation++;
}

void remove_application(State& state, kj::StringPtr id) {
  kj::Vector<kj::String> user_ids;
  for (auto& entry : state.users) {
    if (entry.value.application_id == id) {
      user_ids.add(kj::str(entry.key));
    }
  }
  for (auto& user_id : user_ids) {
    remove_user(state, user_id);
  }

  kj::Vector<kj::String> role_ids;
  for (auto& entry : state.roles) {
    if (entry.value.application_id == id) {
      role_ids.add(kj::str(entry.key));
    }
  }
  for (auto& role_id : role_ids) {
    remove_role(state, role_id);
  }

  KJ_IF_SOME(app, state.applications.find(id)) {
    state.application_slugs.erase(app.slug);
  }
  state.applications.erase(id);
  state.generation++;
}

void put_user(State& state, User record) {
  KJ_IF_SOME(existing, state.users.find(record.id)) {
    if (existing.login != record.login) {
      state.user_logins.erase(scoped_key(existing.application_id, existing.login));
    }
  }
  state.user_logins.upsert(scoped_key(record.application_id, record.login), kj::str(record.id),
                           [](kj::String& old, kj::String&& id) { old = kj::mv(id); });
  auto id = kj::str(record.id);
  state.users.upsert(kj::mv(id), kj::mv(record),
                     [](User& old, User&& next) { old = kj::mv(next); });
  state.generation++;
}

void put_role(State& state, Role record) {
  KJ_IF_SOME(existing, state.roles.find(record.id)) {
    if (existing.name != record.name) {
      state.role_names.erase(scoped_key(existing.application_id, existing.name));
    }
  }
  state.role_names.upsert(scoped_key(record.application_id, record.name), kj::str(record.id),
                          [](kj::String& old, kj::String&& id) { old = kj::mv(id); });
  auto id = kj::str(record.id);
  state.roles.upsert(kj::mv(id), kj::mv(record),
                     [](Role& old, Role&& next) { old = kj::mv(next); });
  state.generation++;
}

bool has_grant(const State& state, kj::StringPtr user_id, kj::StringPtr role_id) {
  KJ_IF_SOME(grants, state.user_grants.find(user_id)) {
    for (auto& grant : grants) {
      if (grant.role_id == role_id) {
        return true;
      }
    }
  }
  return false;
}

void put_grant(State& state, Grant record) {
  if (has_grant(state, record.user_id, record.role_id)) {
    return;
  }
  auto& grants = state.user_grants.findOrCreate(record.user_id, [&]() {
    return kj::HashMap<kj::String, kj::Vector<Grant>>::Entry{kj::str(record.user_id),
                                                             kj::Vector<Grant>()};
  });
  grants.add(kj::mv(record));
  state.generation++;
}

void remove_grant(State& state, kj::StringPtr user_id, kj::StringPtr role_id) {
  KJ_IF_SOME(grants, state.user_grants.find(user_id)) {
    kj::Vector<Grant> kept(grants.size());
    for (auto& grant : grants) {
      if (grant.role_id != role_id) {
        kept.add(kj::mv(grant));
      }
    }
    grants = kj::mv(kept);
  }
  state.generation++;
}

void put_revoked(State& state, RevokedToken record) {
  if (state.revoked_tokens.find(record.jti) != kj::none) {
    return;
  }
  auto jti = kj::str(record.jti);
  state.revoked_tokens.insert(kj::mv(jti), kj::mv(record));
}

size_t count_prunable(const State& state, int64_t now) {
  size_t count = 0;
  for (auto& entry : state.revoked_tokens) {
    if (entry.value.expires_at <= now) {
      ++count;
    }
  }
  return count;
}

size_t prune_revoked(State& state, int64_t now) {
  return state.revoked_tokens.eraseAll(
      [now](const kj::String&, const RevokedToken& token) { return token.expires_at <= now; });
}

void clear(State& state) {
  state.applications.clear();
  state.application_slugs.clear();
  state.users.clear();
  state.user_logins.clear();
  state.roles.clear();
  state.role_names.clear();
  state.user_grants.clear();
  state.revoked_tokens.clear();
  state.generation++;
}

StoreSnapshot snapshot_of(const State& state) {
  kj::Vector<Application> applications(state.applications.size());
  for (auto& entry : state.applications) {
    applications.add(entry.value.clone());
  }
  kj::Vector<User> users(state.users.size());
  for (auto& entry : state.users) {
    users.add(entry.value.clone());
  }
  kj::Vector<Role> roles(state.roles.size());
  for (auto& entry : state.roles) {
    roles.add(entry.value.clone());
  }
  kj::Vector<Grant> grants;
  for (auto& entry : state.user_grants) {
    for (auto& grant : entry.value) {
      grants.add(grant.clone());
    }
  }
  kj::Vector<RevokedToken> revoked(state.revoked_tokens.size());
  for (auto& entry : state.revoked_tokens) {
    revoked.add(entry.value.clone());
  }
  return StoreSnapshot{applications.releaseAsArray(), users.releaseAsArray(),
                       roles.releaseAsArray(), grants.releaseAsArray(),
                       revoked.releaseAsArray()};
}

class StateReplayTarget final : public JournalReplayTarget {
public:
  explicit StateReplayTarget(State& state) : state_(state) {}

  void restore(StoreSnapshot snapshot) override {
    clear(state_);
    for (auto& record : snapshot.applications) {
      store::put_application(state_, kj::mv(record));
    }
    for (auto& record : snapshot.users) {
      store::put_user(state_, kj::mv(record));
    }
    for (auto& record : snapshot.roles) {
      store::put_role(state_, kj::mv(record));
    }
    for (auto& record : snapshot.grants) {
      store::put_grant(state_, kj::mv(record));
    }
    for (auto& record : snapshot.revoked_tokens) {
      store::put_revoked(state_, kj::mv(record));
    }
  }
  void put_application(Application record) override {
    store::put_application(state_, kj::mv(record));
  }
  void remove_application(kj::StringPtr id) override {
    store::remove_application(state_, id);
  }
  void put_user(User record) override {
    store::put_user(state_, kj::mv(record));
  }
  void remove_user(kj::StringPtr id) override {
    store::remove_user(state_, id);
  }
  void put_role(Role record) override {
    store::put_role(state_, kj::mv(record));
  }
  void remove_role(kj::StringPtr id) override {
    store::remove_role(state_, id);
  }
  void put_grant(Grant record) override {
    store::put_grant(state_, kj::mv(record));
  }
  void remove_grant(kj::StringPtr user_id, kj::StringPtr role_id) override {
    store::remove_grant(state_, user_id, role_id);
  }
  void put_revoked(RevokedToken record) override {
    store::put_revoked(state_, kj::mv(record));
  }
  void prune_revoked(int64_t now) override {
    store::prune_revoked(state_, now);
  }

private:
  State& state_;
};

// Lookups that raise NotFound when the record is absent or belongs to another application.
const Application& require_application(const State& state, kj::StringPtr id) {
  KJ_IF_SOME(app, state.applications.find(id)) {
    return app;
  }
  throw NotFound(kj::str("Application '", id, "' does not exist"));
}

const User& require_user(const State& state, kj::StringPtr application_id, kj::StringPtr id) {
  KJ_IF_SOME(user, state.users.find(id)) {
    if (user.application_id == application_id) {
      return user;
    }
  }
  throw NotFound(kj::str("User '", id, "' does not exist in application '", application_id, "'"));
}

const Role& require_role(const State& state, kj::StringPtr application_id, kj::StringPtr id) {
  KJ_IF_SOME(role, state.roles.find(id)) {
    if (role.application_id == application_id) {
      return role;
    }
  }
  throw NotFound(kj::str("Role '", id, "' does not exist in application '", application_id, "'"));
}

} // namespace

MemoryCredentialStore::MemoryCredentialStore(TableNames tables, const core::Clock& clock)
    : tables_(kj::mv(tables)), clock_(clock) {}

MemoryCredentialStore::MemoryCredentialStore(TableNames tables, kj::Own<StoreJournal> journal,
                                             const core::Clock& clock)
    : tables_(kj::mv(tables)), clock_(clock) {
  {
    auto lock = state_.lockExclusive();
    StateReplayTarget target(*lock);
    journal->replay(target);
    KJ_LOG(INFO, "Credential store restored from journal", lock->applications.size(),
           lock->users.size(), lock->roles.size(), lock->revoked_tokens.size());
  }
  journal_ = kj::mv(journal);
}

void MemoryCredentialStore::reserve_login(kj::StringPtr login) {
  state_.lockExclusive()->reserved_logins.add(kj::str(login));
}

// ---------------------------------------------------------------------------
// Applications
// ---------------------------------------------------------------------------

Application MemoryCredentialStore::create_application(kj::StringPtr slug, kj::StringPtr name,
                                                      kj::StringPtr description) {
  validate_slug(slug);
  validate_text("Application name"_kj, name, true);

  auto lock = state_.lockExclusive();
  if (lock->application_slugs.find(slug) != kj::none) {
    throw Conflict(kj::str("Application slug '", slug, "' is already in use"));
  }

  auto now = clock_.now();
  Application record{core::generate_id(), kj::str(slug), kj::str(name), kj::str(description),
                     true, now, now};
  KJ_IF_SOME(journal, journal_) {
    journal->log_application_put(record);
  }
  put_application(*lock, record.clone());

  KJ_LOG(INFO, "Application created", record.slug, record.id);
  return record;
}

kj::Maybe<Application> MemoryCredentialStore::get_application(kj::StringPtr id) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(app, lock->applications.find(id)) {
    return app.clone();
  }
  return kj::none;
}

kj::Maybe<Application> MemoryCredentialStore::find_application_by_slug(kj::StringPtr slug) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(id, lock->application_slugs.find(slug)) {
    KJ_IF_SOME(app, lock->applications.find(id)) {
      return app.clone();
    }
  }
  return kj::none;
}

kj::Array<Application> MemoryCredentialStore::list_applications() const {
  auto lock = state_.lockShared();
  kj::Vector<Application> result(lock->applications.size());
  for (auto& entry : lock->applications) {
    result.add(entry.value.clone());
  }
  std::sort(result.begin(), result.end(),
            [](const Application& a, const Application& b) { return a.slug < b.slug; });
  return result.releaseAsArray();
}

Application MemoryCredentialStore::update_application(kj::StringPtr id, ApplicationPatch patch) {
  KJ_IF_SOME(slug, patch.slug) {
    validate_slug(slug);
  }
  KJ_IF_SOME(name, patch.name) {
    validate_text("Application name"_kj, name, true);
  }

  auto lock = state_.lockExclusive();
  auto record = require_application(*lock, id).clone();

  KJ_IF_SOME(slug, patch.slug) {
    KJ_IF_SOME(owner, lock->application_slugs.find(slug)) {
      if (owner != id) {
        throw Conflict(kj::str("Application slug '", slug, "' is already in use"));
      }
    }
    record.slug = kj::mv(slug);
  }
  KJ_IF_SOME(name, patch.name) {
    record.name = kj::mv(name);
  }
  KJ_IF_SOME(description, patch.description) {
    record.description = kj::mv(description);
  }
  KJ_IF_SOME(enabled, patch.enabled) {
    record.enabled = enabled;
  }
  record.updated_at = clock_.now();

  KJ_IF_SOME(journal, journal_) {
    journal->log_application_put(record);
  }
  put_application(*lock, record.clone());
  return record;
}

void MemoryCredentialStore::delete_application(kj::StringPtr id) {
  auto lock = state_.lockExclusive();
  auto slug = kj::str(require_application(*lock, id).slug);

  KJ_IF_SOME(journal, journal_) {
    journal->log_application_delete(id);
  }
  remove_application(*lock, id);
  KJ_LOG(INFO, "Application deleted", slug, id);
}

// ---------------------------------------------------------------------------
// Users
// ---------------------------------------------------------------------------

User MemoryCredentialStore::create_user(kj::StringPtr application_id, kj::StringPtr login,
                                        kj::StringPtr password_hash) {
  validate_login(login);
  validate_text("Password hash"_kj, password_hash, true);

  auto lock = state_.lockExclusive();
  require_application(*lock, application_id);
  for (auto& reserved : lock->reserved_logins) {
    if (reserved == login) {
      throw Conflict(kj::str("Login '", login, "' is reserved"));
    }
  }
  if (lock->user_logins.find(scoped_key(application_id, login)) != kj::none) {
    throw Conflict(kj::str("Login '", login, "' is already in use"));
  }

  auto now = clock_.now();
  User record{core::generate_id(), kj::str(application_id), kj::str(login),
              kj::str(password_hash), true, now, now};
  KJ_IF_SOME(journal, journal_) {
    journal->log_user_put(record);
  }
  put_user(*lock, record.clone());

  KJ_LOG(INFO, "User created", application_id, record.id);
  return record;
}

kj::Maybe<User> MemoryCredentialStore::get_user(kj::StringPtr application_id,
                                                kj::StringPtr user_id) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(user, lock->users.find(user_id)) {
    if (user.application_id == application_id) {
      return user.clone();
    }
  }
  return kj::none;
}

kj::Maybe<User> MemoryCredentialStore::find_user_by_login(kj::StringPtr application_id,
                                                          kj::StringPtr login) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(id, lock->user_logins.find(scoped_key(application_id, login))) {
    KJ_IF_SOME(user, lock->users.find(id)) {
      return user.clone();
    }
  }
  return kj::none;
}

kj::Array<User> MemoryCredentialStore::list_users(kj::StringPtr application_id) const {
  auto lock = state_.lockShared();
  kj::Vector<User> result;
  for (auto& entry : lock->users) {
    if (entry.value.application_id == application_id) {
      result.add(entry.value.clone());
    }
  }
  std::sort(result.begin(), result.end(),
            [](const User& a, const User& b) { return a.login < b.login; });
  return result.releaseAsArray();
}

User MemoryCredentialStore::set_user_enabled(kj::StringPtr application_id,
                                             kj::StringPtr user_id, bool enabled) {
  auto lock = state_.lockExclusive();
  auto record = require_user(*lock, application_id, user_id).clone();
  record.enabled = enabled;
  record.updated_at = clock_.now();

  KJ_IF_SOME(journal, journal_) {
    journal->log_user_put(record);
  }
  put_user(*lock, record.clone());

  KJ_LOG(INFO, enabled ? "User enabled" : "User disabled", application_id, user_id);
  return record;
}

User MemoryCredentialStore::set_user_password_hash(kj::StringPtr application_id,
                                                   kj::StringPtr user_id,
                                                   kj::StringPtr password_hash) {
  validate_text("Password hash"_kj, password_hash, true);

  auto lock = state_.lockExclusive();
  auto record = require_user(*lock, application_id, user_id).clone();
  record.password_hash = kj::str(password_hash);
  record.updated_at = clock_.now();

  KJ_IF_SOME(journal, journal_) {
    journal->log_user_put(record);
  }
  put_user(*lock, record.clone());
  return record;
}

void MemoryCredentialStore::delete_user(kj::StringPtr application_id, kj::StringPtr user_id) {
  auto lock = state_.lockExclusive();
  require_user(*lock, application_id, user_id);

  KJ_IF_SOME(journal, journal_) {
    journal->log_user_delete(user_id);
  }
  remove_user(*lock, user_id);
  KJ_LOG(INFO, "User deleted", application_id, user_id);
}

// ---------------------------------------------------------------------------
// Roles
// ---------------------------------------------------------------------------

Role MemoryCredentialStore::create_role(kj::StringPtr application_id, kj::StringPtr name,
                                        kj::ArrayPtr<const kj::String> permissions,
                                        kj::StringPtr description) {
  validate_role_name(name);
  auto normalized = normalize_permissions(permissions);

  auto lock = state_.lockExclusive();
  require_application(*lock, application_id);
  if (lock->role_names.find(scoped_key(application_id, name)) != kj::none) {
    throw Conflict(kj::str("Role '", name, "' already exists"));
  }

  auto now = clock_.now();
  Role record{core::generate_id(), kj::str(application_id), kj::str(name), kj::str(description),
              kj::mv(normalized), now, now};
  KJ_IF_SOME(journal, journal_) {
    journal->log_role_put(record);
  }
  put_role(*lock, record.clone());

  KJ_LOG(INFO, "Role created", application_id, record.name, record.permissions.size());
  return record;
}

kj::Maybe<Role> MemoryCredentialStore::get_role(kj::StringPtr application_id,
                                                kj::StringPtr role_id) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(role, lock->roles.find(role_id)) {
    if (role.application_id == application_id) {
      return role.clone();
    }
  }
  return kj::none;
}

kj::Maybe<Role> MemoryCredentialStore::find_role_by_name(kj::StringPtr application_id,
                                                         kj::StringPtr name) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(id, lock->role_names.find(scoped_key(application_id, name))) {
    KJ_IF_SOME(role, lock->roles.find(id)) {
      return role.clone();
    }
  }
  return kj::none;
}

kj::Array<Role> MemoryCredentialStore::list_roles(kj::StringPtr application_id) const {
  auto lock = state_.lockShared();
  kj::Vector<Role> result;
  for (auto& entry : lock->roles) {
    if (entry.value.application_id == application_id) {
      result.add(entry.value.clone());
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Role& a, const Role& b) { return a.name < b.name; });
  return result.releaseAsArray();
}

Role MemoryCredentialStore::update_role(kj::StringPtr application_id, kj::StringPtr role_id,
                                        RolePatch patch) {
  KJ_IF_SOME(name, patch.name) {
    validate_role_name(name);
  }
  kj::Maybe<kj::Array<kj::String>> normalized;
  KJ_IF_SOME(permissions, patch.permissions) {
    normalized = normalize_permissions(permissions);
  }

  auto lock = state_.lockExclusive();
  auto record = require_role(*lock, application_id, role_id).clone();

  KJ_IF_SOME(name, patch.name) {
    KJ_IF_SOME(owner, lock->role_names.find(scoped_key(application_id, name))) {
      if (owner != role_id) {
        throw Conflict(kj::str("Role '", name, "' already exists"));
      }
    }
    record.name = kj::mv(name);
  }
  KJ_IF_SOME(description, patch.description) {
    record.description = kj::mv(description);
  }
  KJ_IF_SOME(permissions, normalized) {
    record.permissions = kj::mv(permissions);
  }
  record.updated_at = clock_.now();

  KJ_IF_SOME(journal, journal_) {
    journal->log_role_put(record);
  }
  put_role(*lock, record.clone());
  return record;
}

void MemoryCredentialStore::delete_role(kj::StringPtr application_id, kj::StringPtr role_id) {
  auto lock = state_.lockExclusive();
  require_role(*lock, application_id, role_id);

  KJ_IF_SOME(journal, journal_) {
    journal->log_role_delete(role_id);
  }
  remove_role(*lock, role_id);
  KJ_LOG(INFO, "Role deleted", application_id, role_id);
}

// ---------------------------------------------------------------------------
// Grants
// ---------------------------------------------------------------------------

Grant MemoryCredentialStore::grant_role(kj::StringPtr application_id, kj::StringPtr user_id,
                                        kj::StringPtr role_id) {
  auto lock = state_.lockExclusive();
  require_application(*lock, application_id);
  require_user(*lock, application_id, user_id);
  require_role(*lock, application_id, role_id);
  if (has_grant(*lock, user_id, role_id)) {
    throw Conflict(kj::str("Role '", role_id, "' is already granted to user '", user_id, "'"));
  }

  Grant record{kj::str(user_id), kj::str(role_id), kj::str(application_id), clock_.now()};
  KJ_IF_SOME(journal, journal_) {
    journal->log_grant_put(record);
  }
  put_grant(*lock, record.clone());

  KJ_LOG(INFO, "Role granted", application_id, user_id, role_id);
  return record;
}

void MemoryCredentialStore::revoke_role(kj::StringPtr application_id, kj::StringPtr user_id,
                                        kj::StringPtr role_id) {
  auto lock = state_.lockExclusive();
  require_user(*lock, application_id, user_id);
  require_role(*lock, application_id, role_id);
  if (!has_grant(*lock, user_id, role_id)) {
    throw NotFound(kj::str("Role '", role_id, "' is not granted to user '", user_id, "'"));
  }

  KJ_IF_SOME(journal, journal_) {
    journal->log_grant_delete(user_id, role_id);
  }
  remove_grant(*lock, user_id, role_id);
  KJ_LOG(INFO, "Role revoked", application_id, user_id, role_id);
}

kj::Array<Grant> MemoryCredentialStore::list_user_grants(kj::StringPtr application_id,
                                                         kj::StringPtr user_id) const {
  auto lock = state_.lockShared();
  kj::Vector<Grant> result;
  KJ_IF_SOME(grants, lock->user_grants.find(user_id)) {
    for (auto& grant : grants) {
      if (grant.application_id == application_id) {
        result.add(grant.clone());
      }
    }
  }
  return result.releaseAsArray();
}

kj::Array<Grant> MemoryCredentialStore::list_role_grants(kj::StringPtr application_id,
                                                         kj::StringPtr role_id) const {
  auto lock = state_.lockShared();
  kj::Vector<Grant> result;
  for (auto& entry : lock->user_grants) {
    for (auto& grant : entry.value) {
      if (grant.role_id == role_id && grant.application_id == application_id) {
        result.add(grant.clone());
      }
    }
  }
  return result.releaseAsArray();
}

UserRoles MemoryCredentialStore::user_roles(kj::StringPtr application_id,
                                            kj::StringPtr user_id) const {
  auto lock = state_.lockShared();
  UserRoles result;
  result.generation = lock->generation;
  result.roles = kj::heapArray<kj::String>(0);
  result.permissions = kj::heapArray<kj::String>(0);

  KJ_IF_SOME(app, lock->applications.find(application_id)) {
    if (!app.enabled) {
      return result;
    }
  } else {
    return result;
  }
  KJ_IF_SOME(user, lock->users.find(user_id)) {
    if (user.application_id != application_id || !user.enabled) {
      return result;
    }
  } else {
    return result;
  }

  result.active = true;
  KJ_IF_SOME(grants, lock->user_grants.find(user_id)) {
    kj::Vector<kj::String> roles(grants.size());
    kj::Vector<kj::String> permissions;
    kj::HashSet<kj::StringPtr> seen;
    for (auto& grant : grants) {
      KJ_IF_SOME(role, lock->roles.find(grant.role_id)) {
        roles.add(kj::str(role.name));
        for (auto& permission : role.permissions) {
          if (!seen.contains(permission)) {
            seen.insert(permission);
            permissions.add(kj::str(permission));
          }
        }
      }
    }
    result.roles = roles.releaseAsArray();
    result.permissions = permissions.releaseAsArray();
  }
  return result;
}

uint64_t MemoryCredentialStore::generation() const {
  return state_.lockShared()->generation;
}

// ---------------------------------------------------------------------------
// Revoked tokens
// ---------------------------------------------------------------------------

bool MemoryCredentialStore::insert_revoked(kj::StringPtr jti, int64_t expires_at,
                                           int64_t revoked_at) {
  validate_text("Token id"_kj, jti, true);

  auto lock = state_.lockExclusive();
  if (lock->revoked_tokens.find(jti) != kj::none) {
    return false;
  }

  RevokedToken record{kj::str(jti), expires_at, revoked_at};
  KJ_IF_SOME(journal, journal_) {
    journal->log_revoked_put(record);
  }
  put_revoked(*lock, kj::mv(record));
  return true;
}

bool MemoryCredentialStore::is_revoked(kj::StringPtr jti) const {
  return state_.lockShared()->revoked_tokens.find(jti) != kj::none;
}

size_t MemoryCredentialStore::prune_revoked(int64_t now) {
  auto lock = state_.lockExclusive();
  if (count_prunable(*lock, now) == 0) {
    return 0;
  }

  KJ_IF_SOME(journal, journal_) {
    journal->log_revoked_prune(now);
  }
  auto removed = store::prune_revoked(*lock, now);
  KJ_LOG(INFO, "Pruned expired revoked tokens", removed);
  return removed;
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

StoreStats MemoryCredentialStore::stats() const {
  auto lock = state_.lockShared();
  StoreStats stats;
  stats.applications = lock->applications.size();
  stats.users = lock->users.size();
  stats.roles = lock->roles.size();
  stats.revoked_tokens = lock->revoked_tokens.size();
  stats.generation = lock->generation;

  kj::HashSet<kj::StringPtr> apps_with_users;
  for (auto& entry : lock->users) {
    if (!apps_with_users.contains(entry.value.application_id)) {
      apps_with_users.insert(entry.value.application_id);
    }
    size_t granted = 0;
    KJ_IF_SOME(grants, lock->user_grants.find(entry.key)) {
      granted = grants.size();
    }
    stats.grants += granted;
    if (granted == 0) {
      stats.users_without_roles++;
    }
  }
  stats.applications_without_users = stats.applications - apps_with_users.size();

  for (auto& entry : lock->roles) {
    if (entry.value.permissions.size() == 0) {
      stats.roles_without_permissions++;
    }
  }
  return stats;
}

void MemoryCredentialStore::compact() {
  auto lock = state_.lockExclusive();
  KJ_IF_SOME(journal, journal_) {
    journal->write_checkpoint(snapshot_of(*lock));
  }
}

kj::Maybe<JournalStats> MemoryCredentialStore::journal_stats() const {
  KJ_IF_SOME(journal, journal_) {
    return journal->stats();
  }
  return kj::none;
}

} // namespace keyward::store
