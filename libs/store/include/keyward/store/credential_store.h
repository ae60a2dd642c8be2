#pragma once

#include "keyward/store/records.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace keyward::store {

/**
 * @brief Durable record of applications, users, roles, grants and revoked tokens
 *
 * Every mutation is atomic: it either fully applies or raises and leaves no trace.
 * Operations on users, roles and grants are scoped to one application; an id that
 * belongs to another application is reported as NotFound, so cross-tenant references
 * can never be created.
 *
 * Errors:
 * - core::ValidationException: malformed slug, login, role name or permission
 * - core::NotFound: referenced record does not exist in that application
 * - core::Conflict: uniqueness violation
 * - core::StoreUnavailable: persistence failed; nothing was applied
 */
class CredentialStore {
public:
  virtual ~CredentialStore() = default;

  // Applications
  virtual Application create_application(kj::StringPtr slug, kj::StringPtr name,
                                         kj::StringPtr description) = 0;
  [[nodiscard]] virtual kj::Maybe<Application> get_application(kj::StringPtr id) const = 0;
  [[nodiscard]] virtual kj::Maybe<Application>
  find_application_by_slug(kj::StringPtr slug) const = 0;
  [[nodiscard]] virtual kj::Array<Application> list_applications() const = 0;
  virtual Application update_application(kj::StringPtr id, ApplicationPatch patch) = 0;
  // Cascades to the application's users, roles and grants.
  virtual void delete_application(kj::StringPtr id) = 0;

  // Users
  virtual User create_user(kj::StringPtr application_id, kj::StringPtr login,
                           kj::StringPtr password_hash) = 0;
  [[nodiscard]] virtual kj::Maybe<User> get_user(kj::StringPtr application_id,
                                                 kj::StringPtr user_id) const = 0;
  [[nodiscard]] virtual kj::Maybe<User> find_user_by_login(kj::StringPtr application_id,
                                                           kj::StringPtr login) const = 0;
  [[nodiscard]] virtual kj::Array<User> list_users(kj::StringPtr application_id) const = 0;
  virtual User set_user_enabled(kj::StringPtr application_id, kj::StringPtr user_id,
                                bool enabled) = 0;
  virtual User set_user_password_hash(kj::StringPtr application_id, kj::StringPtr user_id,
                                      kj::StringPtr password_hash) = 0;
  // Cascades to the user's grants.
  virtual void delete_user(kj::StringPtr application_id, kj::StringPtr user_id) = 0;

  // Roles
  virtual Role create_role(kj::StringPtr application_id, kj::StringPtr name,
                           kj::ArrayPtr<const kj::String> permissions,
                           kj::StringPtr description) = 0;
  [[nodiscard]] virtual kj::Maybe<Role> get_role(kj::StringPtr application_id,
                                                 kj::StringPtr role_id) const = 0;
  [[nodiscard]] virtual kj::Maybe<Role> find_role_by_name(kj::StringPtr application_id,
                                                          kj::StringPtr name) const = 0;
  [[nodiscard]] virtual kj::Array<Role> list_roles(kj::StringPtr application_id) const = 0;
  virtual Role update_role(kj::StringPtr application_id, kj::StringPtr role_id,
                           RolePatch patch) = 0;
  // Cascades to grants of the role.
  virtual void delete_role(kj::StringPtr application_id, kj::StringPtr role_id) = 0;

  // Grants
  virtual Grant grant_role(kj::StringPtr application_id, kj::StringPtr user_id,
                           kj::StringPtr role_id) = 0;
  virtual void revoke_role(kj::StringPtr application_id, kj::StringPtr user_id,
                           kj::StringPtr role_id) = 0;
  [[nodiscard]] virtual kj::Array<Grant> list_user_grants(kj::StringPtr application_id,
                                                          kj::StringPtr user_id) const = 0;
  [[nodiscard]] virtual kj::Array<Grant> list_role_grants(kj::StringPtr application_id,
                                                          kj::StringPtr role_id) const = 0;

  /**
   * @brief Role names and permission union of a user, read atomically
   *
   * Never throws NotFound: unknown or disabled users and applications yield an inactive
   * snapshot with empty sets.
   */
  [[nodiscard]] virtual UserRoles user_roles(kj::StringPtr application_id,
                                             kj::StringPtr user_id) const = 0;

  /**
   * @brief Authorization generation
   *
   * Incremented inside the write transaction of every application, user, role or grant
   * mutation. Readers that cache derived data tag it with the generation they read and
   * treat any other value as stale.
   */
  [[nodiscard]] virtual uint64_t generation() const = 0;

  // Revoked tokens
  // Idempotent; an existing row keeps its original revocation time. Returns false when
  // the jti was already revoked, which makes single-use tokens race-free.
  virtual bool insert_revoked(kj::StringPtr jti, int64_t expires_at, int64_t revoked_at) = 0;
  [[nodiscard]] virtual bool is_revoked(kj::StringPtr jti) const = 0;
  // Deletes rows with expires_at <= now and returns how many were removed.
  virtual size_t prune_revoked(int64_t now) = 0;

  [[nodiscard]] virtual StoreStats stats() const = 0;
  [[nodiscard]] virtual const TableNames& tables() const = 0;
};

} // namespace keyward::store
