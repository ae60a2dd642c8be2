#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace keyward::store {

constexpr size_t MAX_NAME_LENGTH = 255;
constexpr size_t MIN_SLUG_LENGTH = 3;

// Tenant boundary. Every user, role and grant belongs to exactly one application.
struct Application final {
  kj::String id;
  kj::String slug;
  kj::String name;
  kj::String description;
  bool enabled{true};
  int64_t created_at{0};
  int64_t updated_at{0};

  [[nodiscard]] Application clone() const;
};

struct User final {
  kj::String id;
  kj::String application_id;
  kj::String login;
  kj::String password_hash;
  bool enabled{true};
  int64_t created_at{0};
  int64_t updated_at{0};

  [[nodiscard]] User clone() const;
};

struct Role final {
  kj::String id;
  kj::String application_id;
  kj::String name;
  kj::String description;
  kj::Array<kj::String> permissions; // insertion order, no duplicates
  int64_t created_at{0};
  int64_t updated_at{0};

  [[nodiscard]] Role clone() const;
};

// Links a user to a role. application_id always equals both sides' application.
struct Grant final {
  kj::String user_id;
  kj::String role_id;
  kj::String application_id;
  int64_t created_at{0};

  [[nodiscard]] Grant clone() const;
};

struct RevokedToken final {
  kj::String jti;
  int64_t expires_at{0};
  int64_t revoked_at{0};

  [[nodiscard]] RevokedToken clone() const;
};

// Partial update of an application; unset fields keep their value.
struct ApplicationPatch final {
  kj::Maybe<kj::String> slug;
  kj::Maybe<kj::String> name;
  kj::Maybe<kj::String> description;
  kj::Maybe<bool> enabled;
};

struct RolePatch final {
  kj::Maybe<kj::String> name;
  kj::Maybe<kj::String> description;
  kj::Maybe<kj::Array<kj::String>> permissions;
};

/**
 * @brief Grants of one user, read in a single consistent snapshot
 *
 * `active` is false when the user or its application is unknown or disabled; roles and
 * permissions are then empty. `generation` is the store's authorization generation at
 * the moment of the read.
 */
struct UserRoles final {
  uint64_t generation{0};
  bool active{false};
  kj::Array<kj::String> roles;
  kj::Array<kj::String> permissions;
};

struct StoreStats final {
  size_t applications{0};
  size_t users{0};
  size_t roles{0};
  size_t grants{0};
  size_t revoked_tokens{0};
  size_t applications_without_users{0};
  size_t users_without_roles{0};
  size_t roles_without_permissions{0};
  uint64_t generation{0};
};

/**
 * @brief Qualified table names, `<schema>.<prefix><table>`
 *
 * The schema part is omitted when empty. Journal files share the same qualifier so two
 * deployments can use one data directory.
 */
struct TableNames final {
  kj::String applications;
  kj::String users;
  kj::String roles;
  kj::String grants;
  kj::String revoked_tokens;
  kj::String journal;

  [[nodiscard]] static TableNames make(kj::StringPtr schema, kj::StringPtr prefix);
  [[nodiscard]] TableNames clone() const;
};

// Input validation. Each throws core::ValidationException with a field-specific message.
void validate_slug(kj::StringPtr slug);
void validate_login(kj::StringPtr login);
void validate_role_name(kj::StringPtr name);
void validate_permission(kj::StringPtr permission);

// Validate every entry and drop duplicates, keeping first occurrence order.
[[nodiscard]] kj::Array<kj::String> normalize_permissions(kj::ArrayPtr<const kj::String> permissions);

[[nodiscard]] kj::Array<kj::String> clone_strings(kj::ArrayPtr<const kj::String> strings);

} // namespace keyward::store
