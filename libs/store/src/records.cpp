#include "keyward/store/records.h"

#include "keyward/core/error.h"

#include <kj/map.h>
#include <kj/vector.h>

namespace keyward::store {

using core::ValidationException;

namespace {

bool is_name_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

void validate_name(kj::StringPtr field, kj::StringPtr value, size_t min_length) {
  if (value.size() < min_length || value.size() > MAX_NAME_LENGTH) {
    throw ValidationException(kj::str(field, " must be between ", min_length, " and ",
                                      MAX_NAME_LENGTH, " characters"));
  }
  for (char c : value) {
    if (!is_name_char(c)) {
      throw ValidationException(
          kj::str(field, " may only contain lowercase letters, digits, '_' and '-'"));
    }
  }
}

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

kj::String qualify(kj::StringPtr schema, kj::StringPtr prefix, kj::StringPtr table) {
  if (schema.size() == 0) {
    return kj::str(prefix, table);
  }
  return kj::str(schema, ".", prefix, table);
}

} // namespace

Application Application::clone() const {
  return Application{kj::str(id),          kj::str(slug), kj::str(name), kj::str(description),
                     enabled,              created_at,    updated_at};
}

User User::clone() const {
  return User{kj::str(id), kj::str(application_id), kj::str(login), kj::str(password_hash),
              enabled,     created_at,              updated_at};
}

Role Role::clone() const {
  return Role{kj::str(id),
              kj::str(application_id),
              kj::str(name),
              kj::str(description),
              clone_strings(permissions),
              created_at,
              updated_at};
}

Grant Grant::clone() const {
  return Grant{kj::str(user_id), kj::str(role_id), kj::str(application_id), created_at};
}

RevokedToken RevokedToken::clone() const {
  return RevokedToken{kj::str(jti), expires_at, revoked_at};
}

TableNames TableNames::make(kj::StringPtr schema, kj::StringPtr prefix) {
  return TableNames{
      qualify(schema, prefix, "applications"_kj), qualify(schema, prefix, "users"_kj),
      qualify(schema, prefix, "roles"_kj),        qualify(schema, prefix, "grants"_kj),
      qualify(schema, prefix, "revoked_tokens"_kj), qualify(schema, prefix, "journal"_kj),
  };
}

TableNames TableNames::clone() const {
  return TableNames{kj::str(applications), kj::str(users),          kj::str(roles),
                    kj::str(grants),       kj::str(revoked_tokens), kj::str(journal)};
}

void validate_slug(kj::StringPtr slug) {
  validate_name("Application slug"_kj, slug, MIN_SLUG_LENGTH);
}

void validate_login(kj::StringPtr login) {
  validate_name("User login"_kj, login, 1);
}

void validate_role_name(kj::StringPtr name) {
  validate_name("Role name"_kj, name, 1);
}

void validate_permission(kj::StringPtr permission) {
  if (permission.size() == 0 || permission.size() > MAX_NAME_LENGTH) {
    throw ValidationException(kj::str("Permission must be between 1 and ", MAX_NAME_LENGTH,
                                      " characters"));
  }

  size_t separators = 0;
  size_t separator_at = 0;
  for (size_t i = 0; i < permission.size(); ++i) {
    if (is_space(permission[i])) {
      throw ValidationException(kj::str("Permission '", permission, "' contains whitespace"));
    }
    if (permission[i] == ':') {
      ++separators;
      separator_at = i;
    }
  }

  // resource:action, both parts non-empty
  if (separators != 1 || separator_at == 0 || separator_at == permission.size() - 1) {
    throw ValidationException(
        kj::str("Permission '", permission, "' must have the form resource:action"));
  }
}

kj::Array<kj::String> normalize_permissions(kj::ArrayPtr<const kj::String> permissions) {
  kj::HashSet<kj::StringPtr> seen;
  kj::Vector<kj::String> result(permissions.size());
  for (auto& permission : permissions) {
    validate_permission(permission);
    if (seen.contains(permission)) {
      continue;
    }
    seen.insert(permission);
    result.add(kj::str(permission));
  }
  return result.releaseAsArray();
}

kj::Array<kj::String> clone_strings(kj::ArrayPtr<const kj::String> strings) {
  auto builder = kj::heapArrayBuilder<kj::String>(strings.size());
  for (auto& s : strings) {
    builder.add(kj::str(s));
  }
  return builder.finish();
}

} // namespace keyward::store
