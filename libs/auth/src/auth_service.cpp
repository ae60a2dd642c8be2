#include "keyward/auth/auth_service.h"

#include "keyward/core/crypto.h"
#include "keyward/core/error.h"
#include "keyward/store/records.h"

#include <kj/debug.h>

namespace keyward::auth {

using core::InvalidCredentials;
using core::TokenError;
using core::TokenInvalid;

AuthConfig AuthConfig::from_settings(const core::Settings& settings) {
  AuthConfig config;
  config.access_ttl = settings.token_ttl_access;
  config.refresh_ttl = settings.token_ttl_refresh;
  config.super_user_login = kj::str(settings.super_user_login);
  config.super_user_password = kj::str(settings.super_user_password);
  return config;
}

AuthService::AuthService(store::CredentialStore& store, const PasswordHasher& hasher,
                         TokenEngine& tokens, PermissionResolver& resolver, AuthConfig config)
    : store_(store), hasher_(hasher), tokens_(tokens), resolver_(resolver),
      config_(kj::mv(config)) {
  KEYWARD_REQUIRE(config_.access_ttl > 0 && config_.refresh_ttl > 0,
                  "Token lifetimes must be positive");
}

bool AuthService::is_super_user(kj::StringPtr login, kj::StringPtr password) const {
  if (!super_user_enabled() || login != config_.super_user_login) {
    return false;
  }
  // Compare digests so the comparison time does not depend on the password length.
  auto given = core::sha256(password.asBytes());
  auto expected = core::sha256(config_.super_user_password.asBytes());
  return core::constant_time_equal(given, expected);
}

TokenPair AuthService::issue(kj::StringPtr subject, kj::StringPtr application_id,
                             kj::ArrayPtr<const kj::String> roles, bool super_user) {
  MintOptions refresh_options;
  refresh_options.super_user = super_user;
  auto refresh = tokens_.mint_refresh(subject, application_id, config_.refresh_ttl,
                                      kj::mv(refresh_options));

  MintOptions access_options;
  access_options.session_id = kj::str(refresh.jti);
  access_options.super_user = super_user;
  auto access = tokens_.mint_access(subject, application_id, roles, config_.access_ttl,
                                    kj::mv(access_options));

  return TokenPair{kj::mv(access), kj::mv(refresh)};
}

void AuthService::validate_password(kj::StringPtr password) const {
  if (password.size() == 0) {
    throw core::ValidationException("Password must not be empty");
  }
}

// ---------------------------------------------------------------------------
// Login and token lifecycle
// ---------------------------------------------------------------------------

TokenPair AuthService::login(kj::StringPtr application_id, kj::StringPtr login,
                             kj::StringPtr password) {
  auto trace_id = core::generate_id();

  if (is_super_user(login, password)) {
    KJ_LOG(INFO, "Super-user login", trace_id, application_id);
    return issue(config_.super_user_login, application_id, nullptr, true);
  }

  // Every rejection below costs one password verification, whatever the reason.
  auto reject = [&](kj::StringPtr reason) -> InvalidCredentials {
    KJ_LOG(WARNING, "Login rejected", trace_id, application_id, reason);
    return InvalidCredentials(trace_id);
  };

  KJ_IF_SOME(app, store_.get_application(application_id)) {
    if (!app.enabled) {
      hasher_.dummy_verify(password);
      throw reject("application disabled"_kj);
    }
  } else {
    hasher_.dummy_verify(password);
    throw reject("unknown application"_kj);
  }

  KJ_IF_SOME(user, store_.find_user_by_login(application_id, login)) {
    bool password_ok = hasher_.verify(password, user.password_hash);
    if (!user.enabled) {
      throw reject("user disabled"_kj);
    }
    if (!password_ok) {
      throw reject("wrong password"_kj);
    }

    if (hasher_.needs_rehash(user.password_hash)) {
      try {
        (void)store_.set_user_password_hash(application_id, user.id, hasher_.hash(password));
        KJ_LOG(INFO, "Password rehashed with current cost", user.id, hasher_.iterations());
      } catch (const core::StoreUnavailable& e) {
        // The old digest still verifies; try again on the next login.
        KJ_LOG(WARNING, "Password rehash not stored", user.id, e.message());
      }
    }

    auto roles = store_.user_roles(application_id, user.id);
    auto pair = issue(user.id, application_id, roles.roles, false);
    KJ_LOG(INFO, "Login succeeded", trace_id, application_id, user.id);
    return pair;
  }

  hasher_.dummy_verify(password);
  throw reject("unknown user"_kj);
}

TokenPair AuthService::refresh(kj::StringPtr refresh_token) {
  auto claims = tokens_.validate(refresh_token, TokenType::REFRESH);

  if (claims.super_user) {
    if (!super_user_enabled() || claims.subject != config_.super_user_login) {
      throw TokenInvalid(TokenError::INACTIVE_SUBJECT);
    }
  } else {
    auto snapshot = store_.user_roles(claims.application_id, claims.subject);
    if (!snapshot.active) {
      KJ_LOG(WARNING, "Refresh rejected for inactive user", claims.application_id,
             claims.subject);
      throw TokenInvalid(TokenError::INACTIVE_SUBJECT);
    }
  }

  if (!tokens_.consume(claims)) {
    KJ_LOG(WARNING, "Refresh token replayed", claims.jti, claims.subject);
    throw TokenInvalid(TokenError::REVOKED);
  }

  if (claims.super_user) {
    return issue(claims.subject, claims.application_id, nullptr, true);
  }
  // Re-read after consuming so the new access token carries current roles.
  auto snapshot = store_.user_roles(claims.application_id, claims.subject);
  return issue(claims.subject, claims.application_id, snapshot.roles, false);
}

PermissionSet AuthService::resolve(const Claims& claims) {
  if (claims.super_user) {
    if (!super_user_enabled() || claims.subject != config_.super_user_login) {
      KJ_LOG(WARNING, "Super-user token rejected; super-user is not configured", claims.subject);
      throw TokenInvalid(TokenError::INACTIVE_SUBJECT);
    }
    return PermissionResolver::resolve_super_user();
  }
  return resolver_.resolve(claims.subject, claims.application_id);
}

Claims AuthService::authorize(kj::StringPtr access_token, kj::StringPtr permission) {
  auto claims = tokens_.validate(access_token, TokenType::ACCESS);
  auto permissions = resolve(claims);
  if (!permissions.contains(permission)) {
    auto trace_id = core::generate_id();
    KJ_LOG(INFO, "Permission denied", trace_id, claims.application_id, claims.subject,
           permission);
    throw core::PermissionDenied(permission, trace_id);
  }
  return claims;
}

void AuthService::logout(kj::StringPtr access_token) {
  auto claims = tokens_.validate(access_token, TokenType::ACCESS);
  tokens_.revoke(claims.jti, claims.expires_at);
  KJ_IF_SOME(sid, claims.session_id) {
    // The paired refresh token was minted in the same call, so it expires no later.
    tokens_.revoke(sid, claims.issued_at + config_.refresh_ttl);
  }
  KJ_LOG(INFO, "Logged out", claims.application_id, claims.subject);
}

PermissionSet AuthService::permissions(kj::StringPtr access_token) {
  auto claims = tokens_.validate(access_token, TokenType::ACCESS);
  return resolve(claims);
}

// ---------------------------------------------------------------------------
// Account management
// ---------------------------------------------------------------------------

store::User AuthService::register_user(kj::StringPtr application_id, kj::StringPtr login,
                                       kj::StringPtr password) {
  store::validate_login(login);
  validate_password(password);
  if (login == config_.super_user_login) {
    throw core::Conflict(kj::str("Login '", login, "' is reserved"));
  }
  return store_.create_user(application_id, login, hasher_.hash(password));
}

void AuthService::change_password(kj::StringPtr access_token, kj::StringPtr old_password,
                                  kj::StringPtr new_password) {
  auto claims = tokens_.validate(access_token, TokenType::ACCESS);
  if (claims.super_user) {
    throw core::ValidationException("The super-user password is set by configuration");
  }
  validate_password(new_password);

  KJ_IF_SOME(user, store_.get_user(claims.application_id, claims.subject)) {
    if (!user.enabled) {
      throw TokenInvalid(TokenError::INACTIVE_SUBJECT);
    }
    if (!hasher_.verify(old_password, user.password_hash)) {
      auto trace_id = core::generate_id();
      KJ_LOG(WARNING, "Password change rejected: wrong password", trace_id, user.id);
      throw InvalidCredentials(trace_id);
    }
    (void)store_.set_user_password_hash(claims.application_id, user.id,
                                        hasher_.hash(new_password));
    KJ_LOG(INFO, "Password changed", claims.application_id, user.id);
    return;
  }
  throw TokenInvalid(TokenError::INACTIVE_SUBJECT);
}

void AuthService::reset_password(kj::StringPtr application_id, kj::StringPtr user_id,
                                 kj::StringPtr new_password) {
  validate_password(new_password);
  auto digest = hasher_.hash(new_password);
  (void)store_.set_user_password_hash(application_id, user_id, digest);
  KJ_LOG(INFO, "Password reset", application_id, user_id);
}

} // namespace keyward::auth
