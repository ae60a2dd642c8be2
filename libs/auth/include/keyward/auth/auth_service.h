/**
 * @file auth_service.h
 * @brief Entry point for the transport layer
 *
 * AuthService composes the password hasher, credential store, token engine and
 * permission resolver into the operations a request handler calls. It never returns a
 * partial result: every failure is one of the typed exceptions in core/error.h.
 *
 * Login failures are uniform. Unknown application, disabled application,
 * unknown user, disabled user and wrong password all raise InvalidCredentials with the
 * same message shape after one password verification's worth of work; the precise
 * reason only appears in the log line carrying the same trace id.
 */

#pragma once

#include "keyward/auth/password_hasher.h"
#include "keyward/auth/permission_resolver.h"
#include "keyward/auth/token_engine.h"
#include "keyward/core/settings.h"
#include "keyward/store/credential_store.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>

namespace keyward::auth {

struct AuthConfig final {
  int64_t access_ttl{900};
  int64_t refresh_ttl{604800};
  kj::String super_user_login;
  kj::String super_user_password; // empty disables super-user login

  [[nodiscard]] static AuthConfig from_settings(const core::Settings& settings);
};

struct TokenPair final {
  MintedToken access;
  MintedToken refresh;
};

class AuthService {
public:
  AuthService(store::CredentialStore& store, const PasswordHasher& hasher, TokenEngine& tokens,
              PermissionResolver& resolver, AuthConfig config);

  KJ_DISALLOW_COPY_AND_MOVE(AuthService);

  /**
   * @brief Exchange credentials for an access/refresh token pair
   *
   * The super-user login is checked first and accepted for any application id.
   *
   * @throws core::InvalidCredentials on any mismatch
   */
  [[nodiscard]] TokenPair login(kj::StringPtr application_id, kj::StringPtr login,
                                kj::StringPtr password);

  /**
   * @brief Rotate a refresh token
   *
   * The presented token is consumed; presenting it again fails. Roles are re-read so
   * the new access token reflects current grants.
   *
   * @throws core::TokenInvalid if the token is invalid or its user or application is no
   *         longer active
   */
  [[nodiscard]] TokenPair refresh(kj::StringPtr refresh_token);

  /**
   * @throws core::TokenInvalid for a bad access token
   * @throws core::PermissionDenied when the permission is not held
   */
  Claims authorize(kj::StringPtr access_token, kj::StringPtr permission);

  // Revokes the access token and its paired refresh token.
  void logout(kj::StringPtr access_token);

  [[nodiscard]] PermissionSet permissions(kj::StringPtr access_token);

  // Account management
  store::User register_user(kj::StringPtr application_id, kj::StringPtr login,
                            kj::StringPtr password);
  void change_password(kj::StringPtr access_token, kj::StringPtr old_password,
                       kj::StringPtr new_password);
  void reset_password(kj::StringPtr application_id, kj::StringPtr user_id,
                      kj::StringPtr new_password);

  [[nodiscard]] const AuthConfig& config() const {
    return config_;
  }

private:
  [[nodiscard]] bool super_user_enabled() const {
    return config_.super_user_password.size() > 0;
  }
  [[nodiscard]] bool is_super_user(kj::StringPtr login, kj::StringPtr password) const;
  [[nodiscard]] TokenPair issue(kj::StringPtr subject, kj::StringPtr application_id,
                                kj::ArrayPtr<const kj::String> roles, bool super_user);
  [[nodiscard]] PermissionSet resolve(const Claims& claims);
  void validate_password(kj::StringPtr password) const;

  store::CredentialStore& store_;
  const PasswordHasher& hasher_;
  TokenEngine& tokens_;
  PermissionResolver& resolver_;
  AuthConfig config_;
};

} // namespace keyward::auth
