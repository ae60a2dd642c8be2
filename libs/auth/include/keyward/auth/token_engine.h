/**
 * @file token_engine.h
 * @brief Signed, expiring, revocable tokens
 *
 * Tokens are JWT-shaped: base64url(header).base64url(payload).base64url(signature),
 * signed with HMAC-SHA256 by the key ring's current key. The header carries the key id
 * so validation picks the matching key, which is what lets a rotation overlap with
 * tokens issued before it.
 *
 * Payload claims:
 * - sub: user id (the configured login for the super-user)
 * - app: application id
 * - jti: unique token id, the revocation handle
 * - iat, exp: Unix seconds
 * - type: "access" or "refresh"
 * - roles: role names (access tokens only)
 * - sid: jti of the paired refresh token (access tokens, when paired)
 * - su: true for super-user tokens
 *
 * Revocation state lives in the credential store so it survives restarts.
 */

#pragma once

#include "keyward/auth/key_ring.h"
#include "keyward/core/time.h"
#include "keyward/store/credential_store.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace keyward::auth {

enum class TokenType {
  ACCESS,
  REFRESH,
};

[[nodiscard]] kj::StringPtr to_string(TokenType type);

// Tolerated clock skew for iat claims in the future.
constexpr int64_t MAX_CLOCK_SKEW_SECONDS = 60;

/**
 * @brief Verified token contents
 */
struct Claims final {
  kj::String subject;
  kj::String application_id;
  kj::String jti;
  int64_t issued_at{0};
  int64_t expires_at{0};
  TokenType type{TokenType::ACCESS};
  kj::Array<kj::String> roles;
  kj::Maybe<kj::String> session_id;
  bool super_user{false};
  kj::String kid;

  [[nodiscard]] Claims clone() const;
};

struct MintOptions final {
  kj::Maybe<kj::String> jti; // generated when unset
  kj::Maybe<kj::String> session_id;
  bool super_user{false};
};

struct MintedToken final {
  kj::String token;
  kj::String jti;
  int64_t issued_at{0};
  int64_t expires_at{0};
};

class TokenEngine {
public:
  TokenEngine(const KeyRing& keys, store::CredentialStore& store,
              const core::Clock& clock = core::system_clock());

  KJ_DISALLOW_COPY_AND_MOVE(TokenEngine);

  [[nodiscard]] MintedToken mint_access(kj::StringPtr user_id, kj::StringPtr application_id,
                                        kj::ArrayPtr<const kj::String> roles, int64_t ttl,
                                        MintOptions options = MintOptions());

  [[nodiscard]] MintedToken mint_refresh(kj::StringPtr user_id, kj::StringPtr application_id,
                                         int64_t ttl, MintOptions options = MintOptions());

  /**
   * @brief Verify signature, expiry, type and revocation
   *
   * Checks, in order: format, header encoding and JSON, algorithm (HS256 only), key id,
   * signature, payload encoding and JSON, required claims, `exp <= now` (expired),
   * `iat > now + MAX_CLOCK_SKEW_SECONDS`, type, revocation.
   *
   * @throws core::TokenInvalid carrying the first failed check as its reason
   */
  [[nodiscard]] Claims validate(kj::StringPtr token, TokenType expected_type) const;

  // Idempotent. Does nothing once `expires_at <= now`; such a token is already dead.
  void revoke(kj::StringPtr jti, int64_t expires_at);

  /**
   * @brief Revoke a validated token and report whether this call did it
   *
   * Single-use tokens (refresh rotation) call this after validate(); false means another
   * caller consumed the same token first.
   */
  [[nodiscard]] bool consume(const Claims& claims);

  size_t prune_revoked();

private:
  [[nodiscard]] kj::String sign(kj::StringPtr payload_json) const;

  const KeyRing& keys_;
  store::CredentialStore& store_;
  const core::Clock& clock_;
};

// When periodic revocation pruning is due. An interval of 0 disables it.
class PruneSchedule final {
public:
  explicit PruneSchedule(int64_t interval_seconds);

  [[nodiscard]] bool enabled() const {
    return interval_ > 0;
  }

  // True at most once per interval, starting with the first call. Never true when disabled.
  [[nodiscard]] bool due(int64_t now);

private:
  int64_t interval_;
  kj::Maybe<int64_t> next_;
};

} // namespace keyward::auth
