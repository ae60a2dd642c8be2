/**
 * @file password_hasher.h
 * @brief Salted, self-describing password digests
 *
 * Digests use PBKDF2-HMAC-SHA256 from OpenSSL and are stored as
 *
 *   $pbkdf2-sha256$<iterations>$<salt>$<hash>
 *
 * with salt and hash in unpadded Base64URL. Because the cost is part of the digest,
 * raising `password_hash_iterations` never invalidates stored passwords; they are
 * rehashed on the next successful login instead.
 */

#pragma once

#include "keyward/core/settings.h"

#include <cstddef>
#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>

namespace keyward::auth {

class PasswordHasher {
public:
  static constexpr kj::StringPtr ALGORITHM = "pbkdf2-sha256"_kj;
  static constexpr size_t SALT_BYTES = 16;
  static constexpr size_t KEY_BYTES = 32;
  // Digests claiming more work than this are rejected rather than verified.
  static constexpr uint32_t MAX_ITERATIONS = core::MAX_PASSWORD_HASH_ITERATIONS;

  /**
   * @brief Construct a hasher with the given cost
   *
   * @throws core::ConfigException if iterations is outside
   *         [core::MIN_PASSWORD_HASH_ITERATIONS, MAX_ITERATIONS]
   */
  explicit PasswordHasher(uint32_t iterations);

  KJ_DISALLOW_COPY_AND_MOVE(PasswordHasher);

  [[nodiscard]] kj::String hash(kj::StringPtr plaintext) const;

  /**
   * @brief Check a plaintext against a stored digest
   *
   * Uses the iteration count embedded in the digest. A malformed digest, an unknown
   * algorithm, an out-of-range cost or a hash of the wrong length yields false.
   */
  [[nodiscard]] bool verify(kj::StringPtr plaintext, kj::StringPtr digest) const;

  // True when the digest was produced with a different cost (or cannot be parsed).
  [[nodiscard]] bool needs_rehash(kj::StringPtr digest) const;

  // Burn one verification's worth of work. Used when there is no digest to check.
  void dummy_verify(kj::StringPtr plaintext) const;

  [[nodiscard]] uint32_t iterations() const {
    return iterations_;
  }

private:
  uint32_t iterations_;
  kj::String dummy_digest_;
};

} // namespace keyward::auth
