#pragma once

#include <cstddef>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace keyward::auth {

struct SigningKey final {
  kj::String kid; // first 8 hex chars of SHA-256(secret)
  kj::String secret;

  [[nodiscard]] SigningKey clone() const;
};

/**
 * @brief Current and previous token signing keys
 *
 * New tokens are always signed with the current key. Previous keys are kept so that
 * tokens issued before a rotation stay valid for the grace window; once a key falls
 * off the list, every token it signed fails validation.
 *
 * Thread safety: readers take a shared lock; rotate() and retire() swap the whole key
 * set under the exclusive lock.
 */
class KeyRing {
public:
  static constexpr size_t DEFAULT_MAX_PREVIOUS = 3;

  /**
   * @throws core::ConfigException if any secret is shorter than
   *         core::MIN_TOKEN_SECRET_LENGTH
   */
  explicit KeyRing(kj::StringPtr current, kj::ArrayPtr<const kj::String> previous = nullptr,
                   size_t max_previous = DEFAULT_MAX_PREVIOUS);

  KJ_DISALLOW_COPY_AND_MOVE(KeyRing);

  [[nodiscard]] static kj::String key_id(kj::StringPtr secret);

  // Make `new_secret` current; the old current key becomes the newest previous key.
  void rotate(kj::StringPtr new_secret);

  // Drop a previous key before it ages out. The current key cannot be retired.
  bool retire(kj::StringPtr kid);

  [[nodiscard]] SigningKey current() const;
  [[nodiscard]] kj::Maybe<SigningKey> find(kj::StringPtr kid) const;
  [[nodiscard]] kj::Array<kj::String> key_ids() const; // current first

private:
  struct Keys {
    SigningKey current;
    kj::Vector<SigningKey> previous; // newest first
  };

  static SigningKey make_key(kj::StringPtr secret);

  size_t max_previous_;
  kj::MutexGuarded<Keys> keys_;
};

} // namespace keyward::auth
