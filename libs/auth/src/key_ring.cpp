#include "keyward/auth/key_ring.h"

#include "keyward/core/crypto.h"
#include "keyward/core/error.h"
#include "keyward/core/settings.h"

#include <kj/debug.h>

namespace keyward::auth {

SigningKey SigningKey::clone() const {
  return SigningKey{kj::str(kid), kj::str(secret)};
}

kj::String KeyRing::key_id(kj::StringPtr secret) {
  auto digest = core::sha256(secret.asBytes());
  return kj::str(core::hex_encode(digest).slice(0, 8));
}

SigningKey KeyRing::make_key(kj::StringPtr secret) {
  if (secret.size() < core::MIN_TOKEN_SECRET_LENGTH) {
    throw core::ConfigException(kj::str("Token signing secrets must be at least ",
                                        core::MIN_TOKEN_SECRET_LENGTH, " bytes"));
  }
  return SigningKey{key_id(secret), kj::str(secret)};
}

KeyRing::KeyRing(kj::StringPtr current, kj::ArrayPtr<const kj::String> previous,
                 size_t max_previous)
    : max_previous_(max_previous) {
  auto lock = keys_.lockExclusive();
  lock->current = make_key(current);
  for (auto& secret : previous) {
    if (lock->previous.size() >= max_previous_) {
      KJ_LOG(WARNING, "Ignoring previous signing keys beyond the grace window", max_previous_);
      break;
    }
    lock->previous.add(make_key(secret));
  }
  KJ_LOG(INFO, "Key ring loaded", lock->current.kid, lock->previous.size());
}

void KeyRing::rotate(kj::StringPtr new_secret) {
  auto key = make_key(new_secret);

  auto lock = keys_.lockExclusive();
  Keys next;
  next.current = kj::mv(key);
  next.previous.add(kj::mv(lock->current));
  for (auto& old : lock->previous) {
    if (next.previous.size() >= max_previous_) {
      break;
    }
    next.previous.add(kj::mv(old));
  }
  if (next.previous.size() > max_previous_) {
    next.previous.resize(max_previous_);
  }
  *lock = kj::mv(next);

  KJ_LOG(INFO, "Signing key rotated", lock->current.kid, lock->previous.size());
}

bool KeyRing::retire(kj::StringPtr kid) {
  auto lock = keys_.lockExclusive();
  kj::Vector<SigningKey> kept(lock->previous.size());
  bool removed = false;
  for (auto& key : lock->previous) {
    if (key.kid == kid) {
      removed = true;
    } else {
      kept.add(kj::mv(key));
    }
  }
  lock->previous = kj::mv(kept);
  if (removed) {
    KJ_LOG(INFO, "Signing key retired", kid);
  }
  return removed;
}

SigningKey KeyRing::current() const {
  return keys_.lockShared()->current.clone();
}

kj::Maybe<SigningKey> KeyRing::find(kj::StringPtr kid) const {
  auto lock = keys_.lockShared();
  if (lock->current.kid == kid) {
    return lock->current.clone();
  }
  for (auto& key : lock->previous) {
    if (key.kid == kid) {
      return key.clone();
    }
  }
  return kj::none;
}

kj::Array<kj::String> KeyRing::key_ids() const {
  auto lock = keys_.lockShared();
  auto builder = kj::heapArrayBuilder<kj::String>(lock->previous.size() + 1);
  builder.add(kj::str(lock->current.kid));
  for (auto& key : lock->previous) {
    builder.add(kj::str(key.kid));
  }
  return builder.finish();
}

} // namespace keyward::auth
