#include "keyward/auth/password_hasher.h"

#include "keyward/core/crypto.h"
#include "keyward/core/error.h"
#include "keyward/core/settings.h"

#include <kj/debug.h>
#include <kj/vector.h>
#include <openssl/evp.h>

namespace keyward::auth {

namespace {

struct ParsedDigest {
  uint32_t iterations;
  kj::Array<kj::byte> salt;
  kj::Array<kj::byte> hash;
};

kj::Array<kj::byte> derive(kj::StringPtr plaintext, kj::ArrayPtr<const kj::byte> salt,
                           uint32_t iterations, size_t length) {
  auto out = kj::heapArray<kj::byte>(length);
  int rc = PKCS5_PBKDF2_HMAC(plaintext.begin(), static_cast<int>(plaintext.size()), salt.begin(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations),
                             EVP_sha256(), static_cast<int>(out.size()), out.begin());
  KJ_REQUIRE(rc == 1, "PKCS5_PBKDF2_HMAC failed");
  return out;
}

// Split "$a$b$c$d" into {"a", "b", "c", "d"}. Empty fields are kept.
kj::Vector<kj::ArrayPtr<const char>> split_fields(kj::StringPtr digest) {
  kj::Vector<kj::ArrayPtr<const char>> fields;
  if (digest.size() == 0 || digest[0] != '$') {
    return fields;
  }
  size_t start = 1;
  for (size_t i = 1; i <= digest.size(); ++i) {
    if (i == digest.size() || digest[i] == '$') {
      fields.add(digest.slice(start, i));
      start = i + 1;
    }
  }
  return fields;
}

kj::Maybe<ParsedDigest> parse_digest(kj::StringPtr digest) {
  auto fields = split_fields(digest);
  if (fields.size() != 4) {
    return kj::none;
  }
  if (kj::StringPtr(PasswordHasher::ALGORITHM).asArray() != fields[0]) {
    return kj::none;
  }

  auto iteration_text = kj::str(fields[1]);
  uint32_t iterations = 0;
  KJ_IF_SOME(parsed, iteration_text.tryParseAs<uint64_t>()) {
    if (parsed < core::MIN_PASSWORD_HASH_ITERATIONS || parsed > PasswordHasher::MAX_ITERATIONS) {
      return kj::none;
    }
    iterations = static_cast<uint32_t>(parsed);
  } else {
    return kj::none;
  }

  auto salt = core::base64url_decode(fields[2]);
  auto hash = core::base64url_decode(fields[3]);
  if (salt.size() == 0 || hash.size() != PasswordHasher::KEY_BYTES) {
    return kj::none;
  }
  return ParsedDigest{iterations, kj::mv(salt), kj::mv(hash)};
}

} // namespace

PasswordHasher::PasswordHasher(uint32_t iterations) : iterations_(iterations) {
  if (iterations < core::MIN_PASSWORD_HASH_ITERATIONS || iterations > MAX_ITERATIONS) {
    throw core::ConfigException(kj::str("password_hash_iterations must be between ",
                                        core::MIN_PASSWORD_HASH_ITERATIONS, " and ",
                                        MAX_ITERATIONS));
  }
  dummy_digest_ = hash(core::hex_encode(core::random_bytes(SALT_BYTES)));
}

kj::String PasswordHasher::hash(kj::StringPtr plaintext) const {
  auto salt = core::random_bytes(SALT_BYTES);
  auto key = derive(plaintext, salt, iterations_, KEY_BYTES);
  return kj::str("$", ALGORITHM, "$", iterations_, "$", core::base64url_encode(salt), "$",
                 core::base64url_encode(key));
}

bool PasswordHasher::verify(kj::StringPtr plaintext, kj::StringPtr digest) const {
  KJ_IF_SOME(parsed, parse_digest(digest)) {
    auto key = derive(plaintext, parsed.salt, parsed.iterations, parsed.hash.size());
    return core::constant_time_equal(key, parsed.hash);
  }
  return false;
}

bool PasswordHasher::needs_rehash(kj::StringPtr digest) const {
  KJ_IF_SOME(parsed, parse_digest(digest)) {
    return parsed.iterations != iterations_;
  }
  return true;
}

void PasswordHasher::dummy_verify(kj::StringPtr plaintext) const {
  (void)verify(plaintext, dummy_digest_);
}

} // namespace keyward::auth
