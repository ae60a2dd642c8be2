#include "keyward/auth/token_engine.h"

#include "keyward/core/crypto.h"
#include "keyward/core/error.h"

#include <cstdlib>
#include <cstring>
#include <kj/debug.h>
#include <kj/vector.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <yyjson.h>

namespace keyward::auth {

using core::TokenError;
using core::TokenInvalid;

namespace {

constexpr kj::StringPtr ALGORITHM = "HS256"_kj;

kj::Array<kj::byte> hmac_sha256(kj::StringPtr key, kj::ArrayPtr<const kj::byte> data) {
  auto digest = kj::heapArray<kj::byte>(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  auto* result = HMAC(EVP_sha256(), key.begin(), static_cast<int>(key.size()), data.begin(),
                      data.size(), digest.begin(), &digest_len);
  KJ_REQUIRE(result != nullptr, "HMAC-SHA256 failed");
  return kj::heapArray<kj::byte>(digest.first(digest_len));
}

// Serialize a mutable document; the writer's buffer is released before returning.
kj::String write_json(yyjson_mut_doc* doc) {
  size_t len = 0;
  char* json = yyjson_mut_write(doc, 0, &len);
  KJ_REQUIRE(json != nullptr, "Failed to serialize token JSON");
  KJ_DEFER(free(json));
  return kj::heapString(json, len);
}

void add_string(yyjson_mut_doc* doc, yyjson_mut_val* obj, const char* key, kj::StringPtr value) {
  yyjson_mut_obj_add_strncpy(doc, obj, key, value.begin(), value.size());
}

kj::String header_json(kj::StringPtr kid) {
  yyjson_mut_doc* doc = yyjson_mut_doc_new(nullptr);
  KJ_DEFER(yyjson_mut_doc_free(doc));
  yyjson_mut_val* root = yyjson_mut_obj(doc);
  yyjson_mut_doc_set_root(doc, root);
  add_string(doc, root, "alg", ALGORITHM);
  add_string(doc, root, "typ", "JWT"_kj);
  add_string(doc, root, "kid", kid);
  return write_json(doc);
}

kj::String take_or_generate(kj::Maybe<kj::String>& jti) {
  KJ_IF_SOME(value, jti) {
    return kj::mv(value);
  }
  return core::generate_id();
}

struct TokenParts {
  kj::ArrayPtr<const char> header;
  kj::ArrayPtr<const char> payload;
  kj::ArrayPtr<const char> signature;
  kj::ArrayPtr<const char> signing_input;
};

TokenParts split_token(kj::StringPtr token) {
  size_t first_dot = token.findFirst('.').orDefault(SIZE_MAX);
  size_t second_dot = SIZE_MAX;
  if (first_dot != SIZE_MAX && first_dot + 1 < token.size()) {
    KJ_IF_SOME(offset, token.slice(first_dot + 1).findFirst('.')) {
      second_dot = first_dot + 1 + offset;
    }
  }

  if (first_dot == SIZE_MAX || second_dot == SIZE_MAX || first_dot == 0 ||
      second_dot == first_dot + 1 || second_dot == token.size() - 1) {
    throw TokenInvalid(TokenError::INVALID_FORMAT);
  }
  // A third dot means more than three segments.
  if (token.slice(second_dot + 1).findFirst('.') != kj::none) {
    throw TokenInvalid(TokenError::INVALID_FORMAT);
  }

  return TokenParts{token.slice(0, first_dot), token.slice(first_dot + 1, second_dot),
                    token.slice(second_dot + 1), token.slice(0, second_dot)};
}

// Owns a parsed document for the lifetime of one validation.
class JsonDoc {
public:
  explicit JsonDoc(kj::ArrayPtr<const char> encoded) {
    auto bytes = core::base64url_decode(encoded);
    if (bytes.size() == 0) {
      throw TokenInvalid(TokenError::INVALID_BASE64);
    }
    doc_ = yyjson_read(reinterpret_cast<const char*>(bytes.begin()), bytes.size(), 0);
    if (doc_ == nullptr) {
      throw TokenInvalid(TokenError::INVALID_JSON);
    }
    if (!yyjson_is_obj(yyjson_doc_get_root(doc_))) {
      yyjson_doc_free(doc_);
      throw TokenInvalid(TokenError::INVALID_JSON);
    }
  }
  ~JsonDoc() {
    if (doc_ != nullptr) {
      yyjson_doc_free(doc_);
    }
  }
  KJ_DISALLOW_COPY_AND_MOVE(JsonDoc);

  yyjson_val* get(const char* key) const {
    return yyjson_obj_get(yyjson_doc_get_root(doc_), key);
  }

  kj::Maybe<kj::StringPtr> get_string(const char* key) const {
    yyjson_val* val = get(key);
    if (val == nullptr || !yyjson_is_str(val)) {
      return kj::none;
    }
    return kj::StringPtr(yyjson_get_str(val), yyjson_get_len(val));
  }

  kj::Maybe<int64_t> get_int(const char* key) const {
    yyjson_val* val = get(key);
    if (val == nullptr || !yyjson_is_int(val)) {
      return kj::none;
    }
    return yyjson_get_sint(val);
  }

private:
  yyjson_doc* doc_ = nullptr;
};

kj::String require_string(const JsonDoc& doc, const char* key) {
  KJ_IF_SOME(value, doc.get_string(key)) {
    if (value.size() > 0) {
      return kj::str(value);
    }
  }
  throw TokenInvalid(TokenError::MISSING_CLAIMS);
}

int64_t require_int(const JsonDoc& doc, const char* key) {
  KJ_IF_SOME(value, doc.get_int(key)) {
    return value;
  }
  throw TokenInvalid(TokenError::MISSING_CLAIMS);
}

} // namespace

kj::StringPtr to_string(TokenType type) {
  switch (type) {
  case TokenType::ACCESS:
    return "access"_kj;
  case TokenType::REFRESH:
    return "refresh"_kj;
  }
  return "unknown"_kj;
}

Claims Claims::clone() const {
  Claims copy;
  copy.subject = kj::str(subject);
  copy.application_id = kj::str(application_id);
  copy.jti = kj::str(jti);
  copy.issued_at = issued_at;
  copy.expires_at = expires_at;
  copy.type = type;
  copy.roles = store::clone_strings(roles);
  KJ_IF_SOME(sid, session_id) {
    copy.session_id = kj::str(sid);
  }
  copy.super_user = super_user;
  copy.kid = kj::str(kid);
  return copy;
}

TokenEngine::TokenEngine(const KeyRing& keys, store::CredentialStore& store,
                         const core::Clock& clock)
    : keys_(keys), store_(store), clock_(clock) {}

kj::String TokenEngine::sign(kj::StringPtr payload_json) const {
  auto key = keys_.current();
  auto signing_input = kj::str(core::base64url_encode(header_json(key.kid).asBytes()), ".",
                               core::base64url_encode(payload_json.asBytes()));
  auto signature = hmac_sha256(key.secret, signing_input.asBytes());
  return kj::str(signing_input, ".", core::base64url_encode(signature));
}

MintedToken TokenEngine::mint_access(kj::StringPtr user_id, kj::StringPtr application_id,
                                     kj::ArrayPtr<const kj::String> roles, int64_t ttl,
                                     MintOptions options) {
  KEYWARD_REQUIRE(ttl > 0, "Access token TTL must be positive", ttl);

  MintedToken minted;
  minted.jti = take_or_generate(options.jti);
  minted.issued_at = clock_.now();
  minted.expires_at = minted.issued_at + ttl;

  yyjson_mut_doc* doc = yyjson_mut_doc_new(nullptr);
  KJ_DEFER(yyjson_mut_doc_free(doc));
  yyjson_mut_val* root = yyjson_mut_obj(doc);
  yyjson_mut_doc_set_root(doc, root);
  add_string(doc, root, "sub", user_id);
  add_string(doc, root, "app", application_id);
  add_string(doc, root, "jti", minted.jti);
  yyjson_mut_obj_add_int(doc, root, "iat", minted.issued_at);
  yyjson_mut_obj_add_int(doc, root, "exp", minted.expires_at);
  add_string(doc, root, "type", to_string(TokenType::ACCESS));

  yyjson_mut_val* role_array = yyjson_mut_arr(doc);
  for (auto& role : roles) {
    yyjson_mut_arr_add_strncpy(doc, role_array, role.begin(), role.size());
  }
  yyjson_mut_obj_add_val(doc, root, "roles", role_array);

  KJ_IF_SOME(sid, options.session_id) {
    add_string(doc, root, "sid", sid);
  }
  if (options.super_user) {
    yyjson_mut_obj_add_bool(doc, root, "su", true);
  }

  minted.token = sign(write_json(doc));
  return minted;
}

MintedToken TokenEngine::mint_refresh(kj::StringPtr user_id, kj::StringPtr application_id,
                                      int64_t ttl, MintOptions options) {
  KEYWARD_REQUIRE(ttl > 0, "Refresh token TTL must be positive", ttl);

  MintedToken minted;
  minted.jti = take_or_generate(options.jti);
  minted.issued_at = clock_.now();
  minted.expires_at = minted.issued_at + ttl;

  yyjson_mut_doc* doc = yyjson_mut_doc_new(nullptr);
  KJ_DEFER(yyjson_mut_doc_free(doc));
  yyjson_mut_val* root = yyjson_mut_obj(doc);
  yyjson_mut_doc_set_root(doc, root);
  add_string(doc, root, "sub", user_id);
  add_string(doc, root, "app", application_id);
  add_string(doc, root, "jti", minted.jti);
  yyjson_mut_obj_add_int(doc, root, "iat", minted.issued_at);
  yyjson_mut_obj_add_int(doc, root, "exp", minted.expires_at);
  add_string(doc, root, "type", to_string(TokenType::REFRESH));
  if (options.super_user) {
    yyjson_mut_obj_add_bool(doc, root, "su", true);
  }

  minted.token = sign(write_json(doc));
  return minted;
}

Claims TokenEngine::validate(kj::StringPtr token, TokenType expected_type) const {
  auto parts = split_token(token);

  // Header: algorithm and key id, before anything in the payload is trusted.
  JsonDoc header(parts.header);
  KJ_IF_SOME(alg, header.get_string("alg")) {
    if (alg != ALGORITHM) {
      throw TokenInvalid(TokenError::ALGORITHM_MISMATCH);
    }
  } else {
    throw TokenInvalid(TokenError::MISSING_CLAIMS);
  }
  auto kid = require_string(header, "kid");

  KJ_IF_SOME(key, keys_.find(kid)) {
    auto signature = core::base64url_decode(parts.signature);
    if (signature.size() == 0) {
      throw TokenInvalid(TokenError::INVALID_BASE64);
    }
    auto expected = hmac_sha256(key.secret, parts.signing_input.asBytes());
    if (!core::constant_time_equal(expected, signature)) {
      throw TokenInvalid(TokenError::INVALID_SIGNATURE);
    }
  } else {
    throw TokenInvalid(TokenError::UNKNOWN_KEY);
  }

  JsonDoc payload(parts.payload);
  Claims claims;
  claims.kid = kj::mv(kid);
  claims.subject = require_string(payload, "sub");
  claims.application_id = require_string(payload, "app");
  claims.jti = require_string(payload, "jti");
  claims.issued_at = require_int(payload, "iat");
  claims.expires_at = require_int(payload, "exp");
  auto type = require_string(payload, "type");

  auto now = clock_.now();
  if (claims.expires_at <= now) {
    throw TokenInvalid(TokenError::EXPIRED);
  }
  if (claims.issued_at > now + MAX_CLOCK_SKEW_SECONDS) {
    throw TokenInvalid(TokenError::FUTURE_ISSUED);
  }

  if (type == to_string(TokenType::ACCESS)) {
    claims.type = TokenType::ACCESS;
  } else if (type == to_string(TokenType::REFRESH)) {
    claims.type = TokenType::REFRESH;
  } else {
    throw TokenInvalid(TokenError::TYPE_MISMATCH);
  }
  if (claims.type != expected_type) {
    throw TokenInvalid(TokenError::TYPE_MISMATCH);
  }

  kj::Vector<kj::String> roles;
  yyjson_val* roles_val = payload.get("roles");
  if (roles_val != nullptr) {
    if (!yyjson_is_arr(roles_val)) {
      throw TokenInvalid(TokenError::MISSING_CLAIMS);
    }
    size_t idx, max;
    yyjson_val* role;
    yyjson_arr_foreach(roles_val, idx, max, role) {
      if (!yyjson_is_str(role)) {
        throw TokenInvalid(TokenError::MISSING_CLAIMS);
      }
      roles.add(kj::heapString(yyjson_get_str(role), yyjson_get_len(role)));
    }
  }
  claims.roles = roles.releaseAsArray();

  KJ_IF_SOME(sid, payload.get_string("sid")) {
    claims.session_id = kj::str(sid);
  }
  yyjson_val* su_val = payload.get("su");
  claims.super_user = su_val != nullptr && yyjson_is_true(su_val);

  if (store_.is_revoked(claims.jti)) {
    throw TokenInvalid(TokenError::REVOKED);
  }
  return claims;
}

void TokenEngine::revoke(kj::StringPtr jti, int64_t expires_at) {
  auto now = clock_.now();
  if (expires_at <= now) {
    return;
  }
  if (store_.insert_revoked(jti, expires_at, now)) {
    KJ_LOG(INFO, "Token revoked", jti, expires_at);
  }
}

bool TokenEngine::consume(const Claims& claims) {
  return store_.insert_revoked(claims.jti, claims.expires_at, clock_.now());
}

size_t TokenEngine::prune_revoked() {
  return store_.prune_revoked(clock_.now());
}

PruneSchedule::PruneSchedule(int64_t interval_seconds) : interval_(interval_seconds) {
  KEYWARD_REQUIRE(interval_ >= 0, "Prune interval must not be negative");
}

bool PruneSchedule::due(int64_t now) {
  if (!enabled()) {
    return false;
  }
  KJ_IF_SOME(next, next_) {
    if (now < next) {
      return false;
    }
  }
  next_ = now + interval_;
  return true;
}

} // namespace keyward::auth
