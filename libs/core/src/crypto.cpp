#include "keyward/core/crypto.h"

#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/vector.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace keyward::core {

kj::Array<kj::byte> random_bytes(size_t length) {
  kj::Array<kj::byte> bytes = kj::heapArray<kj::byte>(length);
  if (length == 0) {
    return bytes;
  }

  int result = RAND_bytes(bytes.begin(), static_cast<int>(length));
  KJ_REQUIRE(result == 1, "Failed to generate random bytes");

  return bytes;
}

kj::String hex_encode(kj::ArrayPtr<const kj::byte> data) {
  static constexpr char HEX_MAP[] = "0123456789abcdef";
  kj::String result = kj::heapString(data.size() * 2);
  for (size_t i = 0; i < data.size(); ++i) {
    result[i * 2] = HEX_MAP[(data[i] >> 4) & 0x0F];
    result[i * 2 + 1] = HEX_MAP[data[i] & 0x0F];
  }
  return result;
}

kj::String generate_id() {
  auto bytes = random_bytes(16);

  // RFC 4122 version 4 / variant 1 bits
  bytes[6] = static_cast<kj::byte>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<kj::byte>((bytes[8] & 0x3F) | 0x80);

  auto hex = hex_encode(bytes);
  return kj::str(hex.slice(0, 8), "-", hex.slice(8, 12), "-", hex.slice(12, 16), "-",
                 hex.slice(16, 20), "-", hex.slice(20, 32));
}

kj::Array<kj::byte> sha256(kj::ArrayPtr<const kj::byte> data) {
  kj::Array<kj::byte> digest = kj::heapArray<kj::byte>(SHA256_BYTES);
  unsigned int digest_len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  KJ_REQUIRE(ctx != nullptr, "Failed to create EVP context");
  KJ_DEFER(EVP_MD_CTX_free(ctx));

  KJ_REQUIRE(EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1, "Failed to initialize SHA256");
  KJ_REQUIRE(EVP_DigestUpdate(ctx, data.begin(), data.size()) == 1,
             "Failed to update SHA256 digest");
  KJ_REQUIRE(EVP_DigestFinal_ex(ctx, digest.begin(), &digest_len) == 1,
             "Failed to finalize SHA256 digest");
  KJ_REQUIRE(digest_len == SHA256_BYTES, "Unexpected SHA256 digest length");

  return digest;
}

kj::String base64url_encode(kj::ArrayPtr<const kj::byte> data) {
  return kj::encodeBase64Url(data);
}

kj::Array<kj::byte> base64url_decode(kj::ArrayPtr<const char> encoded) {
  if (encoded.size() == 0) {
    return kj::heapArray<kj::byte>(0);
  }

  // Base64URL uses '-' and '_' instead of '+' and '/', and omits padding.
  kj::Vector<char> standard;
  standard.reserve(encoded.size() + 4);
  for (char c : encoded) {
    if (c == '-') {
      standard.add('+');
    } else if (c == '_') {
      standard.add('/');
    } else if (c == '+' || c == '/' || c == '=') {
      // Not part of the URL-safe alphabet.
      return kj::heapArray<kj::byte>(0);
    } else {
      standard.add(c);
    }
  }
  while (standard.size() % 4 != 0) {
    standard.add('=');
  }
  standard.add('\0');

  kj::StringPtr b64(standard.begin(), standard.size() - 1);
  auto result = kj::decodeBase64(b64);
  if (result.hadErrors) {
    return kj::heapArray<kj::byte>(0);
  }
  return kj::mv(result);
}

bool constant_time_equal(kj::ArrayPtr<const kj::byte> a, kj::ArrayPtr<const kj::byte> b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.size() == 0) {
    return true;
  }
  return CRYPTO_memcmp(a.begin(), b.begin(), a.size()) == 0;
}

} // namespace keyward::core
