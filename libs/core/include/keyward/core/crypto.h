/**
 * @file crypto.h
 * @brief OpenSSL-backed primitives shared by the store and the auth library
 *
 * - random_bytes(): RAND_bytes, never std::random_device
 * - generate_id(): opaque UUID-formatted identifiers for every entity and token
 * - sha256(): EVP digest, used for signing key ids
 * - Base64URL helpers over kj/encoding.h
 */

#pragma once

#include <cstddef>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace keyward::core {

constexpr size_t SHA256_BYTES = 32;

[[nodiscard]] kj::Array<kj::byte> random_bytes(size_t length);

[[nodiscard]] kj::String hex_encode(kj::ArrayPtr<const kj::byte> data);

/**
 * @brief Generate an opaque 128-bit identifier
 *
 * Format: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx (random version 4 layout). Ids are never
 * sequential, so tenants and users cannot be enumerated.
 */
[[nodiscard]] kj::String generate_id();

[[nodiscard]] kj::Array<kj::byte> sha256(kj::ArrayPtr<const kj::byte> data);

[[nodiscard]] kj::String base64url_encode(kj::ArrayPtr<const kj::byte> data);

/**
 * @brief Decode unpadded Base64URL
 *
 * @return Decoded bytes, or an empty array if the input is empty or malformed
 */
[[nodiscard]] kj::Array<kj::byte> base64url_decode(kj::ArrayPtr<const char> encoded);

// Constant-time comparison of two byte ranges (CRYPTO_memcmp).
[[nodiscard]] bool constant_time_equal(kj::ArrayPtr<const kj::byte> a,
                                       kj::ArrayPtr<const kj::byte> b);

} // namespace keyward::core
