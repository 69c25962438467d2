#pragma once

#include <gatepass/schema/primitives.hpp>

#include <cstddef>
#include <optional>

namespace gatepass::crypto {

inline constexpr size_t kSealNonceSize = 12;
inline constexpr size_t kSealTagSize = 16;

/// AES-256-GCM. Output layout is nonce || ciphertext || tag with a fresh
/// random nonce per call.
gatepass::schema::bytes_t seal(const gatepass::schema::secret_key_t& key,
                               const gatepass::schema::bytes_view_t& plaintext);

/// std::nullopt when the input is truncated or fails authentication.
std::optional<gatepass::schema::bytes_t> unseal(
    const gatepass::schema::secret_key_t& key,
    const gatepass::schema::bytes_view_t& sealed);

}  // namespace gatepass::crypto
