#pragma once
#include <gatepass/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace gatepass::blake3 {

gatepass::schema::hash32_t hash(const std::string_view& str);
gatepass::schema::hash32_t hash(const gatepass::schema::bytes_view_t& bytes);

/// Keyed BLAKE3 (MAC mode).
gatepass::schema::hash32_t keyed_hash(
    const gatepass::schema::secret_key_t& key,
    const gatepass::schema::bytes_view_t& bytes);

/// Derive an independent 32-byte subkey from a root secret. The context
/// string must be hardcoded, globally unique and application specific.
gatepass::schema::secret_key_t derive_key(
    const std::string_view& context,
    const gatepass::schema::secret_key_t& root);

}  // namespace gatepass::blake3
