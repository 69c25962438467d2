#pragma once

#include <gatepass/schema/primitives.hpp>

#include <cstddef>

namespace gatepass::crypto {

/// Cryptographically secure random bytes from the OpenSSL DRBG.
gatepass::schema::bytes_t random_bytes(size_t size);

gatepass::schema::hash32_t random_hash32();

/// Length-checked comparison that does not short-circuit on content.
bool constant_time_equal(const gatepass::schema::bytes_view_t& lhs,
                         const gatepass::schema::bytes_view_t& rhs);

}  // namespace gatepass::crypto
