#pragma once

#include <gatepass/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace gatepass::crypto {

/// RFC 4648 section 5 alphabet, padding stripped.
std::string base64url_encode(const gatepass::schema::bytes_view_t& bytes);

/// Rejects padding, characters outside the url alphabet and non-canonical
/// trailing bits, so every byte string has exactly one accepted text form.
std::optional<gatepass::schema::bytes_t> base64url_decode(
    std::string_view text);

}  // namespace gatepass::crypto
