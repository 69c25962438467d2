#pragma once

#include <gatepass/schema/credential_reference.hpp>
#include <gatepass/schema/decode_error.hpp>
#include <gatepass/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace gatepass::codec {

inline constexpr auto kPayloadPrefix = std::string_view{"GP1."};
inline constexpr uint8_t kTokenVersion = 1;
/// version || id || expires_at (big endian) || tag
inline constexpr size_t kTokenBodySize = 1 + 32 + 8 + 32;

using decode_result_t = std::variant<gatepass::schema::credential_reference_t,
                                     gatepass::schema::decode_error_t>;

/// Turns credential references into QR payload text and back.
///
/// Decoding is pure: it never consults the credential store, so a valid tag
/// only proves the payload was minted by this server, not that the
/// credential is still usable.
class token_codec final {
 public:
  /// `tag_key` is the derived integrity key, not the root secret.
  explicit token_codec(const gatepass::schema::secret_key_t& tag_key);

  static token_codec from_root_secret(
      const gatepass::schema::secret_key_t& root_secret);

  gatepass::schema::integrity_tag_t tag(
      const gatepass::schema::credential_reference_t& reference) const;

  std::string encode(
      const gatepass::schema::credential_reference_t& reference) const;

  decode_result_t decode(std::string_view payload) const;

 private:
  gatepass::schema::secret_key_t tag_key_;
};

}  // namespace gatepass::codec
