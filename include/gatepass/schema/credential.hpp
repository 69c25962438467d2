#pragma once

#include <gatepass/schema/credential_status.hpp>
#include <gatepass/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: credential.
// Check-in right issued to one visitor; consumed by at most one admitted scan.
namespace gatepass::schema {

template <uint16_t Version>
struct credential;

template <>
struct credential<1> final {
  uint16_t version{1};
  credential_id_t id{};
  std::string subject;
  timestamp_milliseconds_t issued_at{};
  timestamp_milliseconds_t expires_at{};
  credential_status_t status{credential_status_t::unused};
  integrity_tag_t tag{};
  std::string issued_by;
  // AES-256-GCM sealed contact fields; never leave the admin surface.
  std::optional<bytes_t> sealed_phone;
  std::optional<bytes_t> sealed_purpose;
  std::optional<timestamp_milliseconds_t> consumed_at;
  std::optional<std::string> consumed_by;
  std::optional<timestamp_milliseconds_t> revoked_at;
  std::optional<timestamp_milliseconds_t> checked_out_at;
};

using credential_t = credential<1>;

}  // namespace gatepass::schema
