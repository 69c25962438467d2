#pragma once

#include <gatepass/schema/primitives.hpp>

namespace gatepass::schema {

/// What a QR payload carries once its integrity tag has been verified.
struct credential_reference final {
  uint8_t version{1};
  credential_id_t id{};
  timestamp_milliseconds_t expires_at{};
};

using credential_reference_t = credential_reference;

}  // namespace gatepass::schema
