#pragma once

#include <gatepass/schema/primitives.hpp>
#include <gatepass/schema/scan_source.hpp>

#include <string>

namespace gatepass::verification {

/// Where and when a candidate payload was captured. `timestamp` is taken from
/// the server clock by the ingestion adapter, never from the client. It stamps
/// undecodable attempts only; expiry is judged on the store's own clock.
struct scan_metadata final {
  gatepass::schema::scan_source_t source{
      gatepass::schema::scan_source_t::mobile_upload};
  gatepass::schema::timestamp_milliseconds_t timestamp{};
  std::string checkpoint_id;
};

}  // namespace gatepass::verification
