#pragma once

#include <gatepass/schema/denial_reason.hpp>
#include <gatepass/schema/primitives.hpp>
#include <gatepass/schema/scan_outcome.hpp>
#include <gatepass/schema/scan_source.hpp>

#include <optional>
#include <string>

// Schema type: scan attempt.
// Immutable audit record of one verification evaluation.
namespace gatepass::schema {

template <uint16_t Version>
struct scan_attempt;

template <>
struct scan_attempt<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::optional<credential_id_t> credential_id;
  scan_source_t source{scan_source_t::mobile_upload};
  timestamp_milliseconds_t recorded_at{};
  scan_outcome_t outcome{scan_outcome_t::denied};
  std::optional<denial_reason_t> reason;
  hash32_t payload_hash{};
  std::string checkpoint_id;
};

using scan_attempt_t = scan_attempt<1>;

}  // namespace gatepass::schema
