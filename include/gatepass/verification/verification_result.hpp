#pragma once

#include <gatepass/schema/denial_reason.hpp>
#include <gatepass/schema/primitives.hpp>
#include <gatepass/schema/scan_outcome.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace gatepass::verification {

struct verification_result final {
  gatepass::schema::scan_outcome_t outcome{
      gatepass::schema::scan_outcome_t::denied};
  std::optional<gatepass::schema::denial_reason_t> reason;
  std::optional<gatepass::schema::credential_id_t> credential_id;
  /// Visitor display name, only on admission.
  std::optional<std::string> subject;
  std::optional<uint64_t> attempt_sequence;
};

}  // namespace gatepass::verification
