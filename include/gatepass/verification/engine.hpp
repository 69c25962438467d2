#pragma once

#include <gatepass/audit/audit_log.hpp>
#include <gatepass/codec/token_codec.hpp>
#include <gatepass/schema/consume_result.hpp>
#include <gatepass/schema/decode_error.hpp>
#include <gatepass/schema/denial_reason.hpp>
#include <gatepass/store/credential_store.hpp>
#include <gatepass/verification/scan_metadata.hpp>
#include <gatepass/verification/verification_result.hpp>

#include <optional>
#include <string_view>

namespace gatepass::verification {

/// Admit/deny state machine shared by every ingestion path.
///
/// Each call writes exactly one scan attempt, except when the store is
/// unreachable: then nothing is recorded and the outcome is `unavailable`,
/// which the caller may retry.
class engine final {
 public:
  engine(const gatepass::codec::token_codec& codec,
         gatepass::store::credential_store& credentials,
         gatepass::audit::audit_log& audit);

  verification_result verify(std::string_view payload,
                             const scan_metadata& metadata);

 private:
  verification_result deny_undecodable(
      gatepass::schema::decode_error_t error,
      gatepass::schema::scan_attempt_t attempt);

  const gatepass::codec::token_codec& codec_;
  gatepass::store::credential_store& credentials_;
  gatepass::audit::audit_log& audit_;
};

gatepass::schema::denial_reason_t to_denial_reason(
    gatepass::schema::decode_error_t error);

/// std::nullopt for consume_result_t::consumed.
std::optional<gatepass::schema::denial_reason_t> to_denial_reason(
    gatepass::schema::consume_result_t result);

}  // namespace gatepass::verification
