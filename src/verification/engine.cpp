#include <gatepass/blake3/hash.hpp>
#include <gatepass/verification/engine.hpp>

#include <spdlog/spdlog.h>

#include <variant>

namespace gatepass::verification {

gatepass::schema::denial_reason_t to_denial_reason(
    const gatepass::schema::decode_error_t error) {
  switch (error) {
    case gatepass::schema::decode_error_t::malformed:
      return gatepass::schema::denial_reason_t::malformed;
    case gatepass::schema::decode_error_t::tag_mismatch:
      return gatepass::schema::denial_reason_t::tag_mismatch;
    case gatepass::schema::decode_error_t::unsupported:
      return gatepass::schema::denial_reason_t::unsupported;
  }
  return gatepass::schema::denial_reason_t::malformed;
}

std::optional<gatepass::schema::denial_reason_t> to_denial_reason(
    const gatepass::schema::consume_result_t result) {
  switch (result) {
    case gatepass::schema::consume_result_t::consumed:
      return std::nullopt;
    case gatepass::schema::consume_result_t::already_consumed:
      return gatepass::schema::denial_reason_t::duplicate_scan;
    case gatepass::schema::consume_result_t::revoked:
      return gatepass::schema::denial_reason_t::revoked;
    case gatepass::schema::consume_result_t::expired:
      return gatepass::schema::denial_reason_t::expired;
    case gatepass::schema::consume_result_t::not_found:
      return gatepass::schema::denial_reason_t::unknown_credential;
  }
  return gatepass::schema::denial_reason_t::unknown_credential;
}

engine::engine(const gatepass::codec::token_codec& codec,
               gatepass::store::credential_store& credentials,
               gatepass::audit::audit_log& audit)
    : codec_{codec}, credentials_{credentials}, audit_{audit} {}

verification_result engine::verify(const std::string_view payload,
                                   const scan_metadata& metadata) {
  auto attempt = gatepass::schema::scan_attempt_t{};
  attempt.source = metadata.source;
  attempt.recorded_at = metadata.timestamp;
  attempt.checkpoint_id = metadata.checkpoint_id;
  attempt.payload_hash = gatepass::blake3::hash(payload);

  try {
    auto decoded = codec_.decode(payload);
    if (const auto* error =
            std::get_if<gatepass::schema::decode_error_t>(&decoded)) {
      return deny_undecodable(*error, std::move(attempt));
    }
    const auto& reference =
        std::get<gatepass::schema::credential_reference_t>(decoded);
    attempt.credential_id = reference.id;

    auto outcome = credentials_.try_consume(
        reference.id, metadata.checkpoint_id,
        [&](const gatepass::store::consume_outcome& consumed) {
          auto reason = to_denial_reason(consumed.result);
          attempt.recorded_at = consumed.decided_at;
          attempt.outcome = reason ? gatepass::schema::scan_outcome_t::denied
                                   : gatepass::schema::scan_outcome_t::admitted;
          attempt.reason = reason;
          return std::vector<gatepass::storage::key_value_entry_t>{
              audit_.stage(attempt)};
        });

    auto result = verification_result{};
    result.outcome = attempt.outcome;
    result.reason = attempt.reason;
    result.credential_id = reference.id;
    result.attempt_sequence = attempt.sequence;
    if (outcome.result == gatepass::schema::consume_result_t::consumed &&
        outcome.credential) {
      result.subject = outcome.credential->subject;
      spdlog::info("Admitted credential {} at checkpoint '{}'",
                   gatepass::schema::to_hex(reference.id),
                   metadata.checkpoint_id);
    } else {
      spdlog::info("Denied credential {} at checkpoint '{}': {}",
                   gatepass::schema::to_hex(reference.id),
                   metadata.checkpoint_id,
                   gatepass::schema::to_string(*result.reason));
    }
    return result;
  } catch (const gatepass::storage::storage_error& e) {
    spdlog::error("Verification unavailable at checkpoint '{}': {}",
                  metadata.checkpoint_id, e.what());
    auto result = verification_result{};
    result.outcome = gatepass::schema::scan_outcome_t::unavailable;
    return result;
  }
}

verification_result engine::deny_undecodable(
    const gatepass::schema::decode_error_t error,
    gatepass::schema::scan_attempt_t attempt) {
  attempt.outcome = gatepass::schema::scan_outcome_t::denied;
  attempt.reason = to_denial_reason(error);
  auto recorded = audit_.append(std::move(attempt));
  spdlog::info("Denied undecodable payload at checkpoint '{}': {}",
               recorded.checkpoint_id, gatepass::schema::to_string(error));

  auto result = verification_result{};
  result.outcome = gatepass::schema::scan_outcome_t::denied;
  result.reason = recorded.reason;
  result.attempt_sequence = recorded.sequence;
  return result;
}

}  // namespace gatepass::verification
