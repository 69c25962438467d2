#include <spdlog/spdlog.h>
#include <gatepass/rpc/auth.hpp>
#include <gatepass/rpc/server.hpp>
#include <gatepass/storage/storage.hpp>
#include <algorithm>
#include <optional>
#include <string>
#include <utility>

using namespace gatepass::rpc;
using namespace gatepass::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

grpc::ServerUnaryReactor* finish_unauthenticated(
    grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status{grpc::StatusCode::UNAUTHENTICATED,
                                      "admin bearer token required"});
}

grpc::ServerUnaryReactor* finish_unavailable(
    grpc::CallbackServerContext* context,
    const gatepass::storage::storage_error& error) {
  spdlog::error("Request failed on storage: {}", error.what());
  return finish(context, grpc::Status{grpc::StatusCode::UNAVAILABLE,
                                      "credential store unavailable"});
}

std::optional<credential_id_t> parse_credential_id(const std::string& text) {
  return try_make_hash32(text);
}

size_t effective_limit(const uint32_t requested) {
  if (requested == 0) {
    return kDefaultListLimit;
  }
  return std::min(requested, kMaxListLimit);
}

gatepass::v1::CredentialStatus map_status(const credential_status_t status) {
  switch (status) {
    case credential_status_t::unused:
      return gatepass::v1::CREDENTIAL_STATUS_UNUSED;
    case credential_status_t::consumed:
      return gatepass::v1::CREDENTIAL_STATUS_CONSUMED;
    case credential_status_t::revoked:
      return gatepass::v1::CREDENTIAL_STATUS_REVOKED;
  }
  return gatepass::v1::CREDENTIAL_STATUS_UNSPECIFIED;
}

gatepass::v1::Outcome map_outcome(const scan_outcome_t outcome) {
  switch (outcome) {
    case scan_outcome_t::admitted:
      return gatepass::v1::OUTCOME_ADMITTED;
    case scan_outcome_t::denied:
      return gatepass::v1::OUTCOME_DENIED;
    case scan_outcome_t::unavailable:
      return gatepass::v1::OUTCOME_UNAVAILABLE;
  }
  return gatepass::v1::OUTCOME_UNSPECIFIED;
}

gatepass::v1::DenialReason map_reason(
    const std::optional<denial_reason_t>& reason) {
  if (!reason) {
    return gatepass::v1::DENIAL_REASON_UNSPECIFIED;
  }
  // Wire values mirror the stored codes.
  return static_cast<gatepass::v1::DenialReason>(
      static_cast<uint16_t>(*reason));
}

gatepass::v1::ScanSource map_source(const scan_source_t source) {
  switch (source) {
    case scan_source_t::local_camera:
      return gatepass::v1::SCAN_SOURCE_LOCAL_CAMERA;
    case scan_source_t::mobile_upload:
      return gatepass::v1::SCAN_SOURCE_MOBILE_UPLOAD;
  }
  return gatepass::v1::SCAN_SOURCE_UNSPECIFIED;
}

gatepass::v1::RevokeStatus map_revoke(const revoke_result_t result) {
  switch (result) {
    case revoke_result_t::revoked:
      return gatepass::v1::REVOKE_STATUS_REVOKED;
    case revoke_result_t::already_consumed:
      return gatepass::v1::REVOKE_STATUS_ALREADY_CONSUMED;
    case revoke_result_t::not_found:
      return gatepass::v1::REVOKE_STATUS_NOT_FOUND;
  }
  return gatepass::v1::REVOKE_STATUS_UNSPECIFIED;
}

gatepass::v1::CheckOutStatus map_check_out(const check_out_result_t result) {
  switch (result) {
    case check_out_result_t::checked_out:
      return gatepass::v1::CHECK_OUT_STATUS_CHECKED_OUT;
    case check_out_result_t::already_checked_out:
      return gatepass::v1::CHECK_OUT_STATUS_ALREADY_CHECKED_OUT;
    case check_out_result_t::not_checked_in:
      return gatepass::v1::CHECK_OUT_STATUS_NOT_CHECKED_IN;
    case check_out_result_t::not_found:
      return gatepass::v1::CHECK_OUT_STATUS_NOT_FOUND;
  }
  return gatepass::v1::CHECK_OUT_STATUS_UNSPECIFIED;
}

std::optional<gatepass::ingest::pixel_format_t> map_image_format(
    const gatepass::v1::ImageFormat format) {
  switch (format) {
    case gatepass::v1::IMAGE_FORMAT_ENCODED:
      return gatepass::ingest::pixel_format_t::encoded;
    case gatepass::v1::IMAGE_FORMAT_GRAY8:
      return gatepass::ingest::pixel_format_t::gray8;
    case gatepass::v1::IMAGE_FORMAT_BGR24:
      return gatepass::ingest::pixel_format_t::bgr24;
    default:
      return std::nullopt;
  }
}

void fill_credential(const gatepass::admin::credential_view& view,
                     gatepass::v1::Credential* out) {
  const auto& credential = view.credential;
  out->set_credential_id(to_hex(credential.id));
  out->set_subject(credential.subject);
  out->set_status(map_status(credential.status));
  out->set_issued_at_ms(credential.issued_at);
  out->set_expires_at_ms(credential.expires_at);
  out->set_issued_by(credential.issued_by);
  if (view.phone) {
    out->set_phone(*view.phone);
  }
  if (view.purpose) {
    out->set_purpose(*view.purpose);
  }
  if (credential.consumed_at) {
    out->set_consumed_at_ms(*credential.consumed_at);
  }
  if (credential.consumed_by) {
    out->set_consumed_by(*credential.consumed_by);
  }
  if (credential.revoked_at) {
    out->set_revoked_at_ms(*credential.revoked_at);
  }
  if (credential.checked_out_at) {
    out->set_checked_out_at_ms(*credential.checked_out_at);
  }
  out->set_contact_unreadable(view.contact_unreadable);
}

void fill_attempt(const scan_attempt_t& attempt,
                  gatepass::v1::ScanAttempt* out) {
  out->set_sequence(attempt.sequence);
  if (attempt.credential_id) {
    out->set_credential_id(to_hex(*attempt.credential_id));
  }
  out->set_source(map_source(attempt.source));
  out->set_recorded_at_ms(attempt.recorded_at);
  out->set_outcome(map_outcome(attempt.outcome));
  out->set_reason(map_reason(attempt.reason));
  out->set_payload_hash(to_hex(attempt.payload_hash));
  out->set_checkpoint_id(attempt.checkpoint_id);
}

}  // namespace

listener::listener(gatepass::admin::service& admin,
                   gatepass::ingest::upload_adapter& uploads,
                   std::string admin_token)
    : admin_{admin}, uploads_{uploads}, admin_token_{std::move(admin_token)} {}

grpc::ServerUnaryReactor* listener::Issue(
    grpc::CallbackServerContext* context,
    const gatepass::v1::IssueRequest* request,
    gatepass::v1::IssueResponse* response) {
  auto admin_context =
      authenticate_admin(context->client_metadata(), admin_token_);
  if (!admin_context) {
    return finish_unauthenticated(context);
  }

  auto parameters = gatepass::admin::issue_parameters{};
  parameters.subject = request->subject();
  parameters.ttl_seconds = request->ttl_seconds();
  if (request->has_phone()) {
    parameters.phone = request->phone();
  }
  if (request->has_purpose()) {
    parameters.purpose = request->purpose();
  }

  try {
    auto result = admin_.issue(*admin_context, parameters);
    if (const auto* error = std::get_if<gatepass::admin::admin_error_t>(&result)) {
      return finish(context,
                    grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                 std::string{gatepass::admin::to_string(*error)}});
    }
    const auto& issued = std::get<gatepass::store::issued_credential>(result);
    response->set_credential_id(to_hex(issued.credential.id));
    response->set_payload(issued.payload);
    response->set_issued_at_ms(issued.credential.issued_at);
    response->set_expires_at_ms(issued.credential.expires_at);
  } catch (const gatepass::storage::storage_error& e) {
    return finish_unavailable(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Revoke(
    grpc::CallbackServerContext* context,
    const gatepass::v1::RevokeRequest* request,
    gatepass::v1::RevokeResponse* response) {
  auto admin_context =
      authenticate_admin(context->client_metadata(), admin_token_);
  if (!admin_context) {
    return finish_unauthenticated(context);
  }
  auto id = parse_credential_id(request->credential_id());
  if (!id) {
    return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                        "credential_id must be 64 hex chars"});
  }
  try {
    response->set_status(map_revoke(admin_.revoke(*admin_context, *id)));
  } catch (const gatepass::storage::storage_error& e) {
    return finish_unavailable(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckOut(
    grpc::CallbackServerContext* context,
    const gatepass::v1::CheckOutRequest* request,
    gatepass::v1::CheckOutResponse* response) {
  auto admin_context =
      authenticate_admin(context->client_metadata(), admin_token_);
  if (!admin_context) {
    return finish_unauthenticated(context);
  }
  auto id = parse_credential_id(request->credential_id());
  if (!id) {
    return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                        "credential_id must be 64 hex chars"});
  }
  try {
    response->set_status(map_check_out(admin_.check_out(*admin_context, *id)));
  } catch (const gatepass::storage::storage_error& e) {
    return finish_unavailable(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetCredential(
    grpc::CallbackServerContext* context,
    const gatepass::v1::GetCredentialRequest* request,
    gatepass::v1::GetCredentialResponse* response) {
  auto admin_context =
      authenticate_admin(context->client_metadata(), admin_token_);
  if (!admin_context) {
    return finish_unauthenticated(context);
  }
  auto id = parse_credential_id(request->credential_id());
  if (!id) {
    return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                        "credential_id must be 64 hex chars"});
  }
  try {
    auto view = admin_.get_credential(*admin_context, *id);
    if (!view) {
      return finish(context, grpc::Status{grpc::StatusCode::NOT_FOUND,
                                          "credential not found"});
    }
    fill_credential(*view, response->mutable_credential());
    if (request->include_payload()) {
      if (auto payload = admin_.payload(*admin_context, *id)) {
        response->set_payload(*payload);
      }
    }
  } catch (const gatepass::storage::storage_error& e) {
    return finish_unavailable(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListCredentials(
    grpc::CallbackServerContext* context,
    const gatepass::v1::ListCredentialsRequest* request,
    gatepass::v1::ListCredentialsResponse* response) {
  auto admin_context =
      authenticate_admin(context->client_metadata(), admin_token_);
  if (!admin_context) {
    return finish_unauthenticated(context);
  }
  try {
    for (const auto& view : admin_.list_credentials(
             *admin_context, effective_limit(request->limit()))) {
      fill_credential(view, response->add_credentials());
    }
  } catch (const gatepass::storage::storage_error& e) {
    return finish_unavailable(context, e);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Scan(
    grpc::CallbackServerContext* context,
    const gatepass::v1::ScanRequest* request,
    gatepass::v1::ScanResponse* response) {
  auto result = gatepass::ingest::submit_result{};
  switch (request->content_case()) {
    case gatepass::v1::ScanRequest::kPayload:
      result = uploads_.submit_payload(request->payload(),
                                       request->checkpoint_id());
      break;
    case gatepass::v1::ScanRequest::kImage: {
      auto format = map_image_format(request->image().format());
      if (!format) {
        return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                            "unsupported image format"});
      }
      auto frame = gatepass::ingest::image{};
      frame.format = *format;
      frame.width = request->image().width();
      frame.height = request->image().height();
      frame.data = make_bytes(request->image().data());
      result = uploads_.submit_image(std::move(frame), request->checkpoint_id());
      break;
    }
    default:
      return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                          "payload or image required"});
  }

  switch (result.status) {
    case gatepass::ingest::submit_status_t::no_payload:
      return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                          "no QR code found in image"});
    case gatepass::ingest::submit_status_t::invalid_checkpoint:
      return finish(context, grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                          "invalid checkpoint_id"});
    case gatepass::ingest::submit_status_t::decoder_unavailable:
      return finish(context,
                    grpc::Status{grpc::StatusCode::FAILED_PRECONDITION,
                                 "server-side image decoding is not available"});
    case gatepass::ingest::submit_status_t::evaluated:
      break;
  }

  const auto& verification = *result.verification;
  if (verification.outcome == scan_outcome_t::unavailable) {
    return finish(context, grpc::Status{grpc::StatusCode::UNAVAILABLE,
                                        "verification unavailable, retry"});
  }
  response->set_outcome(map_outcome(verification.outcome));
  response->set_reason(map_reason(verification.reason));
  if (verification.subject) {
    response->set_subject(*verification.subject);
  }
  if (verification.attempt_sequence) {
    response->set_attempt_sequence(*verification.attempt_sequence);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListAttempts(
    grpc::CallbackServerContext* context,
    const gatepass::v1::ListAttemptsRequest* request,
    gatepass::v1::ListAttemptsResponse* response) {
  auto admin_context =
      authenticate_admin(context->client_metadata(), admin_token_);
  if (!admin_context) {
    return finish_unauthenticated(context);
  }
  auto since = std::optional<timestamp_milliseconds_t>{};
  if (request->has_since_ms()) {
    since = request->since_ms();
  }
  try {
    for (const auto& attempt : admin_.list_attempts(
             *admin_context, since, effective_limit(request->limit()))) {
      fill_attempt(attempt, response->add_attempts());
    }
  } catch (const gatepass::storage::storage_error& e) {
    return finish_unavailable(context, e);
  }
  return finish_ok(context);
}
