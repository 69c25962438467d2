#pragma once

#include <gatepass/v1/checkpoint.grpc.pb.h>
#include <gatepass/admin/service.hpp>
#include <gatepass/ingest/upload_adapter.hpp>

#include <cstdint>
#include <string>

namespace gatepass::rpc {

inline constexpr uint32_t kDefaultListLimit = 100;
inline constexpr uint32_t kMaxListLimit = 1000;

/// Callback listener for gatepass.v1.Checkpoint.
///
/// - Scan: visitor facing, no authentication; routes through the upload
///   adapter and returns only outcome, reason and the admitted subject.
/// - Everything else: bearer token required, an admin_context is built per
///   call and handed to the admin service.
/// Store outages surface as UNAVAILABLE so clients may retry.
struct listener final : public gatepass::v1::Checkpoint::CallbackService {
  listener(gatepass::admin::service& admin,
           gatepass::ingest::upload_adapter& uploads,
           std::string admin_token);

  virtual grpc::ServerUnaryReactor* Issue(
      grpc::CallbackServerContext* context,
      const gatepass::v1::IssueRequest* request,
      gatepass::v1::IssueResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Revoke(
      grpc::CallbackServerContext* context,
      const gatepass::v1::RevokeRequest* request,
      gatepass::v1::RevokeResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CheckOut(
      grpc::CallbackServerContext* context,
      const gatepass::v1::CheckOutRequest* request,
      gatepass::v1::CheckOutResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetCredential(
      grpc::CallbackServerContext* context,
      const gatepass::v1::GetCredentialRequest* request,
      gatepass::v1::GetCredentialResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListCredentials(
      grpc::CallbackServerContext* context,
      const gatepass::v1::ListCredentialsRequest* request,
      gatepass::v1::ListCredentialsResponse* response) override final;

  /// Evaluate one payload or image. No admin token needed.
  virtual grpc::ServerUnaryReactor* Scan(
      grpc::CallbackServerContext* context,
      const gatepass::v1::ScanRequest* request,
      gatepass::v1::ScanResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListAttempts(
      grpc::CallbackServerContext* context,
      const gatepass::v1::ListAttemptsRequest* request,
      gatepass::v1::ListAttemptsResponse* response) override final;

 private:
  gatepass::admin::service& admin_;
  gatepass::ingest::upload_adapter& uploads_;
  std::string admin_token_;
};

}  // namespace gatepass::rpc
