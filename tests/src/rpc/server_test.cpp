#include <gtest/gtest.h>
#include <gatepass/admin/service.hpp>
#include <gatepass/ingest/scan_submitter.hpp>
#include <gatepass/ingest/upload_adapter.hpp>
#include <gatepass/rpc/server.hpp>
#include <gatepass/testing/ingest_fakes.hpp>
#include <gatepass/testing/verification_fixture.hpp>

#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr auto kToken = std::string_view{"front-desk-token"};
constexpr auto kCameraCheckpoint = std::string_view{"local-camera"};

/// In-process server over a fresh database; clients talk to it through
/// Server::InProcessChannel.
class server_harness final {
 public:
  explicit server_harness(const std::string_view db_prefix,
                          gatepass::ingest::qr_decoder* decoder = nullptr)
      : fixture_{db_prefix},
        admin_{fixture_.credentials(), fixture_.audit(),
               fixture_.clock().as_clock(), gatepass::testing::make_hash(0x51),
               gatepass::admin::service_options{.max_ttl_seconds = 3600}},
        submitter_{fixture_.engine(), fixture_.clock().as_clock(), decoder},
        uploads_{submitter_, {std::string{kCameraCheckpoint}}},
        listener_{admin_, uploads_, std::string{kToken}} {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&listener_);
    server_ = builder.BuildAndStart();
    stub_ = gatepass::v1::Checkpoint::NewStub(
        server_->InProcessChannel(grpc::ChannelArguments{}));
  }

  ~server_harness() { server_->Shutdown(); }

  server_harness(const server_harness&) = delete;
  server_harness& operator=(const server_harness&) = delete;

  gatepass::testing::verification_fixture& fixture() { return fixture_; }
  gatepass::v1::Checkpoint::Stub& stub() { return *stub_; }

  static void authorize(grpc::ClientContext& context,
                        const std::string_view operator_id = "desk-1") {
    context.AddMetadata("authorization", "Bearer " + std::string{kToken});
    context.AddMetadata("x-operator-id", std::string{operator_id});
  }

  gatepass::v1::IssueResponse issue(const std::string& subject) {
    auto context = grpc::ClientContext{};
    authorize(context);
    auto request = gatepass::v1::IssueRequest{};
    request.set_subject(subject);
    request.set_ttl_seconds(600);
    auto response = gatepass::v1::IssueResponse{};
    auto status = stub_->Issue(&context, request, &response);
    EXPECT_TRUE(status.ok()) << status.error_message();
    return response;
  }

  grpc::Status scan(const std::string& payload,
                    gatepass::v1::ScanResponse& response,
                    const std::string& checkpoint_id = "gate-a") {
    auto context = grpc::ClientContext{};
    auto request = gatepass::v1::ScanRequest{};
    request.set_payload(payload);
    request.set_checkpoint_id(checkpoint_id);
    return stub_->Scan(&context, request, &response);
  }

 private:
  gatepass::testing::verification_fixture fixture_;
  gatepass::admin::service admin_;
  gatepass::ingest::engine_submitter submitter_;
  gatepass::ingest::upload_adapter uploads_;
  gatepass::rpc::listener listener_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<gatepass::v1::Checkpoint::Stub> stub_;
};

gatepass::v1::ScanRequest make_image_request(const uint8_t index) {
  auto request = gatepass::v1::ScanRequest{};
  auto* image = request.mutable_image();
  image->set_format(gatepass::v1::IMAGE_FORMAT_GRAY8);
  image->set_width(1);
  image->set_height(1);
  image->set_data(std::string(1, static_cast<char>(index)));
  request.set_checkpoint_id("kiosk");
  return request;
}

}  // namespace

TEST(rpc_listener, issue_then_scan_admits_once) {
  auto harness = server_harness{"gatepass_rpc_scan"};
  auto issued = harness.issue("Alice");
  ASSERT_EQ(issued.credential_id().size(), 64u);
  EXPECT_EQ(issued.expires_at_ms() - issued.issued_at_ms(), 600'000u);

  auto first = gatepass::v1::ScanResponse{};
  ASSERT_TRUE(harness.scan(issued.payload(), first).ok());
  EXPECT_EQ(first.outcome(), gatepass::v1::OUTCOME_ADMITTED);
  EXPECT_EQ(first.reason(), gatepass::v1::DENIAL_REASON_UNSPECIFIED);
  ASSERT_TRUE(first.has_subject());
  EXPECT_EQ(first.subject(), "Alice");

  auto second = gatepass::v1::ScanResponse{};
  ASSERT_TRUE(harness.scan(issued.payload(), second).ok());
  EXPECT_EQ(second.outcome(), gatepass::v1::OUTCOME_DENIED);
  EXPECT_EQ(second.reason(), gatepass::v1::DENIAL_REASON_DUPLICATE_SCAN);
  EXPECT_FALSE(second.has_subject());
  EXPECT_GT(second.attempt_sequence(), first.attempt_sequence());
}

TEST(rpc_listener, scan_denials_carry_the_reason) {
  auto harness = server_harness{"gatepass_rpc_denials"};
  auto response = gatepass::v1::ScanResponse{};
  ASSERT_TRUE(harness.scan("not a credential", response).ok());
  EXPECT_EQ(response.outcome(), gatepass::v1::OUTCOME_DENIED);
  EXPECT_EQ(response.reason(), gatepass::v1::DENIAL_REASON_MALFORMED);
}

TEST(rpc_listener, scan_rejects_bad_checkpoint_ids_unrecorded) {
  auto harness = server_harness{"gatepass_rpc_checkpoint"};
  auto issued = harness.issue("alice");

  auto rejected = std::vector<std::string>{
      "",
      std::string(65, 'k'),
      "gate\nINFO forged line",
      "front desk",
      std::string{kCameraCheckpoint}};
  for (const auto& checkpoint_id : rejected) {
    auto response = gatepass::v1::ScanResponse{};
    auto status = harness.scan(issued.payload(), response, checkpoint_id);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT)
        << checkpoint_id.size();
  }
  EXPECT_TRUE(harness.fixture().audit().list(std::nullopt, 0).empty());

  auto response = gatepass::v1::ScanResponse{};
  ASSERT_TRUE(
      harness.scan(issued.payload(), response, std::string(64, 'k')).ok());
  EXPECT_EQ(response.outcome(), gatepass::v1::OUTCOME_ADMITTED);
}

TEST(rpc_listener, scan_requires_content) {
  auto harness = server_harness{"gatepass_rpc_empty_scan"};
  auto context = grpc::ClientContext{};
  auto response = gatepass::v1::ScanResponse{};
  auto status = harness.stub().Scan(&context, gatepass::v1::ScanRequest{},
                                    &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(rpc_listener, image_scan_without_decoder_fails_precondition) {
  auto harness = server_harness{"gatepass_rpc_no_decoder"};
  auto context = grpc::ClientContext{};
  auto response = gatepass::v1::ScanResponse{};
  auto status =
      harness.stub().Scan(&context, make_image_request(1), &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(harness.fixture().audit().list(std::nullopt, 0).size(), 0u);
}

TEST(rpc_listener, image_scan_is_decoded_server_side) {
  auto decoder = gatepass::testing::scripted_decoder{
      std::vector<std::string>{"", "not-a-credential"}};
  auto harness = server_harness{"gatepass_rpc_image", &decoder};

  {
    auto context = grpc::ClientContext{};
    auto response = gatepass::v1::ScanResponse{};
    auto status =
        harness.stub().Scan(&context, make_image_request(0), &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    auto context = grpc::ClientContext{};
    auto response = gatepass::v1::ScanResponse{};
    auto status =
        harness.stub().Scan(&context, make_image_request(1), &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.reason(), gatepass::v1::DENIAL_REASON_MALFORMED);
  }
  {
    auto context = grpc::ClientContext{};
    auto response = gatepass::v1::ScanResponse{};
    auto request = make_image_request(1);
    request.mutable_image()->set_format(gatepass::v1::IMAGE_FORMAT_UNSPECIFIED);
    auto status = harness.stub().Scan(&context, request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  }

  auto attempts = harness.fixture().audit().list(std::nullopt, 0);
  ASSERT_EQ(attempts.size(), 1u);
  EXPECT_EQ(attempts[0].checkpoint_id, "kiosk");
}

TEST(rpc_listener, admin_calls_need_the_bearer_token) {
  auto harness = server_harness{"gatepass_rpc_auth"};

  auto anonymous = grpc::ClientContext{};
  auto response = gatepass::v1::ListCredentialsResponse{};
  auto status = harness.stub().ListCredentials(
      &anonymous, gatepass::v1::ListCredentialsRequest{}, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);

  auto wrong = grpc::ClientContext{};
  wrong.AddMetadata("authorization", "Bearer guess");
  auto issue = gatepass::v1::IssueRequest{};
  issue.set_subject("mallory");
  issue.set_ttl_seconds(60);
  auto issued = gatepass::v1::IssueResponse{};
  status = harness.stub().Issue(&wrong, issue, &issued);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
  EXPECT_TRUE(harness.fixture().credentials().list(0).empty());
}

TEST(rpc_listener, issue_rejects_invalid_input) {
  auto harness = server_harness{"gatepass_rpc_invalid"};
  auto context = grpc::ClientContext{};
  server_harness::authorize(context);
  auto request = gatepass::v1::IssueRequest{};
  request.set_subject("alice");
  request.set_ttl_seconds(7200);
  auto response = gatepass::v1::IssueResponse{};
  auto status = harness.stub().Issue(&context, request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(status.error_message(), "invalid_ttl");
}

TEST(rpc_listener, get_credential_opens_contact_and_payload) {
  auto harness = server_harness{"gatepass_rpc_get"};
  auto issued = gatepass::v1::IssueResponse{};
  {
    auto context = grpc::ClientContext{};
    server_harness::authorize(context, "desk-9");
    auto request = gatepass::v1::IssueRequest{};
    request.set_subject("Bob");
    request.set_ttl_seconds(60);
    request.set_phone("5551234567");
    request.set_purpose("Delivery");
    ASSERT_TRUE(harness.stub().Issue(&context, request, &issued).ok());
  }

  auto context = grpc::ClientContext{};
  server_harness::authorize(context);
  auto request = gatepass::v1::GetCredentialRequest{};
  request.set_credential_id(issued.credential_id());
  request.set_include_payload(true);
  auto response = gatepass::v1::GetCredentialResponse{};
  ASSERT_TRUE(harness.stub().GetCredential(&context, request, &response).ok());
  const auto& credential = response.credential();
  EXPECT_EQ(credential.subject(), "Bob");
  EXPECT_EQ(credential.status(), gatepass::v1::CREDENTIAL_STATUS_UNUSED);
  EXPECT_EQ(credential.issued_by(), "desk-9");
  EXPECT_EQ(credential.phone(), "5551234567");
  EXPECT_EQ(credential.purpose(), "Delivery");
  EXPECT_FALSE(credential.contact_unreadable());
  EXPECT_EQ(response.payload(), issued.payload());
}

TEST(rpc_listener, credential_ids_are_validated_and_looked_up) {
  auto harness = server_harness{"gatepass_rpc_ids"};

  {
    auto context = grpc::ClientContext{};
    server_harness::authorize(context);
    auto request = gatepass::v1::RevokeRequest{};
    request.set_credential_id("xyz");
    auto response = gatepass::v1::RevokeResponse{};
    auto status = harness.stub().Revoke(&context, request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    auto context = grpc::ClientContext{};
    server_harness::authorize(context);
    auto request = gatepass::v1::RevokeRequest{};
    request.set_credential_id(std::string(64, 'a'));
    auto response = gatepass::v1::RevokeResponse{};
    ASSERT_TRUE(harness.stub().Revoke(&context, request, &response).ok());
    EXPECT_EQ(response.status(), gatepass::v1::REVOKE_STATUS_NOT_FOUND);
  }
  {
    auto context = grpc::ClientContext{};
    server_harness::authorize(context);
    auto request = gatepass::v1::GetCredentialRequest{};
    request.set_credential_id(std::string(64, 'a'));
    auto response = gatepass::v1::GetCredentialResponse{};
    auto status = harness.stub().GetCredential(&context, request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
  }
}

TEST(rpc_listener, revoke_and_check_out) {
  auto harness = server_harness{"gatepass_rpc_lifecycle"};
  auto revoked = harness.issue("carol");
  auto visitor = harness.issue("dave");

  {
    auto context = grpc::ClientContext{};
    server_harness::authorize(context);
    auto request = gatepass::v1::RevokeRequest{};
    request.set_credential_id(revoked.credential_id());
    auto response = gatepass::v1::RevokeResponse{};
    ASSERT_TRUE(harness.stub().Revoke(&context, request, &response).ok());
    EXPECT_EQ(response.status(), gatepass::v1::REVOKE_STATUS_REVOKED);
  }
  auto denied = gatepass::v1::ScanResponse{};
  ASSERT_TRUE(harness.scan(revoked.payload(), denied).ok());
  EXPECT_EQ(denied.reason(), gatepass::v1::DENIAL_REASON_REVOKED);

  auto admitted = gatepass::v1::ScanResponse{};
  ASSERT_TRUE(harness.scan(visitor.payload(), admitted).ok());
  ASSERT_EQ(admitted.outcome(), gatepass::v1::OUTCOME_ADMITTED);
  {
    auto context = grpc::ClientContext{};
    server_harness::authorize(context);
    auto request = gatepass::v1::CheckOutRequest{};
    request.set_credential_id(visitor.credential_id());
    auto response = gatepass::v1::CheckOutResponse{};
    ASSERT_TRUE(harness.stub().CheckOut(&context, request, &response).ok());
    EXPECT_EQ(response.status(), gatepass::v1::CHECK_OUT_STATUS_CHECKED_OUT);
  }

  auto context = grpc::ClientContext{};
  server_harness::authorize(context);
  auto request = gatepass::v1::ListAttemptsRequest{};
  request.set_limit(1);
  auto response = gatepass::v1::ListAttemptsResponse{};
  ASSERT_TRUE(harness.stub().ListAttempts(&context, request, &response).ok());
  ASSERT_EQ(response.attempts_size(), 1);
  EXPECT_EQ(response.attempts(0).outcome(), gatepass::v1::OUTCOME_ADMITTED);
  EXPECT_EQ(response.attempts(0).credential_id(), visitor.credential_id());
  EXPECT_EQ(response.attempts(0).source(),
            gatepass::v1::SCAN_SOURCE_MOBILE_UPLOAD);
  EXPECT_EQ(response.attempts(0).payload_hash().size(), 64u);
}

TEST(rpc_listener, list_credentials_newest_first) {
  auto harness = server_harness{"gatepass_rpc_list"};
  harness.issue("first");
  harness.fixture().clock().advance(1);
  harness.issue("second");

  auto context = grpc::ClientContext{};
  server_harness::authorize(context);
  auto response = gatepass::v1::ListCredentialsResponse{};
  ASSERT_TRUE(harness.stub()
                  .ListCredentials(&context,
                                   gatepass::v1::ListCredentialsRequest{},
                                   &response)
                  .ok());
  ASSERT_EQ(response.credentials_size(), 2);
  EXPECT_EQ(response.credentials(0).subject(), "second");
  EXPECT_EQ(response.credentials(1).subject(), "first");
}

TEST(rpc_listener, store_outage_is_unavailable) {
  auto harness = server_harness{"gatepass_rpc_outage"};
  auto issued = harness.issue("erin");
  harness.fixture().take_storage_offline();

  auto scan = gatepass::v1::ScanResponse{};
  EXPECT_EQ(harness.scan(issued.payload(), scan).error_code(),
            grpc::StatusCode::UNAVAILABLE);

  auto context = grpc::ClientContext{};
  server_harness::authorize(context);
  auto response = gatepass::v1::ListCredentialsResponse{};
  auto status = harness.stub().ListCredentials(
      &context, gatepass::v1::ListCredentialsRequest{}, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
}
