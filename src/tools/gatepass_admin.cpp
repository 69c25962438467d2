#include <boost/program_options.hpp>
#include <grpcpp/grpcpp.h>
#include <gatepass/v1/checkpoint.grpc.pb.h>
#include <gatepass/common/critical.hpp>
#include <gatepass/crypto/key_file.hpp>
#include <gatepass/schema/primitives.hpp>
#ifdef GATEPASS_WITH_QRENCODE
#include <gatepass/render/qr_svg.hpp>
#endif

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout
      << "Usage: gatepass_admin <command> [options]\n\n"
      << "Commands:\n"
      << "  issue        issue a credential (--subject --ttl [--phone "
         "--purpose --svg])\n"
      << "  revoke       revoke a credential (--id)\n"
      << "  check-out    record a visitor leaving (--id)\n"
      << "  get          show one credential (--id [--svg])\n"
      << "  credentials  list credentials, newest first (--limit)\n"
      << "  attempts     list scan attempts, newest first (--since --limit)\n"
      << "  scan         submit a payload or image (--payload | --image)\n"
      << "  keygen       create a new root secret file (--secret-file)\n"
      << "  render       draw a payload as a QR code SVG (--payload --svg)\n\n"
      << options << '\n';
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    gatepass::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

std::string read_file(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    gatepass::common::critical("cannot read " + path);
  }
  auto contents = std::stringstream{};
  contents << input.rdbuf();
  return contents.str();
}

void write_svg([[maybe_unused]] const std::string& payload,
               [[maybe_unused]] const std::string& path) {
#ifdef GATEPASS_WITH_QRENCODE
  auto matrix = gatepass::render::make_qr_matrix(payload);
  if (!matrix) {
    gatepass::common::critical("payload does not fit in a QR code");
  }
  auto output = std::ofstream{path};
  output << gatepass::render::render_svg(*matrix);
  if (!output) {
    gatepass::common::critical("cannot write " + path);
  }
  std::cout << "qr: " << path << '\n';
#else
  gatepass::common::critical("built without libqrencode; --svg unavailable");
#endif
}

std::string_view outcome_name(const gatepass::v1::Outcome outcome) {
  switch (outcome) {
    case gatepass::v1::OUTCOME_ADMITTED:
      return "admitted";
    case gatepass::v1::OUTCOME_DENIED:
      return "denied";
    case gatepass::v1::OUTCOME_UNAVAILABLE:
      return "unavailable";
    default:
      return "unspecified";
  }
}

std::string_view reason_name(const gatepass::v1::DenialReason reason) {
  switch (reason) {
    case gatepass::v1::DENIAL_REASON_MALFORMED:
      return "malformed";
    case gatepass::v1::DENIAL_REASON_TAG_MISMATCH:
      return "tag_mismatch";
    case gatepass::v1::DENIAL_REASON_UNSUPPORTED:
      return "unsupported";
    case gatepass::v1::DENIAL_REASON_DUPLICATE_SCAN:
      return "duplicate_scan";
    case gatepass::v1::DENIAL_REASON_REVOKED:
      return "revoked";
    case gatepass::v1::DENIAL_REASON_EXPIRED:
      return "expired";
    case gatepass::v1::DENIAL_REASON_UNKNOWN_CREDENTIAL:
      return "unknown_credential";
    default:
      return "";
  }
}

void print_credential(const gatepass::v1::Credential& credential) {
  std::cout << credential.credential_id() << "  "
            << gatepass::v1::CredentialStatus_Name(credential.status()) << "  "
            << credential.subject() << "  expires_at_ms="
            << credential.expires_at_ms();
  if (credential.has_phone()) {
    std::cout << "  phone=" << credential.phone();
  }
  if (credential.has_purpose()) {
    std::cout << "  purpose=" << credential.purpose();
  }
  if (credential.has_consumed_at_ms()) {
    std::cout << "  checked_in_ms=" << credential.consumed_at_ms() << " at "
              << credential.consumed_by();
  }
  if (credential.has_checked_out_at_ms()) {
    std::cout << "  checked_out_ms=" << credential.checked_out_at_ms();
  }
  if (credential.contact_unreadable()) {
    std::cout << "  [contact details unreadable]";
  }
  std::cout << '\n';
}

int report(const grpc::Status& status) {
  std::cerr << "error: " << status.error_code() << ' '
            << status.error_message() << '\n';
  return 1;
}

struct session final {
  std::unique_ptr<gatepass::v1::Checkpoint::Stub> stub;
  std::string token;
  std::string operator_id;

  std::unique_ptr<grpc::ClientContext> context() const {
    auto out = std::make_unique<grpc::ClientContext>();
    if (!token.empty()) {
      out->AddMetadata("authorization", "Bearer " + token);
    }
    if (!operator_id.empty()) {
      out->AddMetadata("x-operator-id", operator_id);
    }
    return out;
  }
};

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"gatepass_admin options"};
  // clang-format off
  options.add_options()
      ("help,h", "show help")
      ("command", po::value<std::string>(&command), "command to run")
      ("server,s", po::value<std::string>()->default_value("127.0.0.1:50051"),
       "gatepass server address")
      ("token", po::value<std::string>(),
       "admin bearer token (default: $GATEPASS_ADMIN_TOKEN)")
      ("operator", po::value<std::string>()->default_value(""),
       "operator id recorded by the server")
      ("subject", po::value<std::string>(), "visitor display name")
      ("ttl", po::value<uint64_t>()->default_value(3600),
       "credential lifetime in seconds")
      ("phone", po::value<std::string>(), "visitor phone, 10 digits")
      ("purpose", po::value<std::string>(), "purpose of the visit")
      ("id", po::value<std::string>(), "credential id, 64 hex chars")
      ("limit", po::value<uint32_t>()->default_value(50), "list limit")
      ("since", po::value<uint64_t>(), "only attempts recorded at or after ms")
      ("payload", po::value<std::string>(), "QR payload text")
      ("image", po::value<std::string>(), "PNG or JPEG file to scan")
      ("checkpoint", po::value<std::string>()->default_value("cli"),
       "checkpoint id for scan")
      ("svg", po::value<std::string>(), "write the QR code to this SVG file")
      ("secret-file", po::value<std::string>()->default_value("gatepass.key"),
       "root secret file for keygen");
  // clang-format on

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "error: " << e.what() << '\n';
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto path = vm["secret-file"].as<std::string>();
    if (!gatepass::crypto::create_secret(path)) {
      std::cerr << "error: could not create " << path << '\n';
      return 1;
    }
    std::cout << "secret: " << path << '\n';
    return 0;
  }

  if (command == "render") {
    write_svg(require(vm, "payload"), require(vm, "svg"));
    return 0;
  }

  auto client = session{};
  client.stub = gatepass::v1::Checkpoint::NewStub(grpc::CreateChannel(
      vm["server"].as<std::string>(), grpc::InsecureChannelCredentials()));
  if (vm.contains("token")) {
    client.token = vm["token"].as<std::string>();
  } else if (const auto* env = std::getenv("GATEPASS_ADMIN_TOKEN")) {
    client.token = env;
  }
  client.operator_id = vm["operator"].as<std::string>();

  if (command == "issue") {
    auto request = gatepass::v1::IssueRequest{};
    request.set_subject(require(vm, "subject"));
    request.set_ttl_seconds(vm["ttl"].as<uint64_t>());
    if (vm.contains("phone")) {
      request.set_phone(vm["phone"].as<std::string>());
    }
    if (vm.contains("purpose")) {
      request.set_purpose(vm["purpose"].as<std::string>());
    }
    auto response = gatepass::v1::IssueResponse{};
    auto status = client.stub->Issue(client.context().get(), request, &response);
    if (!status.ok()) {
      return report(status);
    }
    std::cout << "id: " << response.credential_id() << '\n'
              << "payload: " << response.payload() << '\n'
              << "expires_at_ms: " << response.expires_at_ms() << '\n';
    if (vm.contains("svg")) {
      write_svg(response.payload(), vm["svg"].as<std::string>());
    }
    return 0;
  }

  if (command == "revoke") {
    auto request = gatepass::v1::RevokeRequest{};
    request.set_credential_id(require(vm, "id"));
    auto response = gatepass::v1::RevokeResponse{};
    auto status =
        client.stub->Revoke(client.context().get(), request, &response);
    if (!status.ok()) {
      return report(status);
    }
    std::cout << gatepass::v1::RevokeStatus_Name(response.status()) << '\n';
    return 0;
  }

  if (command == "check-out") {
    auto request = gatepass::v1::CheckOutRequest{};
    request.set_credential_id(require(vm, "id"));
    auto response = gatepass::v1::CheckOutResponse{};
    auto status =
        client.stub->CheckOut(client.context().get(), request, &response);
    if (!status.ok()) {
      return report(status);
    }
    std::cout << gatepass::v1::CheckOutStatus_Name(response.status()) << '\n';
    return 0;
  }

  if (command == "get") {
    auto request = gatepass::v1::GetCredentialRequest{};
    request.set_credential_id(require(vm, "id"));
    request.set_include_payload(vm.contains("svg"));
    auto response = gatepass::v1::GetCredentialResponse{};
    auto status =
        client.stub->GetCredential(client.context().get(), request, &response);
    if (!status.ok()) {
      return report(status);
    }
    print_credential(response.credential());
    if (vm.contains("svg") && response.has_payload()) {
      write_svg(response.payload(), vm["svg"].as<std::string>());
    }
    return 0;
  }

  if (command == "credentials") {
    auto request = gatepass::v1::ListCredentialsRequest{};
    request.set_limit(vm["limit"].as<uint32_t>());
    auto response = gatepass::v1::ListCredentialsResponse{};
    auto status = client.stub->ListCredentials(client.context().get(), request,
                                               &response);
    if (!status.ok()) {
      return report(status);
    }
    for (const auto& credential : response.credentials()) {
      print_credential(credential);
    }
    return 0;
  }

  if (command == "attempts") {
    auto request = gatepass::v1::ListAttemptsRequest{};
    request.set_limit(vm["limit"].as<uint32_t>());
    if (vm.contains("since")) {
      request.set_since_ms(vm["since"].as<uint64_t>());
    }
    auto response = gatepass::v1::ListAttemptsResponse{};
    auto status =
        client.stub->ListAttempts(client.context().get(), request, &response);
    if (!status.ok()) {
      return report(status);
    }
    for (const auto& attempt : response.attempts()) {
      std::cout << attempt.sequence() << "  " << attempt.recorded_at_ms()
                << "  " << outcome_name(attempt.outcome()) << "  "
                << reason_name(attempt.reason()) << "  "
                << (attempt.has_credential_id() ? attempt.credential_id()
                                                : std::string{"-"})
                << "  " << attempt.checkpoint_id() << '\n';
    }
    return 0;
  }

  if (command == "scan") {
    auto request = gatepass::v1::ScanRequest{};
    request.set_checkpoint_id(vm["checkpoint"].as<std::string>());
    if (vm.contains("payload")) {
      request.set_payload(vm["payload"].as<std::string>());
    } else if (vm.contains("image")) {
      auto* image = request.mutable_image();
      image->set_format(gatepass::v1::IMAGE_FORMAT_ENCODED);
      image->set_data(read_file(vm["image"].as<std::string>()));
    } else {
      gatepass::common::critical("scan requires --payload or --image");
    }
    auto response = gatepass::v1::ScanResponse{};
    auto status = client.stub->Scan(client.context().get(), request, &response);
    if (!status.ok()) {
      return report(status);
    }
    std::cout << outcome_name(response.outcome());
    if (response.has_subject()) {
      std::cout << "  " << response.subject();
    }
    if (response.reason() != gatepass::v1::DENIAL_REASON_UNSPECIFIED) {
      std::cout << "  " << reason_name(response.reason());
    }
    std::cout << '\n';
    return 0;
  }

  gatepass::common::critical("unknown command '" + command + "'");
}
