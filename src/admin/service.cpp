#include <gatepass/admin/service.hpp>
#include <gatepass/crypto/seal.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

namespace gatepass::admin {

namespace {

std::string trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::optional<std::string> open_field(
    const gatepass::schema::secret_key_t& key,
    const std::optional<gatepass::schema::bytes_t>& sealed,
    bool& unreadable) {
  if (!sealed) {
    return std::nullopt;
  }
  auto opened = gatepass::crypto::unseal(
      key, gatepass::schema::make_bytes_view(*sealed));
  if (!opened) {
    unreadable = true;
    return std::nullopt;
  }
  return gatepass::schema::make_string(*opened);
}

}  // namespace

bool is_valid_phone(const std::string_view phone) {
  return phone.size() == 10 &&
         std::all_of(std::begin(phone), std::end(phone),
                     [](const char c) { return c >= '0' && c <= '9'; });
}

service::service(gatepass::store::credential_store& credentials,
                 gatepass::audit::audit_log& audit,
                 gatepass::common::clock_t clock,
                 const gatepass::schema::secret_key_t& contact_key,
                 service_options options)
    : credentials_{credentials},
      audit_{audit},
      clock_{std::move(clock)},
      contact_key_{contact_key},
      options_{options} {}

issue_result_t service::issue(const admin_context& context,
                              const issue_parameters& parameters) {
  auto subject = trim(parameters.subject);
  if (subject.empty() || subject.size() > kMaxSubjectLength) {
    return admin_error_t::invalid_subject;
  }
  if (parameters.ttl_seconds == 0 ||
      parameters.ttl_seconds > options_.max_ttl_seconds) {
    return admin_error_t::invalid_ttl;
  }
  // expires_at = now + ttl must fit in unix milliseconds.
  constexpr auto kMaxMilliseconds = std::numeric_limits<uint64_t>::max();
  auto now = clock_();
  if (parameters.ttl_seconds > kMaxMilliseconds / 1000 ||
      parameters.ttl_seconds * 1000 > kMaxMilliseconds - now) {
    return admin_error_t::invalid_ttl;
  }

  auto request = gatepass::store::issue_request{};
  request.subject = std::move(subject);
  request.ttl = parameters.ttl_seconds * 1000;
  request.issued_by = context.operator_id;
  if (parameters.phone) {
    auto phone = trim(*parameters.phone);
    if (!is_valid_phone(phone)) {
      return admin_error_t::invalid_phone;
    }
    request.sealed_phone = gatepass::crypto::seal(
        contact_key_, gatepass::schema::make_bytes_view(phone));
  }
  if (parameters.purpose) {
    auto purpose = trim(*parameters.purpose);
    if (purpose.size() > kMaxPurposeLength) {
      return admin_error_t::invalid_purpose;
    }
    if (!purpose.empty()) {
      request.sealed_purpose = gatepass::crypto::seal(
          contact_key_, gatepass::schema::make_bytes_view(purpose));
    }
  }

  auto issued = credentials_.issue(request, now);
  spdlog::info("Operator '{}' issued credential {} for '{}'",
               context.operator_id,
               gatepass::schema::to_hex(issued.credential.id),
               issued.credential.subject);
  return issued;
}

gatepass::schema::revoke_result_t service::revoke(
    const admin_context& context,
    const gatepass::schema::credential_id_t& id) {
  auto result = credentials_.revoke(id, clock_());
  spdlog::info("Operator '{}' revoke {}: {}", context.operator_id,
               gatepass::schema::to_hex(id),
               gatepass::schema::to_string(result));
  return result;
}

gatepass::schema::check_out_result_t service::check_out(
    const admin_context& context,
    const gatepass::schema::credential_id_t& id) {
  auto result = credentials_.check_out(id, clock_());
  spdlog::info("Operator '{}' check-out {}: {}", context.operator_id,
               gatepass::schema::to_hex(id),
               gatepass::schema::to_string(result));
  return result;
}

credential_view service::open(gatepass::schema::credential_t credential) const {
  auto view = credential_view{};
  view.phone =
      open_field(contact_key_, credential.sealed_phone, view.contact_unreadable);
  view.purpose = open_field(contact_key_, credential.sealed_purpose,
                            view.contact_unreadable);
  if (view.contact_unreadable) {
    spdlog::warn("Contact details of credential {} do not open",
                 gatepass::schema::to_hex(credential.id));
  }
  view.credential = std::move(credential);
  return view;
}

std::optional<credential_view> service::get_credential(
    const admin_context& context,
    const gatepass::schema::credential_id_t& id) const {
  spdlog::debug("Operator '{}' reads credential {}", context.operator_id,
                gatepass::schema::to_hex(id));
  auto credential = credentials_.get(id);
  if (!credential) {
    return std::nullopt;
  }
  return open(std::move(credential).value());
}

std::vector<credential_view> service::list_credentials(
    const admin_context& context,
    const size_t limit) const {
  spdlog::debug("Operator '{}' lists credentials", context.operator_id);
  auto views = std::vector<credential_view>{};
  for (auto& credential : credentials_.list(limit)) {
    views.push_back(open(std::move(credential)));
  }
  return views;
}

std::vector<gatepass::schema::scan_attempt_t> service::list_attempts(
    const admin_context& context,
    const std::optional<gatepass::schema::timestamp_milliseconds_t> since,
    const size_t limit) const {
  spdlog::debug("Operator '{}' lists scan attempts", context.operator_id);
  return audit_.list(since, limit);
}

std::optional<std::string> service::payload(
    const admin_context& context,
    const gatepass::schema::credential_id_t& id) const {
  spdlog::debug("Operator '{}' requests payload of {}", context.operator_id,
                gatepass::schema::to_hex(id));
  auto credential = credentials_.get(id);
  if (!credential) {
    return std::nullopt;
  }
  return credentials_.payload_for(*credential);
}

}  // namespace gatepass::admin
