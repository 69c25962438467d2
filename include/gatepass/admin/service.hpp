#pragma once

#include <gatepass/admin/admin_context.hpp>
#include <gatepass/admin/admin_error.hpp>
#include <gatepass/audit/audit_log.hpp>
#include <gatepass/common/clock.hpp>
#include <gatepass/schema/check_out_result.hpp>
#include <gatepass/schema/credential.hpp>
#include <gatepass/schema/primitives.hpp>
#include <gatepass/schema/revoke_result.hpp>
#include <gatepass/schema/scan_attempt.hpp>
#include <gatepass/store/credential_store.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gatepass::admin {

inline constexpr size_t kMaxSubjectLength = 128;
inline constexpr size_t kMaxPurposeLength = 512;

struct service_options final {
  uint64_t max_ttl_seconds{24 * 60 * 60};
};

struct issue_parameters final {
  std::string subject;
  uint64_t ttl_seconds{};
  std::optional<std::string> phone;
  std::optional<std::string> purpose;
};

using issue_result_t =
    std::variant<gatepass::store::issued_credential, admin_error_t>;

/// Credential with its contact fields opened for an administrator.
struct credential_view final {
  gatepass::schema::credential_t credential;
  std::optional<std::string> phone;
  std::optional<std::string> purpose;
  /// Set when a sealed field exists but does not open under the current key.
  bool contact_unreadable{false};
};

/// Administrative operations. Every call takes the caller's admin_context;
/// the verification path never goes through here.
class service final {
 public:
  service(gatepass::store::credential_store& credentials,
          gatepass::audit::audit_log& audit,
          gatepass::common::clock_t clock,
          const gatepass::schema::secret_key_t& contact_key,
          service_options options = {});

  issue_result_t issue(const admin_context& context,
                       const issue_parameters& parameters);

  gatepass::schema::revoke_result_t revoke(
      const admin_context& context,
      const gatepass::schema::credential_id_t& id);

  gatepass::schema::check_out_result_t check_out(
      const admin_context& context,
      const gatepass::schema::credential_id_t& id);

  std::optional<credential_view> get_credential(
      const admin_context& context,
      const gatepass::schema::credential_id_t& id) const;

  std::vector<credential_view> list_credentials(const admin_context& context,
                                                size_t limit) const;

  std::vector<gatepass::schema::scan_attempt_t> list_attempts(
      const admin_context& context,
      std::optional<gatepass::schema::timestamp_milliseconds_t> since,
      size_t limit) const;

  /// Payload text of an issued credential, for re-rendering its QR code.
  std::optional<std::string> payload(
      const admin_context& context,
      const gatepass::schema::credential_id_t& id) const;

 private:
  credential_view open(gatepass::schema::credential_t credential) const;

  gatepass::store::credential_store& credentials_;
  gatepass::audit::audit_log& audit_;
  gatepass::common::clock_t clock_;
  gatepass::schema::secret_key_t contact_key_;
  service_options options_;
};

/// Exactly ten ASCII digits.
bool is_valid_phone(std::string_view phone);

}  // namespace gatepass::admin
