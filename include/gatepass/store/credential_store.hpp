#pragma once

#include <gatepass/codec/token_codec.hpp>
#include <gatepass/common/clock.hpp>
#include <gatepass/schema/check_out_result.hpp>
#include <gatepass/schema/consume_result.hpp>
#include <gatepass/schema/credential.hpp>
#include <gatepass/schema/encoding/scale/encoder.hpp>
#include <gatepass/schema/primitives.hpp>
#include <gatepass/schema/revoke_result.hpp>
#include <gatepass/storage/rocksdb/storage.hpp>

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gatepass::store {

inline constexpr size_t kCredentialLockStripes = 64;

/// Already-validated issuance input. Contact fields arrive sealed.
struct issue_request final {
  std::string subject;
  gatepass::schema::duration_milliseconds_t ttl{};
  std::optional<gatepass::schema::bytes_t> sealed_phone;
  std::optional<gatepass::schema::bytes_t> sealed_purpose;
  std::string issued_by;
};

struct issued_credential final {
  gatepass::schema::credential_t credential;
  std::string payload;
};

/// Result of try_consume. `credential` is the post-decision record, present
/// unless the id is unknown. `decided_at` is the clock reading taken inside
/// the critical section.
struct consume_outcome final {
  gatepass::schema::consume_result_t result{
      gatepass::schema::consume_result_t::not_found};
  std::optional<gatepass::schema::credential_t> credential;
  gatepass::schema::timestamp_milliseconds_t decided_at{};
};

/// Called inside the credential's critical section once the decision is
/// known. The returned entries are committed in the same write batch as the
/// credential transition.
using consume_journal_t =
    std::function<std::vector<gatepass::storage::key_value_entry_t>(
        const consume_outcome&)>;

/// Durable record of issued credentials and their consumption state.
///
/// Every state-changing operation runs its read-check-write under a striped
/// per-id mutex, so two scans of the same credential serialize while scans
/// of different credentials proceed in parallel. Storage failures propagate
/// as gatepass::storage::storage_error with nothing committed.
class credential_store final {
 public:
  credential_store(
      gatepass::schema::encoding::scale_encoder_t& encoder,
      gatepass::storage::storage<gatepass::storage::rocksdb_storage_tag>&
          storage,
      const gatepass::codec::token_codec& codec,
      gatepass::common::clock_t clock);

  /// Create and persist a new unused credential expiring at now + ttl.
  issued_credential issue(const issue_request& request,
                          gatepass::schema::timestamp_milliseconds_t now);

  /// Indivisible check-and-set: unused and unexpired becomes consumed.
  /// The clock is read after the per-id lock is held, and a credential is
  /// expired when that reading is >= expires_at.
  consume_outcome try_consume(const gatepass::schema::credential_id_t& id,
                              std::string_view checkpoint_id,
                              const consume_journal_t& journal = {});

  /// Unused becomes revoked. Revoking twice returns revoked both times
  /// without touching revoked_at; consumed credentials are left alone.
  gatepass::schema::revoke_result_t revoke(
      const gatepass::schema::credential_id_t& id,
      gatepass::schema::timestamp_milliseconds_t now);

  gatepass::schema::check_out_result_t check_out(
      const gatepass::schema::credential_id_t& id,
      gatepass::schema::timestamp_milliseconds_t now);

  std::optional<gatepass::schema::credential_t> get(
      const gatepass::schema::credential_id_t& id) const;

  /// Newest issued first. A zero limit returns everything.
  std::vector<gatepass::schema::credential_t> list(size_t limit) const;

  /// Payload text for an existing credential (re-rendering a lost QR code).
  std::string payload_for(const gatepass::schema::credential_t& credential) const;

 private:
  std::mutex& stripe_for(const gatepass::schema::credential_id_t& id) const;
  gatepass::storage::key_value_entry_t make_entry(
      const gatepass::schema::credential_t& credential) const;

  gatepass::schema::encoding::scale_encoder_t& encoder_;
  gatepass::storage::storage<gatepass::storage::rocksdb_storage_tag>& storage_;
  const gatepass::codec::token_codec& codec_;
  gatepass::common::clock_t clock_;
  mutable std::array<std::mutex, kCredentialLockStripes> stripes_;
};

}  // namespace gatepass::store
