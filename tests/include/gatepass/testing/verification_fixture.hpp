#pragma once

#include <gatepass/audit/audit_log.hpp>
#include <gatepass/codec/token_codec.hpp>
#include <gatepass/common/clock.hpp>
#include <gatepass/schema/encoding/scale/encoder.hpp>
#include <gatepass/storage/rocksdb/storage.hpp>
#include <gatepass/store/credential_store.hpp>
#include <gatepass/testing/common.hpp>
#include <gatepass/testing/manual_clock.hpp>
#include <gatepass/verification/engine.hpp>

#include <string>
#include <string_view>

namespace gatepass::testing {

/// Fixed root secret so payloads are stable across a test run.
inline gatepass::schema::secret_key_t make_root_secret() {
  return make_hash(0x40);
}

/// Temporary RocksDB plus the credential store, audit log and engine on top
/// of it. The database directory is removed on destruction.
class verification_fixture final {
 public:
  explicit verification_fixture(
      const std::string_view db_prefix,
      const gatepass::schema::timestamp_milliseconds_t start = 1'000'000)
      : db_path_{make_db_path(db_prefix)},
        clock_{start},
        encoder_{},
        storage_{gatepass::storage::make_storage<
            gatepass::storage::rocksdb_storage_tag>(db_path_)},
        codec_{gatepass::codec::token_codec::from_root_secret(
            make_root_secret())},
        credentials_{encoder_, storage_, codec_, clock_.as_clock()},
        audit_{encoder_, storage_},
        engine_{codec_, credentials_, audit_} {}

  verification_fixture(const verification_fixture&) = delete;
  verification_fixture& operator=(const verification_fixture&) = delete;
  verification_fixture(verification_fixture&&) = delete;
  verification_fixture& operator=(verification_fixture&&) = delete;

  ~verification_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  gatepass::schema::encoding::scale_encoder_t& encoder() { return encoder_; }
  gatepass::storage::rocksdb_storage_t& storage() { return storage_; }
  const gatepass::codec::token_codec& codec() const { return codec_; }
  gatepass::store::credential_store& credentials() { return credentials_; }
  gatepass::audit::audit_log& audit() { return audit_; }
  gatepass::verification::engine& engine() { return engine_; }
  manual_clock& clock() { return clock_; }

  /// Simulate the backing store going away mid-run.
  void take_storage_offline() { storage_.database.reset(); }

  gatepass::store::issued_credential issue(
      const std::string& subject,
      const gatepass::schema::duration_milliseconds_t ttl) {
    return credentials_.issue(
        gatepass::store::issue_request{.subject = subject,
                                       .ttl = ttl,
                                       .sealed_phone = std::nullopt,
                                       .sealed_purpose = std::nullopt,
                                       .issued_by = "tester"},
        clock_.now());
  }

  gatepass::verification::verification_result scan(
      const std::string_view payload,
      const std::string& checkpoint_id = "gate-a",
      const gatepass::schema::scan_source_t source =
          gatepass::schema::scan_source_t::mobile_upload) {
    return engine_.verify(
        payload, gatepass::verification::scan_metadata{
                     .source = source,
                     .timestamp = clock_.now(),
                     .checkpoint_id = checkpoint_id});
  }

 private:
  std::string db_path_;
  manual_clock clock_;
  gatepass::schema::encoding::scale_encoder_t encoder_;
  gatepass::storage::rocksdb_storage_t storage_;
  gatepass::codec::token_codec codec_;
  gatepass::store::credential_store credentials_;
  gatepass::audit::audit_log audit_;
  gatepass::verification::engine engine_;
};

}  // namespace gatepass::testing
