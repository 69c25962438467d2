#pragma once

#include <gatepass/schema/encoding/scale/encoder.hpp>
#include <gatepass/schema/primitives.hpp>
#include <gatepass/schema/scan_attempt.hpp>
#include <gatepass/storage/rocksdb/storage.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace gatepass::audit {

/// How far recorded_at may run behind sequence order. A since-filtered walk
/// stops at the first record older than since minus this window.
inline constexpr gatepass::schema::duration_milliseconds_t kRecordedAtSkew =
    60'000;

/// Append-only journal of scan attempts keyed by a big-endian sequence.
///
/// Sequences are allocated atomically and never reused within a process; a
/// staged entry whose batch fails to commit leaves a gap, which readers
/// tolerate.
class audit_log final {
 public:
  audit_log(gatepass::schema::encoding::scale_encoder_t& encoder,
            gatepass::storage::storage<gatepass::storage::rocksdb_storage_tag>&
                storage);

  /// Assign the next sequence and return the encoded entry without writing
  /// it, for inclusion in a caller's write batch.
  gatepass::storage::key_value_entry_t stage(
      gatepass::schema::scan_attempt_t& attempt);

  /// Assign the next sequence and persist the attempt on its own.
  gatepass::schema::scan_attempt_t append(
      gatepass::schema::scan_attempt_t attempt);

  /// Newest first, restricted to recorded_at >= since. A zero limit returns
  /// everything that matches. Records written more than kRecordedAtSkew out
  /// of clock order with their neighbours may be missed by a since query.
  std::vector<gatepass::schema::scan_attempt_t> list(
      std::optional<gatepass::schema::timestamp_milliseconds_t> since,
      size_t limit) const;

  std::optional<gatepass::schema::scan_attempt_t> get(uint64_t sequence) const;

  uint64_t last_sequence() const;

 private:
  uint64_t load_last_sequence() const;

  gatepass::schema::encoding::scale_encoder_t& encoder_;
  gatepass::storage::storage<gatepass::storage::rocksdb_storage_tag>& storage_;
  std::atomic<uint64_t> next_sequence_{1};
};

}  // namespace gatepass::audit
