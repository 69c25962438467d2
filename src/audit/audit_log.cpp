#include <gatepass/audit/audit_log.hpp>
#include <gatepass/schema/key/store_keys.hpp>

#include <spdlog/spdlog.h>

namespace gatepass::audit {

audit_log::audit_log(
    gatepass::schema::encoding::scale_encoder_t& encoder,
    gatepass::storage::storage<gatepass::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder}, storage_{storage} {
  next_sequence_.store(load_last_sequence() + 1);
}

uint64_t audit_log::load_last_sequence() const {
  auto prefix = gatepass::schema::key::make_prefix_key(
      gatepass::schema::key::kAttemptKeyPrefix);
  auto last = uint64_t{};
  storage_.visit_by_prefix(
      gatepass::schema::make_bytes_view(prefix),
      gatepass::storage::iteration_direction_t::reverse,
      [&](const gatepass::schema::bytes_view_t& key,
          const gatepass::schema::bytes_view_t&) {
        auto sequence = gatepass::schema::key::parse_attempt_key(key);
        if (!sequence) {
          return true;
        }
        last = *sequence;
        return false;
      });
  return last;
}

gatepass::storage::key_value_entry_t audit_log::stage(
    gatepass::schema::scan_attempt_t& attempt) {
  attempt.sequence = next_sequence_.fetch_add(1);
  return {gatepass::schema::key::make_attempt_key(attempt.sequence),
          encoder_.encode(attempt)};
}

gatepass::schema::scan_attempt_t audit_log::append(
    gatepass::schema::scan_attempt_t attempt) {
  auto entry = stage(attempt);
  storage_.write({entry});
  return attempt;
}

std::vector<gatepass::schema::scan_attempt_t> audit_log::list(
    const std::optional<gatepass::schema::timestamp_milliseconds_t> since,
    const size_t limit) const {
  auto prefix = gatepass::schema::key::make_prefix_key(
      gatepass::schema::key::kAttemptKeyPrefix);
  auto attempts = std::vector<gatepass::schema::scan_attempt_t>{};
  storage_.visit_by_prefix(
      gatepass::schema::make_bytes_view(prefix),
      gatepass::storage::iteration_direction_t::reverse,
      [&](const gatepass::schema::bytes_view_t& key,
          const gatepass::schema::bytes_view_t& value) {
        auto decoded =
            encoder_.try_decode<gatepass::schema::scan_attempt_t>(value);
        if (!decoded) {
          spdlog::warn("Skipping undecodable audit record {}",
                       gatepass::schema::to_hex(key));
          return true;
        }
        // Sequence order follows arrival; recorded_at may jitter between
        // concurrent scans, so the since filter skips until it is well past.
        if (since && decoded->recorded_at < *since) {
          return *since < kRecordedAtSkew ||
                 decoded->recorded_at >= *since - kRecordedAtSkew;
        }
        attempts.push_back(std::move(decoded).value());
        return limit == 0 || attempts.size() < limit;
      });
  return attempts;
}

std::optional<gatepass::schema::scan_attempt_t> audit_log::get(
    const uint64_t sequence) const {
  auto key = gatepass::schema::key::make_attempt_key(sequence);
  return storage_.get<gatepass::schema::scan_attempt_t>(
      encoder_, gatepass::schema::make_bytes_view(key));
}

uint64_t audit_log::last_sequence() const {
  return next_sequence_.load() - 1;
}

}  // namespace gatepass::audit
