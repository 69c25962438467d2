#include <gatepass/crypto/random.hpp>
#include <gatepass/schema/key/store_keys.hpp>
#include <gatepass/store/credential_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace gatepass::store {

namespace {

inline constexpr auto kMaxIdAttempts = 4;

gatepass::schema::credential_reference_t make_reference(
    const gatepass::schema::credential_t& credential) {
  return gatepass::schema::credential_reference_t{
      .version = 1, .id = credential.id, .expires_at = credential.expires_at};
}

}  // namespace

credential_store::credential_store(
    gatepass::schema::encoding::scale_encoder_t& encoder,
    gatepass::storage::storage<gatepass::storage::rocksdb_storage_tag>& storage,
    const gatepass::codec::token_codec& codec,
    gatepass::common::clock_t clock)
    : encoder_{encoder},
      storage_{storage},
      codec_{codec},
      clock_{std::move(clock)} {}

std::mutex& credential_store::stripe_for(
    const gatepass::schema::credential_id_t& id) const {
  return stripes_[id[0] % kCredentialLockStripes];
}

gatepass::storage::key_value_entry_t credential_store::make_entry(
    const gatepass::schema::credential_t& credential) const {
  return {gatepass::schema::key::make_credential_key(credential.id),
          encoder_.encode(credential)};
}

issued_credential credential_store::issue(
    const issue_request& request,
    const gatepass::schema::timestamp_milliseconds_t now) {
  for (auto attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto credential = gatepass::schema::credential_t{};
    credential.id = gatepass::crypto::random_hash32();

    auto lock = std::scoped_lock{stripe_for(credential.id)};
    auto key = gatepass::schema::key::make_credential_key(credential.id);
    if (storage_.get<gatepass::schema::credential_t>(
            encoder_, gatepass::schema::make_bytes_view(key))) {
      spdlog::warn("Credential id collision on issue, retrying");
      continue;
    }

    credential.subject = request.subject;
    credential.issued_at = now;
    credential.expires_at = now + request.ttl;
    credential.status = gatepass::schema::credential_status_t::unused;
    credential.issued_by = request.issued_by;
    credential.sealed_phone = request.sealed_phone;
    credential.sealed_purpose = request.sealed_purpose;
    credential.tag = codec_.tag(make_reference(credential));

    storage_.put(encoder_, gatepass::schema::make_bytes_view(key), credential);
    spdlog::info("Issued credential {} expiring at {}",
                 gatepass::schema::to_hex(credential.id), credential.expires_at);
    auto payload = codec_.encode(make_reference(credential));
    return issued_credential{.credential = std::move(credential),
                             .payload = std::move(payload)};
  }
  throw gatepass::storage::storage_error{
      "could not allocate a unique credential id"};
}

consume_outcome credential_store::try_consume(
    const gatepass::schema::credential_id_t& id,
    const std::string_view checkpoint_id,
    const consume_journal_t& journal) {
  auto lock = std::scoped_lock{stripe_for(id)};
  auto key = gatepass::schema::key::make_credential_key(id);
  auto outcome = consume_outcome{};
  outcome.credential = storage_.get<gatepass::schema::credential_t>(
      encoder_, gatepass::schema::make_bytes_view(key));
  auto now = clock_();
  outcome.decided_at = now;

  auto changed = false;
  if (!outcome.credential) {
    outcome.result = gatepass::schema::consume_result_t::not_found;
  } else if (outcome.credential->status ==
             gatepass::schema::credential_status_t::consumed) {
    outcome.result = gatepass::schema::consume_result_t::already_consumed;
  } else if (outcome.credential->status ==
             gatepass::schema::credential_status_t::revoked) {
    outcome.result = gatepass::schema::consume_result_t::revoked;
  } else if (now >= outcome.credential->expires_at) {
    outcome.result = gatepass::schema::consume_result_t::expired;
  } else {
    outcome.result = gatepass::schema::consume_result_t::consumed;
    outcome.credential->status = gatepass::schema::credential_status_t::consumed;
    outcome.credential->consumed_at = now;
    outcome.credential->consumed_by = std::string{checkpoint_id};
    changed = true;
  }

  auto entries = std::vector<gatepass::storage::key_value_entry_t>{};
  if (changed) {
    entries.push_back(make_entry(*outcome.credential));
  }
  if (journal) {
    auto journal_entries = journal(outcome);
    std::move(std::begin(journal_entries), std::end(journal_entries),
              std::back_inserter(entries));
  }
  if (!entries.empty()) {
    storage_.write(entries);
  }
  return outcome;
}

gatepass::schema::revoke_result_t credential_store::revoke(
    const gatepass::schema::credential_id_t& id,
    const gatepass::schema::timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{stripe_for(id)};
  auto key = gatepass::schema::key::make_credential_key(id);
  auto credential = storage_.get<gatepass::schema::credential_t>(
      encoder_, gatepass::schema::make_bytes_view(key));
  if (!credential) {
    return gatepass::schema::revoke_result_t::not_found;
  }
  switch (credential->status) {
    case gatepass::schema::credential_status_t::revoked:
      return gatepass::schema::revoke_result_t::revoked;
    case gatepass::schema::credential_status_t::consumed:
      return gatepass::schema::revoke_result_t::already_consumed;
    case gatepass::schema::credential_status_t::unused:
      break;
  }
  credential->status = gatepass::schema::credential_status_t::revoked;
  credential->revoked_at = now;
  storage_.put(encoder_, gatepass::schema::make_bytes_view(key), *credential);
  spdlog::info("Revoked credential {}", gatepass::schema::to_hex(id));
  return gatepass::schema::revoke_result_t::revoked;
}

gatepass::schema::check_out_result_t credential_store::check_out(
    const gatepass::schema::credential_id_t& id,
    const gatepass::schema::timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{stripe_for(id)};
  auto key = gatepass::schema::key::make_credential_key(id);
  auto credential = storage_.get<gatepass::schema::credential_t>(
      encoder_, gatepass::schema::make_bytes_view(key));
  if (!credential) {
    return gatepass::schema::check_out_result_t::not_found;
  }
  if (credential->status != gatepass::schema::credential_status_t::consumed) {
    return gatepass::schema::check_out_result_t::not_checked_in;
  }
  if (credential->checked_out_at) {
    return gatepass::schema::check_out_result_t::already_checked_out;
  }
  credential->checked_out_at = now;
  storage_.put(encoder_, gatepass::schema::make_bytes_view(key), *credential);
  return gatepass::schema::check_out_result_t::checked_out;
}

std::optional<gatepass::schema::credential_t> credential_store::get(
    const gatepass::schema::credential_id_t& id) const {
  auto key = gatepass::schema::key::make_credential_key(id);
  return storage_.get<gatepass::schema::credential_t>(
      encoder_, gatepass::schema::make_bytes_view(key));
}

std::vector<gatepass::schema::credential_t> credential_store::list(
    const size_t limit) const {
  auto prefix = gatepass::schema::key::make_prefix_key(
      gatepass::schema::key::kCredentialKeyPrefix);
  auto credentials = std::vector<gatepass::schema::credential_t>{};
  storage_.visit_by_prefix(
      gatepass::schema::make_bytes_view(prefix),
      gatepass::storage::iteration_direction_t::forward,
      [&](const gatepass::schema::bytes_view_t& key,
          const gatepass::schema::bytes_view_t& value) {
        auto decoded =
            encoder_.try_decode<gatepass::schema::credential_t>(value);
        if (!decoded) {
          spdlog::warn("Skipping undecodable credential record {}",
                       gatepass::schema::to_hex(key));
          return true;
        }
        credentials.push_back(std::move(decoded).value());
        return true;
      });
  std::stable_sort(std::begin(credentials), std::end(credentials),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.issued_at > rhs.issued_at;
                   });
  if (limit != 0 && credentials.size() > limit) {
    credentials.resize(limit);
  }
  return credentials;
}

std::string credential_store::payload_for(
    const gatepass::schema::credential_t& credential) const {
  return codec_.encode(make_reference(credential));
}

}  // namespace gatepass::store
