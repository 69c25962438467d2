#include <gtest/gtest.h>
#include <gatepass/schema/key/store_keys.hpp>
#include <gatepass/testing/verification_fixture.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using gatepass::schema::check_out_result_t;
using gatepass::schema::consume_result_t;
using gatepass::schema::credential_status_t;
using gatepass::schema::revoke_result_t;

TEST(credential_store, issue_persists_unused_credential) {
  auto fixture = gatepass::testing::verification_fixture{"gatepass_store_issue"};
  auto issued = fixture.issue("Alice", 60'000);

  EXPECT_EQ(issued.credential.subject, "Alice");
  EXPECT_EQ(issued.credential.status, credential_status_t::unused);
  EXPECT_EQ(issued.credential.issued_at, fixture.clock().now());
  EXPECT_EQ(issued.credential.expires_at, fixture.clock().now() + 60'000);
  EXPECT_EQ(issued.credential.issued_by, "tester");
  EXPECT_TRUE(issued.payload.starts_with("GP1."));

  auto stored = fixture.credentials().get(issued.credential.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->tag, issued.credential.tag);
  EXPECT_EQ(fixture.credentials().payload_for(*stored), issued.payload);
}

TEST(credential_store, ids_are_unique) {
  auto fixture = gatepass::testing::verification_fixture{"gatepass_store_ids"};
  auto first = fixture.issue("A", 1'000);
  auto second = fixture.issue("A", 1'000);
  EXPECT_NE(first.credential.id, second.credential.id);
  EXPECT_NE(first.payload, second.payload);
}

TEST(credential_store, consume_happens_once) {
  auto fixture =
      gatepass::testing::verification_fixture{"gatepass_store_consume"};
  auto issued = fixture.issue("Alice", 60'000);
  auto now = fixture.clock().now();

  fixture.clock().set(now + 10);
  auto first =
      fixture.credentials().try_consume(issued.credential.id, "gate-a");
  EXPECT_EQ(first.result, consume_result_t::consumed);
  ASSERT_TRUE(first.credential.has_value());
  EXPECT_EQ(first.credential->status, credential_status_t::consumed);
  EXPECT_EQ(first.credential->consumed_at, now + 10);
  EXPECT_EQ(first.decided_at, now + 10);
  EXPECT_EQ(first.credential->consumed_by, std::optional<std::string>{"gate-a"});

  fixture.clock().set(now + 20);
  auto second =
      fixture.credentials().try_consume(issued.credential.id, "gate-b");
  EXPECT_EQ(second.result, consume_result_t::already_consumed);
  auto stored = fixture.credentials().get(issued.credential.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->consumed_at, now + 10);
  EXPECT_EQ(stored->consumed_by, std::optional<std::string>{"gate-a"});
}

TEST(credential_store, expiry_boundary_is_exclusive) {
  auto fixture = gatepass::testing::verification_fixture{"gatepass_store_expiry"};
  auto issued = fixture.issue("Alice", 60'000);
  auto expires_at = issued.credential.expires_at;

  fixture.clock().set(expires_at);
  EXPECT_EQ(
      fixture.credentials().try_consume(issued.credential.id, "gate-a").result,
      consume_result_t::expired);
  EXPECT_EQ(fixture.credentials().get(issued.credential.id)->status,
            credential_status_t::unused);

  fixture.clock().set(expires_at - 1);
  EXPECT_EQ(
      fixture.credentials().try_consume(issued.credential.id, "gate-a").result,
      consume_result_t::consumed);
}

TEST(credential_store, unknown_id_is_not_found) {
  auto fixture =
      gatepass::testing::verification_fixture{"gatepass_store_unknown"};
  auto outcome = fixture.credentials().try_consume(
      gatepass::testing::make_hash(1), "gate-a");
  EXPECT_EQ(outcome.result, consume_result_t::not_found);
  EXPECT_FALSE(outcome.credential.has_value());
}

TEST(credential_store, revoke_is_idempotent_and_blocks_consume) {
  auto fixture = gatepass::testing::verification_fixture{"gatepass_store_revoke"};
  auto issued = fixture.issue("Mallory", 60'000);
  auto now = fixture.clock().now();

  EXPECT_EQ(fixture.credentials().revoke(issued.credential.id, now + 1),
            revoke_result_t::revoked);
  EXPECT_EQ(fixture.credentials().revoke(issued.credential.id, now + 2),
            revoke_result_t::revoked);
  auto stored = fixture.credentials().get(issued.credential.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, credential_status_t::revoked);
  EXPECT_EQ(stored->revoked_at, now + 1);
  EXPECT_TRUE(fixture.audit().list(std::nullopt, 0).empty());

  fixture.clock().set(now + 3);
  EXPECT_EQ(
      fixture.credentials().try_consume(issued.credential.id, "gate-a").result,
      consume_result_t::revoked);
}

TEST(credential_store, revoking_an_unknown_id_changes_nothing) {
  auto fixture =
      gatepass::testing::verification_fixture{"gatepass_store_revoke_unknown"};
  auto issued = fixture.issue("Alice", 60'000);
  auto before = fixture.storage().list_by_prefix(
      gatepass::schema::make_bytes_view(gatepass::schema::key::make_prefix_key(
          gatepass::schema::key::kCredentialKeyPrefix)));

  EXPECT_EQ(fixture.credentials().revoke(gatepass::testing::make_hash(5),
                                         fixture.clock().now()),
            revoke_result_t::not_found);

  EXPECT_FALSE(
      fixture.credentials().get(gatepass::testing::make_hash(5)).has_value());
  EXPECT_EQ(fixture.storage().list_by_prefix(gatepass::schema::make_bytes_view(
                gatepass::schema::key::make_prefix_key(
                    gatepass::schema::key::kCredentialKeyPrefix))),
            before);
  EXPECT_EQ(fixture.credentials().get(issued.credential.id)->status,
            credential_status_t::unused);
  EXPECT_TRUE(fixture.audit().list(std::nullopt, 0).empty());
}

TEST(credential_store, revoke_leaves_consumed_credentials_alone) {
  auto fixture =
      gatepass::testing::verification_fixture{"gatepass_store_revoke_used"};
  auto issued = fixture.issue("Alice", 60'000);
  auto now = fixture.clock().now();
  ASSERT_EQ(
      fixture.credentials().try_consume(issued.credential.id, "gate-a").result,
      consume_result_t::consumed);

  EXPECT_EQ(fixture.credentials().revoke(issued.credential.id, now + 1),
            revoke_result_t::already_consumed);
  EXPECT_EQ(fixture.credentials().get(issued.credential.id)->status,
            credential_status_t::consumed);
  EXPECT_EQ(fixture.credentials().revoke(gatepass::testing::make_hash(2), now),
            revoke_result_t::not_found);
}

TEST(credential_store, check_out_requires_check_in) {
  auto fixture =
      gatepass::testing::verification_fixture{"gatepass_store_check_out"};
  auto issued = fixture.issue("Alice", 60'000);
  auto now = fixture.clock().now();

  EXPECT_EQ(fixture.credentials().check_out(issued.credential.id, now),
            check_out_result_t::not_checked_in);
  fixture.clock().set(now + 1);
  ASSERT_EQ(
      fixture.credentials().try_consume(issued.credential.id, "gate-a").result,
      consume_result_t::consumed);
  EXPECT_EQ(fixture.credentials().check_out(issued.credential.id, now + 5),
            check_out_result_t::checked_out);
  EXPECT_EQ(fixture.credentials().check_out(issued.credential.id, now + 6),
            check_out_result_t::already_checked_out);
  EXPECT_EQ(fixture.credentials().get(issued.credential.id)->checked_out_at,
            now + 5);
  EXPECT_EQ(fixture.credentials().check_out(gatepass::testing::make_hash(3), now),
            check_out_result_t::not_found);
}

TEST(credential_store, list_is_newest_first_with_limit) {
  auto fixture = gatepass::testing::verification_fixture{"gatepass_store_list"};
  fixture.issue("first", 60'000);
  fixture.clock().advance(10);
  fixture.issue("second", 60'000);
  fixture.clock().advance(10);
  fixture.issue("third", 60'000);

  auto all = fixture.credentials().list(0);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].subject, "third");
  EXPECT_EQ(all[1].subject, "second");
  EXPECT_EQ(all[2].subject, "first");

  auto limited = fixture.credentials().list(2);
  ASSERT_EQ(limited.size(), 2u);
  EXPECT_EQ(limited[0].subject, "third");
}

TEST(credential_store, journal_entries_commit_with_the_decision) {
  auto fixture =
      gatepass::testing::verification_fixture{"gatepass_store_journal"};
  auto issued = fixture.issue("Alice", 60'000);
  auto journal_key = gatepass::schema::key::make_attempt_key(77);
  auto seen = std::optional<consume_result_t>{};

  fixture.credentials().try_consume(
      issued.credential.id, "gate-a",
      [&](const gatepass::store::consume_outcome& outcome) {
        seen = outcome.result;
        return std::vector<gatepass::storage::key_value_entry_t>{
            {journal_key, gatepass::schema::bytes_t{1, 2, 3}}};
      });

  EXPECT_EQ(seen, consume_result_t::consumed);
  auto entries = fixture.storage().list_by_prefix(
      gatepass::schema::make_bytes_view(journal_key));
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].second, (gatepass::schema::bytes_t{1, 2, 3}));
}

TEST(credential_store, journal_runs_for_denials_too) {
  auto fixture =
      gatepass::testing::verification_fixture{"gatepass_store_journal_deny"};
  auto calls = 0;
  auto outcome = fixture.credentials().try_consume(
      gatepass::testing::make_hash(8), "gate-a",
      [&](const gatepass::store::consume_outcome& decided) {
        ++calls;
        EXPECT_EQ(decided.result, consume_result_t::not_found);
        return std::vector<gatepass::storage::key_value_entry_t>{};
      });
  EXPECT_EQ(outcome.result, consume_result_t::not_found);
  EXPECT_EQ(calls, 1);
}

TEST(credential_store, concurrent_consumers_admit_exactly_one) {
  auto fixture = gatepass::testing::verification_fixture{"gatepass_store_race"};
  auto issued = fixture.issue("Alice", 60'000);

  constexpr auto kThreads = 16;
  auto consumed = std::atomic<int>{0};
  auto duplicates = std::atomic<int>{0};
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      auto outcome = fixture.credentials().try_consume(
          issued.credential.id, "gate-" + std::to_string(i));
      if (outcome.result == consume_result_t::consumed) {
        ++consumed;
      } else if (outcome.result == consume_result_t::already_consumed) {
        ++duplicates;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(consumed.load(), 1);
  EXPECT_EQ(duplicates.load(), kThreads - 1);
}

TEST(credential_store, state_survives_reopen) {
  auto path = gatepass::testing::make_db_path("gatepass_store_reopen");
  auto encoder = gatepass::schema::encoding::scale_encoder_t{};
  auto codec = gatepass::codec::token_codec::from_root_secret(
      gatepass::testing::make_root_secret());
  auto id = gatepass::schema::credential_id_t{};
  auto clock = gatepass::testing::manual_clock{2'000};
  {
    auto storage =
        gatepass::storage::make_storage<gatepass::storage::rocksdb_storage_tag>(
            path);
    auto store = gatepass::store::credential_store{encoder, storage, codec,
                                                   clock.as_clock()};
    auto issued = store.issue(
        gatepass::store::issue_request{.subject = "Alice",
                                       .ttl = 60'000,
                                       .sealed_phone = std::nullopt,
                                       .sealed_purpose = std::nullopt,
                                       .issued_by = "tester"},
        1'000);
    id = issued.credential.id;
    ASSERT_EQ(store.try_consume(id, "gate-a").result,
              consume_result_t::consumed);
  }
  {
    auto storage =
        gatepass::storage::make_storage<gatepass::storage::rocksdb_storage_tag>(
            path);
    auto store = gatepass::store::credential_store{encoder, storage, codec,
                                                   clock.as_clock()};
    EXPECT_EQ(store.try_consume(id, "gate-b").result,
              consume_result_t::already_consumed);
  }
  gatepass::testing::remove_path(path);
}

TEST(credential_store, outage_raises_storage_error) {
  auto fixture = gatepass::testing::verification_fixture{"gatepass_store_outage"};
  auto issued = fixture.issue("Alice", 60'000);
  fixture.take_storage_offline();
  EXPECT_THROW(
      fixture.credentials().try_consume(issued.credential.id, "gate-a"),
               gatepass::storage::storage_error);
  EXPECT_THROW(fixture.issue("Bob", 60'000), gatepass::storage::storage_error);
}
