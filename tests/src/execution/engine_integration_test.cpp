#include <ballot/execution/engine.hpp>
#include <ballot/schema/encoding/scale/encoder.hpp>
#include <ballot/schema/proposal_info.hpp>
#include <ballot/schema/proposal_state.hpp>
#include <ballot/schema/query_error_code.hpp>
#include <ballot/schema/vote_percentages.hpp>
#include <ballot/testing/execution_fixture.hpp>
#include <ballot/testing/execution_harness.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace {

using ballot::schema::transaction_error_code;
using ballot::testing::address_from_seed;
using ballot::testing::code_of;
using ballot::testing::query_value;

const auto kAdmin = ballot::testing::administrator_address();
const auto kVoterX = address_from_seed(1);
const auto kVoterY = address_from_seed(2);
const auto kVoterZ = address_from_seed(3);

ballot::schema::bytes_t encode_id(const ballot::schema::proposal_id_t id) {
  auto encoder = ballot::testing::scale_encoder_t{};
  return encoder.encode(id);
}

std::string attribute(const ballot::schema::transaction_event_t& event,
                      const std::string& key) {
  for (const auto& item : event.attributes) {
    if (item.key == key) {
      return item.value;
    }
  }
  return {};
}

}  // namespace

TEST(engine_integration, walkthrough_scenario_over_transactions) {
  auto fixture = ballot::testing::execution_fixture{"ballot_engine_walkthrough"};

  auto created = fixture.submit(
      kAdmin, ballot::schema::create_proposal_t{.title = "A",
                                                .description = "desc"});
  ASSERT_EQ(created.code, 0u) << created.log;
  EXPECT_EQ(created.data, encode_id(0));

  EXPECT_EQ(fixture.submit(kVoterX, ballot::schema::cast_vote_t{
                                        .proposal_id = 0, .support = true})
                .code,
            0u);
  auto duplicate = fixture.submit(
      kVoterX, ballot::schema::cast_vote_t{.proposal_id = 0, .support = true});
  EXPECT_EQ(duplicate.code, code_of(transaction_error_code::duplicate_vote));
  EXPECT_EQ(duplicate.log, "duplicate_vote");
  EXPECT_EQ(duplicate.codespace, "ballot.execute");

  EXPECT_EQ(fixture.submit(kVoterY, ballot::schema::cast_vote_t{
                                        .proposal_id = 0, .support = false})
                .code,
            0u);

  auto shares = query_value<ballot::schema::vote_percentages_t>(
      fixture.engine(), "/governance/vote_percentages", encode_id(0));
  EXPECT_EQ(shares.yes, 5000u);
  EXPECT_EQ(shares.no, 5000u);
  EXPECT_FALSE(query_value<bool>(fixture.engine(),
                                 "/governance/proposal_result", encode_id(0)));

  EXPECT_EQ(fixture.submit(kAdmin,
                           ballot::schema::close_proposal_t{.proposal_id = 0})
                .code,
            0u);
  auto late = fixture.submit(
      kVoterZ, ballot::schema::cast_vote_t{.proposal_id = 0, .support = true});
  EXPECT_EQ(late.code, code_of(transaction_error_code::inactive));

  auto info = query_value<ballot::schema::proposal_info_t>(
      fixture.engine(), "/governance/proposal_info", encode_id(0));
  EXPECT_EQ(info.title, "A");
  EXPECT_EQ(info.yes_count, 1u);
  EXPECT_EQ(info.no_count, 1u);
  EXPECT_FALSE(info.active);
}

TEST(engine_integration, success_results_carry_flattened_events) {
  auto fixture = ballot::testing::execution_fixture{"ballot_engine_events"};
  fixture.set_now(1'700'000'123);

  auto created = fixture.submit(
      kAdmin, ballot::schema::create_proposal_t{.title = "Quorum",
                                                .description = "Raise it"});
  ASSERT_EQ(created.code, 0u);
  EXPECT_EQ(created.info, "create_proposal accepted");
  ASSERT_EQ(created.events.size(), 1u);
  EXPECT_EQ(created.events[0].type, "ballot.proposal_created");
  EXPECT_EQ(attribute(created.events[0], "proposal_id"), "0");
  EXPECT_EQ(attribute(created.events[0], "title"), "Quorum");
  EXPECT_EQ(attribute(created.events[0], "timestamp"), "1700000123");

  auto closed = fixture.submit(
      kAdmin, ballot::schema::close_proposal_t{.proposal_id = 0});
  ASSERT_EQ(closed.events.size(), 1u);
  EXPECT_EQ(closed.events[0].type, "ballot.proposal_closed");
  EXPECT_EQ(attribute(closed.events[0], "yes_count"), "0");

  auto rejected = fixture.submit(
      kVoterX, ballot::schema::cast_vote_t{.proposal_id = 0, .support = true});
  EXPECT_EQ(rejected.info, "cast_vote rejected");
  EXPECT_TRUE(rejected.events.empty());
}

TEST(engine_integration, height_and_root_advance_only_on_success) {
  auto fixture = ballot::testing::execution_fixture{"ballot_engine_height"};
  auto initial = fixture.engine().info();
  EXPECT_EQ(initial.height, 0u);
  EXPECT_EQ(initial.state_root, ballot::schema::hash32_t{});
  EXPECT_EQ(initial.chain_id, ballot::testing::test_chain_id());

  auto denied = fixture.submit(
      kVoterX, ballot::schema::create_proposal_t{.title = "t",
                                                 .description = "d"});
  EXPECT_EQ(denied.code, code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(fixture.engine().info().height, 0u);
  EXPECT_EQ(fixture.engine().info().state_root, initial.state_root);

  ASSERT_EQ(fixture
                .submit(kAdmin, ballot::schema::create_proposal_t{
                                    .title = "t", .description = "d"})
                .code,
            0u);
  auto after = fixture.engine().info();
  EXPECT_EQ(after.height, 1u);
  EXPECT_NE(after.state_root, initial.state_root);
}

TEST(engine_integration, envelope_validation_rejects_bad_transactions) {
  auto fixture = ballot::testing::execution_fixture{"ballot_engine_envelope"};
  auto payload = ballot::schema::create_proposal_t{.title = "t",
                                                   .description = "d"};

  auto foreign = ballot::testing::make_transaction(
      ballot::testing::make_hash(9), kAdmin, payload);
  EXPECT_EQ(ballot::testing::submit(fixture.engine(), foreign).code,
            code_of(transaction_error_code::invalid_chain_id));

  auto future = ballot::testing::make_transaction(
      ballot::testing::test_chain_id(), kAdmin, payload);
  future.version = 2;
  EXPECT_EQ(ballot::testing::submit(fixture.engine(), future).code,
            code_of(transaction_error_code::unsupported_transaction_version));

  auto empty = ballot::schema::bytes_t{};
  EXPECT_EQ(fixture.engine()
                .submit_transaction(ballot::schema::make_bytes_view(empty))
                .code,
            code_of(transaction_error_code::invalid_transaction));

  auto garbage = ballot::schema::bytes_t{0xFF, 0x01, 0x02};
  EXPECT_EQ(fixture.engine()
                .submit_transaction(ballot::schema::make_bytes_view(garbage))
                .code,
            code_of(transaction_error_code::invalid_transaction));

  EXPECT_EQ(fixture.engine().info().height, 0u);
  EXPECT_EQ(query_value<uint64_t>(fixture.engine(),
                                  "/governance/proposal_count"),
            0u);
}

TEST(engine_integration, check_transaction_never_mutates_state) {
  auto fixture = ballot::testing::execution_fixture{"ballot_engine_check"};
  auto encoded = ballot::testing::encode_transaction(
      ballot::testing::make_transaction(
          ballot::testing::test_chain_id(), kAdmin,
          ballot::schema::create_proposal_t{.title = "t", .description = "d"}));

  auto checked =
      fixture.engine().check_transaction(ballot::schema::make_bytes_view(encoded));
  EXPECT_EQ(checked.code, 0u);
  EXPECT_EQ(checked.codespace, "ballot.checktx");
  EXPECT_EQ(fixture.engine().info().height, 0u);
  EXPECT_EQ(fixture.engine().ledger().proposal_count(), 0u);

  auto garbage = ballot::schema::bytes_t{0x09};
  EXPECT_EQ(fixture.engine()
                .check_transaction(ballot::schema::make_bytes_view(garbage))
                .code,
            code_of(transaction_error_code::invalid_transaction));
}

TEST(engine_integration, query_routes_return_ledger_views) {
  auto fixture = ballot::testing::execution_fixture{"ballot_engine_queries"};
  auto encoder = ballot::testing::scale_encoder_t{};
  for (auto i = 0; i < 3; ++i) {
    ASSERT_EQ(fixture
                  .submit(kAdmin, ballot::schema::create_proposal_t{
                                      .title = "P" + std::to_string(i),
                                      .description = "d"})
                  .code,
              0u);
  }
  ASSERT_EQ(fixture.submit(kAdmin,
                           ballot::schema::close_proposal_t{.proposal_id = 1})
                .code,
            0u);
  ASSERT_EQ(fixture.submit(kVoterX, ballot::schema::cast_vote_t{
                                        .proposal_id = 2, .support = true})
                .code,
            0u);

  auto& engine = fixture.engine();
  EXPECT_EQ(query_value<ballot::schema::address_t>(engine,
                                                   "/governance/administrator"),
            kAdmin);
  EXPECT_EQ(query_value<uint64_t>(engine, "/governance/proposal_count"), 3u);
  EXPECT_EQ(query_value<std::vector<uint64_t>>(engine,
                                               "/governance/proposal_ids"),
            (std::vector<uint64_t>{0, 1, 2}));
  EXPECT_EQ(query_value<std::vector<uint64_t>>(
                engine, "/governance/active_proposal_ids"),
            (std::vector<uint64_t>{0, 2}));

  auto proposal = query_value<ballot::schema::proposal_state_t>(
      engine, "/governance/proposal", encode_id(2));
  EXPECT_EQ(proposal.title, "P2");
  EXPECT_EQ(proposal.yes_count, 1u);
  EXPECT_EQ(proposal.creator, kAdmin);
  EXPECT_EQ(proposal.created_at, 1'700'000'000u);

  EXPECT_TRUE(query_value<bool>(engine, "/governance/has_voted",
                                encoder.encode(std::tuple{uint64_t{2}, kVoterX})));
  EXPECT_FALSE(query_value<bool>(engine, "/governance/has_voted",
                                 encoder.encode(std::tuple{uint64_t{0}, kVoterX})));
  EXPECT_TRUE(query_value<bool>(engine, "/governance/proposal_result",
                                encode_id(2)));

  auto info = query_value<ballot::schema::app_info_t>(engine, "/engine/info");
  EXPECT_EQ(info.height, 5u);
  EXPECT_EQ(info.state_root, engine.info().state_root);
  EXPECT_EQ(info.data, "ballot-governance");
}

TEST(engine_integration, query_errors_echo_key_and_codespace) {
  auto fixture = ballot::testing::execution_fixture{"ballot_engine_query_errors"};
  auto& engine = fixture.engine();

  auto missing_id = encode_id(42);
  auto missing = engine.query("/governance/proposal",
                              ballot::schema::make_bytes_view(missing_id));
  EXPECT_EQ(missing.code,
            static_cast<uint32_t>(ballot::schema::query_error_code::not_found));
  EXPECT_EQ(missing.log, "proposal 42 not found");
  EXPECT_EQ(missing.key, missing_id);
  EXPECT_EQ(missing.codespace, "ballot.query");

  auto short_key = ballot::schema::bytes_t{0x01};
  auto invalid = engine.query("/governance/proposal_info",
                              ballot::schema::make_bytes_view(short_key));
  EXPECT_EQ(invalid.code,
            static_cast<uint32_t>(ballot::schema::query_error_code::invalid_key));
  EXPECT_EQ(invalid.key, short_key);

  auto unsupported =
      engine.query("/governance/unknown", ballot::schema::bytes_view_t{});
  EXPECT_EQ(unsupported.code, static_cast<uint32_t>(
                                  ballot::schema::query_error_code::unsupported_path));
  EXPECT_EQ(unsupported.codespace, "ballot.query");
}

TEST(engine_integration, event_log_is_sequenced_and_range_bounded) {
  auto fixture = ballot::testing::execution_fixture{"ballot_engine_event_log"};
  ASSERT_EQ(fixture
                .submit(kAdmin, ballot::schema::create_proposal_t{
                                    .title = "t", .description = "d"})
                .code,
            0u);
  ASSERT_EQ(fixture.submit(kVoterX, ballot::schema::cast_vote_t{
                                        .proposal_id = 0, .support = false})
                .code,
            0u);
  ASSERT_EQ(fixture
                .submit(kAdmin, ballot::schema::transfer_administrator_t{
                                    .new_administrator = kVoterY})
                .code,
            0u);

  auto all = fixture.engine().events(0, 100);
  ASSERT_EQ(all.size(), 3u);
  for (auto i = size_t{0}; i < all.size(); ++i) {
    EXPECT_EQ(all[i].sequence, i + 1);
  }
  EXPECT_TRUE(std::holds_alternative<ballot::schema::proposal_created_t>(
      all[0].event));
  EXPECT_TRUE(std::holds_alternative<ballot::schema::voted_t>(all[1].event));
  const auto& transferred =
      std::get<ballot::schema::administrator_transferred_t>(all[2].event);
  EXPECT_EQ(transferred.previous_administrator, kAdmin);
  EXPECT_EQ(transferred.new_administrator, kVoterY);

  auto middle = ballot::testing::query_events(fixture.engine(), 2, 2);
  ASSERT_EQ(middle.size(), 1u);
  EXPECT_EQ(middle[0].sequence, 2u);

  EXPECT_TRUE(fixture.engine().events(4, 10).empty());
  EXPECT_TRUE(fixture.engine().events(3, 2).empty());
}

TEST(engine_integration, state_survives_restart_with_identical_root) {
  const auto db = ballot::testing::make_db_path("ballot_engine_restart");
  auto encoder = ballot::testing::scale_encoder_t{};
  auto root = ballot::schema::hash32_t{};
  {
    auto storage =
        ballot::storage::make_storage<ballot::storage::rocksdb_storage_tag>(db);
    auto engine = ballot::execution::engine{
        encoder, storage, ballot::testing::test_chain_id(), kAdmin,
        [] { return ballot::schema::timestamp_seconds_t{100}; }};
    auto submit = [&](const ballot::schema::address_t& signer,
                      const ballot::schema::transaction_payload_t& payload) {
      return ballot::testing::submit(
          engine, ballot::testing::make_transaction(
                      ballot::testing::test_chain_id(), signer, payload));
    };
    ASSERT_EQ(submit(kAdmin, ballot::schema::create_proposal_t{
                                 .title = "Persist", .description = "me"})
                  .code,
              0u);
    ASSERT_EQ(submit(kVoterX, ballot::schema::cast_vote_t{.proposal_id = 0,
                                                          .support = true})
                  .code,
              0u);
    ASSERT_EQ(submit(kAdmin, ballot::schema::transfer_administrator_t{
                                 .new_administrator = kVoterY})
                  .code,
              0u);
    root = engine.info().state_root;
  }
  {
    auto storage =
        ballot::storage::make_storage<ballot::storage::rocksdb_storage_tag>(db);
    // Stored administrator wins over the genesis argument.
    auto engine = ballot::execution::engine{
        encoder, storage, ballot::testing::test_chain_id(), kAdmin};
    EXPECT_EQ(engine.info().height, 3u);
    EXPECT_EQ(engine.info().state_root, root);
    EXPECT_EQ(engine.ledger().administrator(), kVoterY);
    EXPECT_EQ(engine.ledger().proposal_count(), 1u);
    EXPECT_TRUE(engine.ledger().has_voted(0, kVoterX).value);
    EXPECT_EQ(engine.ledger().proposal_info(0).value.yes_count, 1u);
    EXPECT_EQ(engine.events(1, 10).size(), 3u);

    auto again = ballot::testing::submit(
        engine, ballot::testing::make_transaction(
                    ballot::testing::test_chain_id(), kVoterX,
                    ballot::schema::cast_vote_t{.proposal_id = 0,
                                                .support = false}));
    EXPECT_EQ(again.code, code_of(transaction_error_code::duplicate_vote));

    auto next = ballot::testing::submit(
        engine, ballot::testing::make_transaction(
                    ballot::testing::test_chain_id(), kVoterY,
                    ballot::schema::create_proposal_t{.title = "Next",
                                                      .description = "one"}));
    ASSERT_EQ(next.code, 0u);
    EXPECT_EQ(next.data, encode_id(1));
    EXPECT_EQ(engine.events(1, 10).back().sequence, 4u);
  }
  ballot::testing::remove_path(db);
}

TEST(engine_integration, identical_histories_produce_identical_roots) {
  auto first = ballot::testing::execution_fixture{"ballot_engine_root_a"};
  auto second = ballot::testing::execution_fixture{"ballot_engine_root_b"};

  auto payloads = std::vector<std::tuple<ballot::schema::address_t,
                                         ballot::schema::transaction_payload_t>>{
      {kAdmin,
       ballot::schema::create_proposal_t{.title = "R", .description = "root"}},
      {kVoterX, ballot::schema::cast_vote_t{.proposal_id = 0, .support = true}},
      {kVoterX, ballot::schema::cast_vote_t{.proposal_id = 0, .support = true}},
      {kAdmin, ballot::schema::close_proposal_t{.proposal_id = 0}}};
  for (const auto& [signer, payload] : payloads) {
    EXPECT_EQ(first.submit(signer, payload).code,
              second.submit(signer, payload).code);
  }
  EXPECT_EQ(first.engine().info().height, 3u);
  EXPECT_EQ(first.engine().info().state_root,
            second.engine().info().state_root);
}
