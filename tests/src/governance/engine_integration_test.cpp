#include <ballot/testing/governance_fixture.hpp>
#include <gtest/gtest.h>

#include <variant>

namespace {

using ballot::schema::amount_t;
using ballot::schema::governance_error_code;
using ballot::schema::proposal_status_t;
using ballot::schema::vote_choice_t;
using ballot::testing::governance_fixture;
using ballot::testing::make_account;

constexpr auto kOk = uint32_t{0};

uint32_t code_of(const governance_error_code code) {
  return static_cast<uint32_t>(code);
}

ballot::governance::governance_config make_scenario_config() {
  auto config = ballot::governance::governance_config{};
  config.voting_delay = 0;
  config.voting_period = 100;
  config.execution_delay = 50;
  config.quorum = 1000;
  config.approval_threshold_percent = 50;
  return config;
}

proposal_status_t state_of(governance_fixture& fixture,
                           const ballot::schema::proposal_id_t& id) {
  return std::get<proposal_status_t>(fixture.engine().state(id));
}

}  // namespace

TEST(engine_integration, scenario_a_majority_with_quorum_succeeds) {
  auto fixture = governance_fixture{"ballot_scenario_a", make_scenario_config()};
  auto v1 = make_account(1);
  auto v2 = make_account(2);
  auto v3 = make_account(3);
  fixture.set_power(v1, 400);
  fixture.set_power(v2, 400);
  fixture.set_power(v3, 300);

  auto created = fixture.engine().propose(v1, governance_fixture::make_proposal(1));
  ASSERT_EQ(created.code, kOk);
  auto id = fixture.proposal_id_of(created);
  EXPECT_EQ(state_of(fixture, id), proposal_status_t::active);

  EXPECT_EQ(fixture.engine().cast_vote(v1, id, vote_choice_t::in_favor).code,
            kOk);
  EXPECT_EQ(fixture.engine().cast_vote(v2, id, vote_choice_t::in_favor).code,
            kOk);
  EXPECT_EQ(fixture.engine().cast_vote(v3, id, vote_choice_t::against).code,
            kOk);

  fixture.advance(101);
  auto proposal = std::get<ballot::schema::proposal_state_t>(
      fixture.engine().proposal(id));
  EXPECT_EQ(proposal.tally.in_favor, 800);
  EXPECT_EQ(proposal.tally.against, 300);
  EXPECT_EQ(state_of(fixture, id), proposal_status_t::succeeded);
}

TEST(engine_integration, scenario_b_below_quorum_is_defeated) {
  auto fixture = governance_fixture{"ballot_scenario_b", make_scenario_config()};
  auto v1 = make_account(1);
  auto v3 = make_account(3);
  fixture.set_power(v1, 400);
  fixture.set_power(v3, 300);

  auto id = fixture.proposal_id_of(
      fixture.engine().propose(v1, governance_fixture::make_proposal(2)));
  EXPECT_EQ(fixture.engine().cast_vote(v3, id, vote_choice_t::against).code,
            kOk);
  fixture.advance(101);
  EXPECT_EQ(state_of(fixture, id), proposal_status_t::defeated);

  auto queued = fixture.engine().queue(v1, id);
  EXPECT_EQ(queued.code, code_of(governance_error_code::illegal_transition));
}

TEST(engine_integration, threshold_boundary_sixty_forty) {
  for (const auto& [threshold, expected] :
       {std::pair{60u, proposal_status_t::succeeded},
        std::pair{61u, proposal_status_t::defeated}}) {
    auto config = make_scenario_config();
    config.quorum = 100;
    config.approval_threshold_percent = threshold;
    auto fixture = governance_fixture{"ballot_threshold", config};
    auto yes = make_account(1);
    auto no = make_account(2);
    fixture.set_power(yes, 60);
    fixture.set_power(no, 40);

    auto id = fixture.proposal_id_of(
        fixture.engine().propose(yes, governance_fixture::make_proposal(3)));
    ASSERT_EQ(fixture.engine().cast_vote(yes, id, vote_choice_t::in_favor).code,
              kOk);
    ASSERT_EQ(fixture.engine().cast_vote(no, id, vote_choice_t::against).code,
              kOk);
    fixture.advance(101);
    EXPECT_EQ(state_of(fixture, id), expected) << "threshold " << threshold;
  }
}

TEST(engine_integration, double_vote_is_rejected_without_side_effects) {
  auto fixture = governance_fixture{"ballot_double_vote", make_scenario_config()};
  auto voter = make_account(1);
  fixture.set_power(voter, 500);
  auto id = fixture.proposal_id_of(
      fixture.engine().propose(voter, governance_fixture::make_proposal(4)));

  auto first = fixture.engine().cast_vote(voter, id, vote_choice_t::in_favor);
  ASSERT_EQ(first.code, kOk);
  auto events_before = fixture.engine().events(1, 1000).size();

  auto second = fixture.engine().cast_vote(voter, id, vote_choice_t::against);
  EXPECT_EQ(second.code, code_of(governance_error_code::already_voted));
  EXPECT_TRUE(second.events.empty());
  EXPECT_EQ(fixture.engine().events(1, 1000).size(), events_before);

  auto proposal = std::get<ballot::schema::proposal_state_t>(
      fixture.engine().proposal(id));
  EXPECT_EQ(proposal.tally.in_favor, 500);
  EXPECT_EQ(proposal.tally.against, 0);
}

TEST(engine_integration, full_lifecycle_with_timelock_and_no_double_execution) {
  auto fixture = governance_fixture{"ballot_lifecycle", make_scenario_config()};
  auto voter = make_account(1);
  fixture.set_power(voter, 1000);
  auto proposal = governance_fixture::make_proposal(5);
  auto id = fixture.proposal_id_of(fixture.engine().propose(voter, proposal));
  ASSERT_EQ(fixture.engine().cast_vote(voter, id, vote_choice_t::in_favor).code,
            kOk);

  auto early_queue = fixture.engine().queue(voter, id);
  EXPECT_EQ(early_queue.code,
            code_of(governance_error_code::illegal_transition));

  fixture.advance(101);
  auto queued = fixture.engine().queue(voter, id);
  ASSERT_EQ(queued.code, kOk);
  EXPECT_EQ(state_of(fixture, id), proposal_status_t::queued);

  auto too_soon = fixture.engine().execute(voter, id);
  EXPECT_EQ(too_soon.code, code_of(governance_error_code::timelock_not_elapsed));
  EXPECT_TRUE(ballot::schema::is_retryable(
      governance_error_code::timelock_not_elapsed));
  EXPECT_TRUE(fixture.calls().empty());

  fixture.advance(50);
  auto executed = fixture.engine().execute(voter, id);
  ASSERT_EQ(executed.code, kOk);
  EXPECT_EQ(state_of(fixture, id), proposal_status_t::executed);
  ASSERT_EQ(fixture.calls().size(), 1u);
  EXPECT_EQ(fixture.calls()[0].target, proposal.targets[0]);
  EXPECT_EQ(fixture.calls()[0].value, proposal.values[0]);
  EXPECT_EQ(fixture.calls()[0].payload, proposal.payloads[0]);

  auto again = fixture.engine().execute(voter, id);
  EXPECT_EQ(again.code, code_of(governance_error_code::already_executed));
  auto requeue = fixture.engine().queue(voter, id);
  EXPECT_EQ(requeue.code, code_of(governance_error_code::already_executed));
  EXPECT_EQ(fixture.calls().size(), 1u);
  EXPECT_EQ(state_of(fixture, id), proposal_status_t::executed);
}

TEST(engine_integration, failed_action_keeps_proposal_queued_and_retryable) {
  auto config = make_scenario_config();
  config.execution_delay = 0;
  auto fixture = governance_fixture{"ballot_failed_exec", config};
  auto voter = make_account(1);
  fixture.set_power(voter, 1000);

  auto proposal = ballot::schema::propose_proposal_t{};
  proposal.targets = {make_account(0xB1), make_account(0xB2),
                      make_account(0xB3)};
  proposal.values = {amount_t{1}, amount_t{2}, amount_t{3}};
  proposal.payloads = {ballot::schema::bytes_t{1}, ballot::schema::bytes_t{2},
                       ballot::schema::bytes_t{3}};
  proposal.description = ballot::schema::make_bytes(std::string_view{"batch"});
  auto id = fixture.proposal_id_of(fixture.engine().propose(voter, proposal));
  ASSERT_EQ(fixture.engine().cast_vote(voter, id, vote_choice_t::in_favor).code,
            kOk);
  fixture.advance(101);
  ASSERT_EQ(fixture.engine().queue(voter, id).code, kOk);

  fixture.fail_target(make_account(0xB2), "paused");
  auto failed = fixture.engine().execute(voter, id);
  EXPECT_EQ(failed.code, code_of(governance_error_code::target_call_failed));
  EXPECT_EQ(failed.info, "action 1");
  EXPECT_EQ(ballot::schema::make_string(failed.data), "paused");
  EXPECT_EQ(state_of(fixture, id), proposal_status_t::queued);
  ASSERT_EQ(fixture.reverted().size(), 1u);
  EXPECT_EQ(fixture.reverted()[0].target, make_account(0xB1));

  fixture.heal_target(make_account(0xB2));
  auto retried = fixture.engine().execute(voter, id);
  EXPECT_EQ(retried.code, kOk);
  EXPECT_EQ(state_of(fixture, id), proposal_status_t::executed);
}

TEST(engine_integration, snapshot_isolation_ignores_late_delegation) {
  auto config = make_scenario_config();
  config.voting_delay = 10;
  config.quorum = 0;
  auto fixture = governance_fixture{"ballot_snapshot", config};
  auto whale = make_account(1);
  auto borrower = make_account(2);
  fixture.set_power(whale, 1000);
  fixture.set_power(borrower, 10);

  auto id = fixture.proposal_id_of(
      fixture.engine().propose(whale, governance_fixture::make_proposal(6)));
  fixture.advance(11);
  ASSERT_EQ(fixture.engine().delegate(whale, borrower, 900).code, kOk);

  auto weight = fixture.engine().voting_weight(id, borrower);
  EXPECT_EQ(std::get<amount_t>(weight), 10);
  auto cast = fixture.engine().cast_vote(borrower, id, vote_choice_t::in_favor);
  ASSERT_EQ(cast.code, kOk);
  EXPECT_EQ(fixture.encoder().decode<amount_t>(
                ballot::schema::bytes_view_t{cast.data.data(), cast.data.size()}),
            10);

  // The delegation counts for proposals whose snapshot is later.
  auto later = fixture.proposal_id_of(
      fixture.engine().propose(whale, governance_fixture::make_proposal(7)));
  EXPECT_EQ(std::get<amount_t>(fixture.engine().voting_weight(later, borrower)),
            910);
  EXPECT_EQ(std::get<amount_t>(fixture.engine().voting_weight(later, whale)),
            100);
}

TEST(engine_integration, delegation_at_voting_start_cannot_double_count) {
  auto config = make_scenario_config();
  config.quorum = 0;
  auto fixture = governance_fixture{"ballot_snapshot_instant", config};
  auto holder = make_account(1);
  auto borrower = make_account(2);
  fixture.set_power(holder, 100);

  auto id = fixture.proposal_id_of(
      fixture.engine().propose(holder, governance_fixture::make_proposal(8)));
  ASSERT_EQ(state_of(fixture, id), proposal_status_t::active);

  ASSERT_EQ(fixture.engine().cast_vote(holder, id, vote_choice_t::in_favor).code,
            kOk);
  ASSERT_EQ(fixture.engine().delegate(holder, borrower, 100).code, kOk);
  EXPECT_EQ(std::get<amount_t>(fixture.engine().voting_weight(id, borrower)), 0);
  EXPECT_EQ(fixture.engine().cast_vote(borrower, id, vote_choice_t::in_favor).code,
            code_of(governance_error_code::zero_voting_weight));

  // Revoking at the same instant cannot lend the power back a second time.
  ASSERT_EQ(fixture.engine().revoke(holder, borrower, 100).code, kOk);
  EXPECT_EQ(fixture.engine().cast_vote(borrower, id, vote_choice_t::in_favor).code,
            code_of(governance_error_code::zero_voting_weight));

  auto proposal = std::get<ballot::schema::proposal_state_t>(
      fixture.engine().proposal(id));
  EXPECT_EQ(proposal.tally.in_favor, 100);
  EXPECT_EQ(proposal.tally.voters, 1u);
}

TEST(engine_integration, delegation_conservation_through_engine) {
  auto fixture = governance_fixture{"ballot_conservation", make_scenario_config()};
  auto a = make_account(1);
  auto b = make_account(2);
  auto c = make_account(3);
  fixture.set_power(a, 100);
  fixture.set_power(b, 100);

  ASSERT_EQ(fixture.engine().delegate(a, b, 40).code, kOk);
  ASSERT_EQ(fixture.engine().delegate(b, c, 100).code, kOk);
  ASSERT_EQ(fixture.engine().revoke(a, b, 15).code, kOk);

  auto now = fixture.now();
  EXPECT_EQ(fixture.engine().power_of(a, now), 75);
  EXPECT_EQ(fixture.engine().power_of(b, now), 25);
  EXPECT_EQ(fixture.engine().power_of(c, now), 100);
  EXPECT_EQ(fixture.engine().delegation(a, b), 25);

  EXPECT_EQ(fixture.engine().revoke(a, b, 26).code,
            code_of(governance_error_code::insufficient_delegation));
  EXPECT_EQ(fixture.engine().delegate(a, a, 1).code,
            code_of(governance_error_code::self_delegation));
  EXPECT_EQ(fixture.engine().delegate(a, c, 76).code,
            code_of(governance_error_code::insufficient_power));
}

TEST(engine_integration, cancel_authorization_and_states) {
  auto config = make_scenario_config();
  auto guardian = make_account(9);
  config.cancellers = {guardian};
  auto fixture = governance_fixture{"ballot_cancel", config};
  auto proposer = make_account(1);
  auto stranger = make_account(2);
  fixture.set_power(proposer, 2000);

  auto first = fixture.proposal_id_of(
      fixture.engine().propose(proposer, governance_fixture::make_proposal(8)));
  EXPECT_EQ(fixture.engine().cancel(stranger, first).code,
            code_of(governance_error_code::not_authorized));
  EXPECT_EQ(fixture.engine().cancel(proposer, first).code, kOk);
  EXPECT_EQ(state_of(fixture, first), proposal_status_t::cancelled);
  EXPECT_EQ(fixture.engine().cast_vote(proposer, first,
                                       vote_choice_t::in_favor)
                .code,
            code_of(governance_error_code::illegal_transition));

  auto second = fixture.proposal_id_of(
      fixture.engine().propose(proposer, governance_fixture::make_proposal(9)));
  EXPECT_EQ(fixture.engine().cancel(guardian, second).code, kOk);

  auto third = fixture.proposal_id_of(
      fixture.engine().propose(proposer, governance_fixture::make_proposal(10)));
  ASSERT_EQ(
      fixture.engine().cast_vote(proposer, third, vote_choice_t::in_favor).code,
      kOk);
  fixture.advance(101);
  EXPECT_EQ(fixture.engine().cancel(proposer, third).code,
            code_of(governance_error_code::illegal_transition));
  ASSERT_EQ(fixture.engine().queue(proposer, third).code, kOk);
  EXPECT_EQ(fixture.engine().cancel(guardian, third).code,
            code_of(governance_error_code::illegal_transition));
}

TEST(engine_integration, queue_and_execute_respect_role_lists) {
  auto config = make_scenario_config();
  config.execution_delay = 0;
  auto queuer = make_account(7);
  auto executor = make_account(8);
  config.queuers = {queuer};
  config.executors = {executor};
  auto fixture = governance_fixture{"ballot_roles", config};
  auto voter = make_account(1);
  fixture.set_power(voter, 1000);

  auto id = fixture.proposal_id_of(
      fixture.engine().propose(voter, governance_fixture::make_proposal(11)));
  ASSERT_EQ(fixture.engine().cast_vote(voter, id, vote_choice_t::in_favor).code,
            kOk);
  fixture.advance(101);

  EXPECT_EQ(fixture.engine().queue(voter, id).code,
            code_of(governance_error_code::not_authorized));
  ASSERT_EQ(fixture.engine().queue(queuer, id).code, kOk);
  EXPECT_EQ(fixture.engine().execute(queuer, id).code,
            code_of(governance_error_code::not_authorized));
  EXPECT_EQ(fixture.engine().execute(executor, id).code, kOk);
}

TEST(engine_integration, state_survives_engine_restart) {
  auto db = ballot::testing::make_db_path("ballot_restart");
  auto config = make_scenario_config();
  auto power = [](const ballot::schema::account_id_t&,
                  ballot::schema::timestamp_milliseconds_t) {
    return amount_t{1000};
  };
  auto now = ballot::schema::timestamp_milliseconds_t{500};
  auto gateway = [] {
    return ballot::governance::execution_gateway{
        [](const ballot::schema::account_id_t&, const amount_t&,
           const ballot::schema::bytes_t&) {
          return ballot::governance::invocation_result{.success = true,
                                                       .return_data = {}};
        }};
  };
  auto id = ballot::schema::proposal_id_t{};
  {
    auto encoder = ballot::governance::encoder_t{};
    auto storage =
        ballot::storage::make_storage<ballot::storage::rocksdb_storage_tag>(db);
    auto engine = ballot::governance::engine{
        encoder, storage, config, power, gateway(), [&now] { return now; }};
    auto created =
        engine.propose(make_account(1), governance_fixture::make_proposal(12));
    ASSERT_EQ(created.code, kOk);
    id = encoder.decode<ballot::schema::proposal_id_t>(
        ballot::schema::bytes_view_t{created.data.data(), created.data.size()});
    ASSERT_EQ(engine.cast_vote(make_account(1), id, vote_choice_t::in_favor).code,
              kOk);
  }
  {
    auto encoder = ballot::governance::encoder_t{};
    auto storage =
        ballot::storage::make_storage<ballot::storage::rocksdb_storage_tag>(db);
    now = 450;
    auto engine = ballot::governance::engine{
        encoder, storage, config, power, gateway(), [&now] { return now; }};
    EXPECT_EQ(engine.delegate(make_account(1), make_account(2), 1).code,
              code_of(governance_error_code::clock_regression));

    now = 700;
    EXPECT_EQ(std::get<proposal_status_t>(engine.state(id)),
              proposal_status_t::succeeded);
    auto events = engine.events(1, 100);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type,
              ballot::schema::governance_event_type_t::proposal_created);
    EXPECT_EQ(events[1].type, ballot::schema::governance_event_type_t::vote_cast);
    ASSERT_EQ(engine.queue(make_account(1), id).code, kOk);
    EXPECT_EQ(engine.events(3, 100).front().sequence, 3u);
  }
  ballot::testing::remove_path(db);
}
