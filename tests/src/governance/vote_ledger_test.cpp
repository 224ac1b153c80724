#include <ballot/governance/vote_ledger.hpp>
#include <ballot/testing/common.hpp>
#include <gtest/gtest.h>

#include <map>
#include <string>
#include <variant>

namespace {

using ballot::schema::amount_t;
using ballot::schema::governance_error_code;
using ballot::schema::vote_choice_t;

class vote_ledger_test : public ::testing::Test {
 protected:
  vote_ledger_test()
      : db_path_{ballot::testing::make_db_path("ballot_vote_ledger")},
        storage_{ballot::storage::make_storage<
            ballot::storage::rocksdb_storage_tag>(db_path_)},
        proposals_{encoder_, storage_},
        delegations_{encoder_, storage_,
                     [this](const ballot::schema::account_id_t& account,
                            const ballot::schema::timestamp_milliseconds_t) {
                       auto it = power_.find(account);
                       return it == std::end(power_) ? amount_t{0}
                                                     : it->second;
                     }},
        ledger_{encoder_, storage_, proposals_, delegations_,
                [this](const ballot::schema::account_id_t& account,
                       const ballot::schema::timestamp_milliseconds_t) {
                  auto it = reputation_.find(account);
                  return it == std::end(reputation_) ? uint32_t{0}
                                                     : it->second;
                }} {
    config_.voting_delay = 10;
    config_.voting_period = 100;
    power_[alice_] = 400;
    power_[bob_] = 300;
  }

  ~vote_ledger_test() override { ballot::testing::remove_path(db_path_); }

  ballot::schema::proposal_id_t make_proposal(
      const ballot::schema::vote_weighting_t weighting =
          ballot::schema::vote_weighting_t::linear) {
    auto request = ballot::schema::propose_proposal_t{};
    request.targets = {ballot::testing::make_account(0xEE)};
    request.values = {amount_t{0}};
    request.payloads = {ballot::schema::bytes_t{}};
    request.description = ballot::schema::make_bytes(
        std::string{"ledger "} + std::to_string(++counter_));
    request.weighting = weighting;
    auto created = proposals_.create(alice_, request, 0, config_);
    return std::get<ballot::schema::proposal_state_t>(created).proposal_id;
  }

  ballot::schema::vote_tally_t tally_of(
      const ballot::schema::proposal_id_t& id) {
    return std::get<ballot::schema::proposal_state_t>(proposals_.get(id)).tally;
  }

  ballot::schema::account_id_t alice_{ballot::testing::make_account(1)};
  ballot::schema::account_id_t bob_{ballot::testing::make_account(2)};
  ballot::schema::account_id_t nobody_{ballot::testing::make_account(3)};
  std::map<ballot::schema::account_id_t, amount_t> power_;
  std::map<ballot::schema::account_id_t, uint32_t> reputation_;
  int counter_{};
  std::string db_path_;
  ballot::governance::encoder_t encoder_;
  ballot::governance::storage_t storage_;
  ballot::governance::governance_config config_;
  ballot::governance::proposal_store proposals_;
  ballot::governance::delegation_registry delegations_;
  ballot::governance::vote_ledger ledger_;
};

}  // namespace

TEST_F(vote_ledger_test, vote_records_receipt_and_tally) {
  auto id = make_proposal();
  auto cast = ledger_.cast_vote(id, alice_, vote_choice_t::in_favor, 10);
  ASSERT_TRUE(std::holds_alternative<ballot::schema::vote_receipt_t>(cast));
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(cast).weight, 400);

  auto receipt = ledger_.receipt_of(id, alice_);
  ASSERT_TRUE(std::holds_alternative<ballot::schema::vote_receipt_t>(receipt));
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(receipt).choice,
            vote_choice_t::in_favor);
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(receipt).cast_at, 10u);

  auto tally = tally_of(id);
  EXPECT_EQ(tally.in_favor, 400);
  EXPECT_EQ(tally.against, 0);
  EXPECT_EQ(tally.voters, 1u);
}

TEST_F(vote_ledger_test, second_vote_is_rejected_and_tally_unchanged) {
  auto id = make_proposal();
  ASSERT_TRUE(std::holds_alternative<ballot::schema::vote_receipt_t>(
      ledger_.cast_vote(id, bob_, vote_choice_t::against, 20)));
  auto again = ledger_.cast_vote(id, bob_, vote_choice_t::in_favor, 21);
  ASSERT_TRUE(std::holds_alternative<governance_error_code>(again));
  EXPECT_EQ(std::get<governance_error_code>(again),
            governance_error_code::already_voted);

  auto tally = tally_of(id);
  EXPECT_EQ(tally.against, 300);
  EXPECT_EQ(tally.in_favor, 0);
  EXPECT_EQ(tally.voters, 1u);
  EXPECT_EQ(ledger_.receipts(id).size(), 1u);
}

TEST_F(vote_ledger_test, voting_outside_window_is_not_open) {
  auto id = make_proposal();
  auto early = ledger_.cast_vote(id, alice_, vote_choice_t::in_favor, 9);
  EXPECT_EQ(std::get<governance_error_code>(early),
            governance_error_code::voting_not_open);
  auto late = ledger_.cast_vote(id, alice_, vote_choice_t::in_favor, 111);
  EXPECT_EQ(std::get<governance_error_code>(late),
            governance_error_code::voting_not_open);
  EXPECT_TRUE(std::holds_alternative<ballot::schema::vote_receipt_t>(
      ledger_.cast_vote(id, alice_, vote_choice_t::in_favor, 110)));
}

TEST_F(vote_ledger_test, zero_weight_and_missing_proposal_are_rejected) {
  auto id = make_proposal();
  auto zero = ledger_.cast_vote(id, nobody_, vote_choice_t::abstain, 10);
  EXPECT_EQ(std::get<governance_error_code>(zero),
            governance_error_code::zero_voting_weight);
  EXPECT_EQ(std::get<governance_error_code>(ledger_.receipt_of(id, nobody_)),
            governance_error_code::receipt_missing);

  auto missing = ledger_.cast_vote(ballot::testing::make_hash(77), alice_,
                                   vote_choice_t::in_favor, 10);
  EXPECT_EQ(std::get<governance_error_code>(missing),
            governance_error_code::proposal_missing);
}

TEST_F(vote_ledger_test, weighting_mode_is_fixed_per_proposal) {
  reputation_[alice_] = 50;
  auto quadratic = make_proposal(ballot::schema::vote_weighting_t::quadratic);
  auto reputation = make_proposal(ballot::schema::vote_weighting_t::reputation);

  auto q = ledger_.cast_vote(quadratic, alice_, vote_choice_t::in_favor, 10);
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(q).weight, 20);
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(q).snapshot_power, 400);

  auto r = ledger_.cast_vote(reputation, alice_, vote_choice_t::in_favor, 10);
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(r).weight, 600);
}

TEST_F(vote_ledger_test, weight_uses_power_at_voting_start) {
  auto id = make_proposal();
  // Voting starts at 10; a delegation at 11 must not count.
  ASSERT_FALSE(delegations_.delegate(alice_, bob_, 100, 11).has_value());
  auto cast = ledger_.cast_vote(id, bob_, vote_choice_t::in_favor, 12);
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(cast).weight, 300);
}

TEST_F(vote_ledger_test, delegation_at_voting_start_instant_is_not_counted) {
  auto id = make_proposal();
  ASSERT_FALSE(delegations_.delegate(alice_, bob_, 100, 10).has_value());
  auto cast = ledger_.cast_vote(id, bob_, vote_choice_t::in_favor, 10);
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(cast).weight, 300);
  EXPECT_EQ(std::get<ballot::schema::vote_receipt_t>(cast).snapshot_power, 300);
}
