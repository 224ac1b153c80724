#pragma once

#include <ballot/governance/backends.hpp>
#include <ballot/governance/delegation_registry.hpp>
#include <ballot/governance/proposal_store.hpp>
#include <ballot/governance/voting_power.hpp>
#include <ballot/schema/governance_error_code.hpp>
#include <ballot/schema/primitives.hpp>
#include <ballot/schema/vote_choice.hpp>
#include <ballot/schema/vote_receipt.hpp>

#include <vector>

namespace ballot::governance {

/// One receipt per (proposal, voter); the receipt and the tally change are
/// committed together.
class vote_ledger final {
 public:
  vote_ledger(encoder_t& encoder,
              storage_t& storage,
              proposal_store& proposals,
              const delegation_registry& delegations,
              reputation_source_t reputation_source = {});

  ballot::schema::store_result_t<ballot::schema::vote_receipt_t> cast_vote(
      const ballot::schema::proposal_id_t& proposal_id,
      const ballot::schema::account_id_t& voter,
      ballot::schema::vote_choice_t choice,
      ballot::schema::timestamp_milliseconds_t now);

  ballot::schema::store_result_t<ballot::schema::vote_receipt_t> receipt_of(
      const ballot::schema::proposal_id_t& proposal_id,
      const ballot::schema::account_id_t& voter) const;

  std::vector<ballot::schema::vote_receipt_t> receipts(
      const ballot::schema::proposal_id_t& proposal_id) const;

  /// Weight `voter` would cast on `proposal`: snapshot power at voting start
  /// mapped through the proposal's weighting mode.
  ballot::schema::amount_t voting_weight(
      const ballot::schema::proposal_state_t& proposal,
      const ballot::schema::account_id_t& voter) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  proposal_store& proposals_;
  const delegation_registry& delegations_;
  reputation_source_t reputation_source_;
};

}  // namespace ballot::governance
