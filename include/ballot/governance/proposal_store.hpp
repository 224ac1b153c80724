#pragma once

#include <ballot/governance/backends.hpp>
#include <ballot/governance/config.hpp>
#include <ballot/schema/governance_error_code.hpp>
#include <ballot/schema/primitives.hpp>
#include <ballot/schema/proposal_state.hpp>
#include <ballot/schema/proposal_status.hpp>
#include <ballot/schema/propose_proposal.hpp>
#include <ballot/schema/vote_choice.hpp>
#include <ballot/storage/storage.hpp>

#include <optional>
#include <vector>

namespace ballot::governance {

/// Status of `proposal` as observed at `now`.
///
/// Recorded flags win; otherwise the status follows from the voting window and
/// the tally.
ballot::schema::proposal_status_t resolve_status(
    const ballot::schema::proposal_state_t& proposal,
    ballot::schema::timestamp_milliseconds_t now);

/// Total weighted participation is non-zero and at least the frozen quorum.
bool quorum_reached(const ballot::schema::proposal_state_t& proposal);

/// in_favor * 100 >= threshold * denominator, with a non-zero denominator.
bool approval_reached(const ballot::schema::proposal_state_t& proposal);

/// Identity of a proposal's actions, used for duplicate detection.
ballot::schema::hash32_t make_content_hash(
    const std::vector<ballot::schema::account_id_t>& targets,
    const std::vector<ballot::schema::amount_t>& values,
    const std::vector<ballot::schema::bytes_t>& payloads,
    const ballot::schema::hash32_t& description_hash);

/// Persistence and lifecycle bookkeeping for proposals.
class proposal_store final {
 public:
  proposal_store(encoder_t& encoder, storage_t& storage);

  /// Validate and persist a new proposal in the pending state.
  ///
  /// Voting parameters come from `proposal` where set and from `config`
  /// otherwise; both are frozen into the stored record.
  ballot::schema::store_result_t<ballot::schema::proposal_state_t> create(
      const ballot::schema::account_id_t& proposer,
      const ballot::schema::propose_proposal_t& proposal,
      ballot::schema::timestamp_milliseconds_t now,
      const governance_config& config);

  ballot::schema::store_result_t<ballot::schema::proposal_state_t> get(
      const ballot::schema::proposal_id_t& proposal_id) const;

  /// Move a proposal from `from` to `to`.
  ///
  /// Fails with illegal_transition when `from` is not the status at `now` or
  /// the edge is not part of the lifecycle.
  std::optional<ballot::schema::governance_error_code> transition(
      const ballot::schema::proposal_id_t& proposal_id,
      ballot::schema::proposal_status_t from,
      ballot::schema::proposal_status_t to,
      ballot::schema::timestamp_milliseconds_t now);

  /// Add `weight` to the tally bucket for `choice` and return the encoded
  /// record for the caller's write batch.
  ballot::storage::key_value_entry_t stage_vote(
      ballot::schema::proposal_state_t& proposal,
      ballot::schema::vote_choice_t choice,
      const ballot::schema::amount_t& weight);

  /// All proposals in creation order.
  std::vector<ballot::schema::proposal_state_t> list() const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace ballot::governance
