#pragma once

#include <ballot/governance/backends.hpp>
#include <ballot/governance/config.hpp>
#include <ballot/governance/delegation_registry.hpp>
#include <ballot/governance/execution_gateway.hpp>
#include <ballot/governance/proposal_store.hpp>
#include <ballot/governance/vote_ledger.hpp>
#include <ballot/governance/voting_power.hpp>
#include <ballot/schema/event_attribute.hpp>
#include <ballot/schema/governance_error_code.hpp>
#include <ballot/schema/governance_event.hpp>
#include <ballot/schema/operation_result.hpp>
#include <ballot/schema/primitives.hpp>
#include <ballot/schema/proposal_state.hpp>
#include <ballot/schema/proposal_status.hpp>
#include <ballot/schema/propose_proposal.hpp>
#include <ballot/schema/vote_choice.hpp>
#include <ballot/schema/vote_receipt.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>
#include <vector>

namespace ballot::governance {

/// Injected, read-only clock in milliseconds.
using time_source_t = std::function<ballot::schema::timestamp_milliseconds_t()>;

/// Proposal lifecycle coordinator: propose, vote, queue, execute, cancel and
/// delegation management over a single RocksDB-backed state.
///
/// Every public member runs under one mutex, so operations are serialized
/// and each either commits fully or leaves state untouched. Time-driven
/// statuses (active, succeeded, defeated) are derived on read, never stored.
class engine final {
 public:
  /// Construct the engine over existing encoder/storage backends.
  ///
  /// `config` is copied; proposals freeze the values they need at creation.
  /// The last observed clock value and event sequence are restored from
  /// storage.
  engine(encoder_t& encoder,
         storage_t& storage,
         governance_config config,
         voting_power_source_t power_source,
         execution_gateway gateway,
         time_source_t time_source,
         reputation_source_t reputation_source = {});

  /// Create a proposal. On success `data` is the SCALE-encoded proposal id.
  ballot::schema::operation_result_t propose(
      const ballot::schema::account_id_t& proposer,
      const ballot::schema::propose_proposal_t& proposal);

  /// Cast a vote. On success `data` is the SCALE-encoded tallied weight.
  ballot::schema::operation_result_t cast_vote(
      const ballot::schema::account_id_t& voter,
      const ballot::schema::proposal_id_t& proposal_id,
      ballot::schema::vote_choice_t choice);

  /// Queue a succeeded proposal behind its execution delay.
  ballot::schema::operation_result_t queue(
      const ballot::schema::account_id_t& caller,
      const ballot::schema::proposal_id_t& proposal_id);

  /// Run every action of a queued proposal whose timelock has elapsed.
  ///
  /// A failing action leaves the proposal queued; `data` then carries the
  /// failing call's return data and `info` its index.
  ballot::schema::operation_result_t execute(
      const ballot::schema::account_id_t& caller,
      const ballot::schema::proposal_id_t& proposal_id);

  /// Cancel a pending or active proposal.
  ballot::schema::operation_result_t cancel(
      const ballot::schema::account_id_t& caller,
      const ballot::schema::proposal_id_t& proposal_id);

  ballot::schema::operation_result_t delegate(
      const ballot::schema::account_id_t& from,
      const ballot::schema::account_id_t& to,
      const ballot::schema::amount_t& amount);

  ballot::schema::operation_result_t revoke(
      const ballot::schema::account_id_t& from,
      const ballot::schema::account_id_t& to,
      const ballot::schema::amount_t& amount);

  ballot::schema::store_result_t<ballot::schema::proposal_state_t> proposal(
      const ballot::schema::proposal_id_t& proposal_id) const;
  ballot::schema::store_result_t<ballot::schema::proposal_status_t> state(
      const ballot::schema::proposal_id_t& proposal_id) const;
  ballot::schema::store_result_t<ballot::schema::vote_receipt_t> receipt(
      const ballot::schema::proposal_id_t& proposal_id,
      const ballot::schema::account_id_t& voter) const;
  std::vector<ballot::schema::vote_receipt_t> receipts(
      const ballot::schema::proposal_id_t& proposal_id) const;
  std::vector<ballot::schema::proposal_state_t> proposals() const;
  ballot::schema::amount_t power_of(
      const ballot::schema::account_id_t& account,
      ballot::schema::timestamp_milliseconds_t at) const;
  ballot::schema::store_result_t<ballot::schema::amount_t> voting_weight(
      const ballot::schema::proposal_id_t& proposal_id,
      const ballot::schema::account_id_t& account) const;
  ballot::schema::amount_t delegation(
      const ballot::schema::account_id_t& from,
      const ballot::schema::account_id_t& to) const;

  /// Persisted events with sequence in [from_sequence, to_sequence].
  std::vector<ballot::schema::governance_event_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  const governance_config& config() const;

 private:
  /// Read the clock; a value earlier than the last committed one is a
  /// clock_regression.
  std::optional<ballot::schema::timestamp_milliseconds_t> observe_clock();
  /// max(clock, last committed time), for read paths.
  ballot::schema::timestamp_milliseconds_t read_clock() const;

  ballot::schema::governance_event_t make_event(
      ballot::schema::governance_event_type_t type,
      ballot::schema::timestamp_milliseconds_t now,
      std::vector<ballot::schema::event_attribute_t> attributes);

  /// Persist the staged events and the observed clock in one batch and move
  /// them into `result`.
  void commit(ballot::schema::operation_result_t& result,
              std::vector<ballot::schema::governance_event_t> staged,
              ballot::schema::timestamp_milliseconds_t now);

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  governance_config config_;
  time_source_t time_source_;
  execution_gateway gateway_;
  proposal_store proposals_;
  delegation_registry delegations_;
  vote_ledger votes_;
  ballot::schema::timestamp_milliseconds_t last_observed_{};
  uint64_t next_event_sequence_{1};
};

}  // namespace ballot::governance
