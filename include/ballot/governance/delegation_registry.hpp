#pragma once

#include <ballot/governance/backends.hpp>
#include <ballot/governance/voting_power.hpp>
#include <ballot/schema/delegation_edge.hpp>
#include <ballot/schema/governance_error_code.hpp>
#include <ballot/schema/power_checkpoint.hpp>
#include <ballot/schema/primitives.hpp>

#include <optional>
#include <vector>

namespace ballot::governance {

/// Delegation edges plus a per-account checkpoint log of delegated totals.
///
/// Each account's checkpoints are stored as one ascending vector, so a
/// historical query is a binary search. A checkpoint recorded at time t is
/// visible to live queries at every s with t <= s, and to proposal snapshots
/// only when t < s, since the snapshot instant itself is still writable.
class delegation_registry final {
 public:
  delegation_registry(encoder_t& encoder,
                      storage_t& storage,
                      voting_power_source_t power_source);

  /// Lend `amount` of `from`'s undelegated power to `to`.
  std::optional<ballot::schema::governance_error_code> delegate(
      const ballot::schema::account_id_t& from,
      const ballot::schema::account_id_t& to,
      const ballot::schema::amount_t& amount,
      ballot::schema::timestamp_milliseconds_t now);

  /// Return `amount` of a previous delegation from `to` back to `from`.
  std::optional<ballot::schema::governance_error_code> revoke(
      const ballot::schema::account_id_t& from,
      const ballot::schema::account_id_t& to,
      const ballot::schema::amount_t& amount,
      ballot::schema::timestamp_milliseconds_t now);

  /// Current amount lent along the edge; zero when none.
  ballot::schema::amount_t delegation(
      const ballot::schema::account_id_t& from,
      const ballot::schema::account_id_t& to) const;

  std::vector<ballot::schema::delegation_edge_t> delegations_from(
      const ballot::schema::account_id_t& from) const;

  ballot::schema::amount_t delegated_in(
      const ballot::schema::account_id_t& account,
      ballot::schema::timestamp_milliseconds_t at) const;
  ballot::schema::amount_t delegated_out(
      const ballot::schema::account_id_t& account,
      ballot::schema::timestamp_milliseconds_t at) const;

  /// Own power at `at` not yet lent to anyone.
  ballot::schema::amount_t spendable(
      const ballot::schema::account_id_t& account,
      ballot::schema::timestamp_milliseconds_t at) const;

  /// Effective power at `at`: own power minus delegated-out (floored at zero)
  /// plus delegated-in.
  ballot::schema::amount_t power_of(
      const ballot::schema::account_id_t& account,
      ballot::schema::timestamp_milliseconds_t at) const;

  /// Effective power frozen for a proposal whose voting starts at `snapshot`.
  /// Delegation changes made at or after `snapshot` are ignored.
  ballot::schema::amount_t snapshot_power_of(
      const ballot::schema::account_id_t& account,
      ballot::schema::timestamp_milliseconds_t snapshot) const;

 private:
  std::vector<ballot::schema::power_checkpoint_t> checkpoints(
      const ballot::schema::account_id_t& account) const;
  std::optional<ballot::schema::power_checkpoint_t> checkpoint_at(
      const ballot::schema::account_id_t& account,
      ballot::schema::timestamp_milliseconds_t at) const;
  std::optional<ballot::schema::power_checkpoint_t> checkpoint_before(
      const ballot::schema::account_id_t& account,
      ballot::schema::timestamp_milliseconds_t at) const;

  encoder_t& encoder_;
  storage_t& storage_;
  voting_power_source_t power_source_;
};

}  // namespace ballot::governance
