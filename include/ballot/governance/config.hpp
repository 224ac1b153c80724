#pragma once

#include <ballot/schema/primitives.hpp>
#include <ballot/schema/vote_weighting.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ballot::governance {

/// Deployment-wide governance parameters.
///
/// Values are copied into each proposal at creation, so changing the config
/// never alters proposals that already exist.
struct governance_config final {
  ballot::schema::duration_milliseconds_t voting_delay{0};
  ballot::schema::duration_milliseconds_t voting_period{604'800'000};
  ballot::schema::duration_milliseconds_t execution_delay{172'800'000};
  ballot::schema::amount_t quorum{};
  uint32_t approval_threshold_percent{50};
  ballot::schema::amount_t proposal_threshold{};
  ballot::schema::vote_weighting_t weighting{
      ballot::schema::vote_weighting_t::linear};
  bool abstain_counts_toward_approval{false};
  uint32_t max_actions{16};
  /// Accounts allowed to cancel any proposal, in addition to its proposer.
  std::vector<ballot::schema::account_id_t> cancellers;
  /// Accounts allowed to queue. Empty means anyone.
  std::vector<ballot::schema::account_id_t> queuers;
  /// Accounts allowed to execute. Empty means anyone.
  std::vector<ballot::schema::account_id_t> executors;
};

/// Check invariants; on failure `error` names the offending field.
bool validate_config(const governance_config& config, std::string& error);

/// Read the `[governance]` section of an INI file into `config`.
///
/// Keys absent from the file keep the value already in `config`. Returns
/// false with a human-readable `error` on parse or validation failure.
bool load_config(std::string_view path,
                 governance_config& config,
                 std::string& error);

bool is_listed(const std::vector<ballot::schema::account_id_t>& accounts,
               const ballot::schema::account_id_t& account);

}  // namespace ballot::governance
