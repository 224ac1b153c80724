#pragma once
#include <ballot/schema/primitives.hpp>
#include <ballot/schema/vote_tally.hpp>
#include <ballot/schema/vote_weighting.hpp>
#include <optional>
#include <vector>

// Schema type: proposal state.
// Governance workflow: the persisted proposal record. Voting parameters are
// frozen at creation; only the tally and the queued/executed/cancelled
// markers change afterwards.
namespace ballot::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  account_id_t proposer{};
  uint64_t sequence{};
  std::vector<account_id_t> targets;
  std::vector<amount_t> values;
  std::vector<bytes_t> payloads;
  bytes_t description;
  hash32_t description_hash{};
  hash32_t content_hash{};
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t voting_start{};
  timestamp_milliseconds_t voting_end{};
  duration_milliseconds_t execution_delay{};
  amount_t quorum{};
  uint32_t approval_threshold_percent{};
  vote_weighting_t weighting{vote_weighting_t::linear};
  bool abstain_counts_toward_approval{};
  vote_tally_t tally{};
  std::optional<timestamp_milliseconds_t> queued_at;
  std::optional<timestamp_milliseconds_t> execute_after;
  std::optional<timestamp_milliseconds_t> executed_at;
  std::optional<timestamp_milliseconds_t> cancelled_at;
  bool executed{};
  bool cancelled{};
};

using proposal_state_t = proposal_state<1>;

}  // namespace ballot::schema
