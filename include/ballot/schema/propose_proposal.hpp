#pragma once
#include <ballot/schema/primitives.hpp>
#include <ballot/schema/vote_weighting.hpp>
#include <optional>
#include <vector>

// Schema type: propose proposal.
// Governance workflow: proposal submission. Unset overrides fall back to the
// deployment configuration.
namespace ballot::schema {

template <uint16_t Version>
struct propose_proposal;

template <>
struct propose_proposal<1> final {
  uint16_t version{1};
  std::vector<account_id_t> targets;
  std::vector<amount_t> values;
  std::vector<bytes_t> payloads;
  bytes_t description;
  std::optional<duration_milliseconds_t> voting_delay;
  std::optional<duration_milliseconds_t> voting_period;
  std::optional<amount_t> quorum;
  std::optional<uint32_t> approval_threshold_percent;
  std::optional<vote_weighting_t> weighting;
};

using propose_proposal_t = propose_proposal<1>;

}  // namespace ballot::schema
