#include <ballot/governance/proposal_store.hpp>

#include <ballot/blake3/hash.hpp>
#include <ballot/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <tuple>
#include <utility>

using namespace ballot::schema;

namespace {

using big_int_t = boost::multiprecision::cpp_int;

amount_t saturating_add(const amount_t& lhs, const amount_t& rhs) {
  auto sum = big_int_t{lhs} + big_int_t{rhs};
  if (sum > big_int_t{std::numeric_limits<amount_t>::max()}) {
    return std::numeric_limits<amount_t>::max();
  }
  return static_cast<amount_t>(sum);
}

bool adds_without_overflow(const uint64_t lhs, const uint64_t rhs) {
  return lhs <= std::numeric_limits<uint64_t>::max() - rhs;
}

std::optional<governance_error_code> validate_proposal(
    const propose_proposal_t& proposal,
    const timestamp_milliseconds_t now,
    const ballot::governance::governance_config& config) {
  if (proposal.targets.empty() || proposal.description.empty()) {
    return governance_error_code::invalid_proposal;
  }
  if (proposal.targets.size() != proposal.values.size() ||
      proposal.targets.size() != proposal.payloads.size()) {
    return governance_error_code::invalid_proposal;
  }
  if (proposal.targets.size() > config.max_actions) {
    return governance_error_code::invalid_proposal;
  }
  auto threshold = proposal.approval_threshold_percent.value_or(
      config.approval_threshold_percent);
  if (threshold == 0 || threshold > 100) {
    return governance_error_code::invalid_proposal;
  }
  auto delay = proposal.voting_delay.value_or(config.voting_delay);
  auto period = proposal.voting_period.value_or(config.voting_period);
  if (period == 0) {
    return governance_error_code::invalid_proposal;
  }
  // The window and the earliest timelock expiry must be representable.
  if (!adds_without_overflow(now, delay) ||
      !adds_without_overflow(now + delay, period) ||
      !adds_without_overflow(now + delay + period, config.execution_delay)) {
    return governance_error_code::invalid_proposal;
  }
  return std::nullopt;
}

bool is_allowed_edge(const proposal_status_t from, const proposal_status_t to) {
  switch (to) {
    case proposal_status_t::queued:
      return from == proposal_status_t::succeeded;
    case proposal_status_t::executed:
      return from == proposal_status_t::queued;
    case proposal_status_t::cancelled:
      return from == proposal_status_t::pending ||
             from == proposal_status_t::active;
    default:
      return false;
  }
}

}  // namespace

namespace ballot::governance {

proposal_status_t resolve_status(const proposal_state_t& proposal,
                                 const timestamp_milliseconds_t now) {
  if (proposal.cancelled) {
    return proposal_status_t::cancelled;
  }
  if (proposal.executed) {
    return proposal_status_t::executed;
  }
  if (proposal.queued_at) {
    return proposal_status_t::queued;
  }
  if (now < proposal.voting_start) {
    return proposal_status_t::pending;
  }
  if (now <= proposal.voting_end) {
    return proposal_status_t::active;
  }
  if (quorum_reached(proposal) && approval_reached(proposal)) {
    return proposal_status_t::succeeded;
  }
  return proposal_status_t::defeated;
}

bool quorum_reached(const proposal_state_t& proposal) {
  auto total = big_int_t{proposal.tally.in_favor} +
               big_int_t{proposal.tally.against} +
               big_int_t{proposal.tally.abstain};
  return total > 0 && total >= big_int_t{proposal.quorum};
}

bool approval_reached(const proposal_state_t& proposal) {
  auto denominator =
      big_int_t{proposal.tally.in_favor} + big_int_t{proposal.tally.against};
  if (proposal.abstain_counts_toward_approval) {
    denominator += big_int_t{proposal.tally.abstain};
  }
  if (denominator == 0) {
    return false;
  }
  return big_int_t{proposal.tally.in_favor} * 100 >=
         big_int_t{proposal.approval_threshold_percent} * denominator;
}

hash32_t make_content_hash(const std::vector<account_id_t>& targets,
                           const std::vector<amount_t>& values,
                           const std::vector<bytes_t>& payloads,
                           const hash32_t& description_hash) {
  auto encoder = encoder_t{};
  auto material =
      encoder.encode(std::tuple{targets, values, payloads, description_hash});
  return ballot::blake3::hash(bytes_view_t{material.data(), material.size()});
}

proposal_store::proposal_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

store_result_t<proposal_state_t> proposal_store::create(
    const account_id_t& proposer,
    const propose_proposal_t& proposal,
    const timestamp_milliseconds_t now,
    const governance_config& config) {
  if (auto error = validate_proposal(proposal, now, config)) {
    return *error;
  }

  auto description_hash = ballot::blake3::hash(
      bytes_view_t{proposal.description.data(), proposal.description.size()});
  auto content_hash =
      make_content_hash(proposal.targets, proposal.values, proposal.payloads,
                        description_hash);

  auto content_key = key::make_proposal_content_key(content_hash);
  auto existing_id = storage_.get<proposal_id_t>(encoder_, content_key);
  if (existing_id) {
    auto existing = get(*existing_id);
    if (auto* state = std::get_if<proposal_state_t>(&existing)) {
      auto status = resolve_status(*state, now);
      if (status == proposal_status_t::pending ||
          status == proposal_status_t::active) {
        return governance_error_code::duplicate_proposal;
      }
    }
  }

  auto sequence_key = key::make_proposal_sequence_key();
  auto sequence =
      storage_.get<uint64_t>(encoder_, sequence_key).value_or(0) + 1;

  auto record = proposal_state_t{};
  record.proposer = proposer;
  record.sequence = sequence;
  record.targets = proposal.targets;
  record.values = proposal.values;
  record.payloads = proposal.payloads;
  record.description = proposal.description;
  record.description_hash = description_hash;
  record.content_hash = content_hash;
  record.created_at = now;
  record.voting_start =
      now + proposal.voting_delay.value_or(config.voting_delay);
  record.voting_end = record.voting_start +
                      proposal.voting_period.value_or(config.voting_period);
  record.execution_delay = config.execution_delay;
  // Overrides may only tighten the deployment's gates.
  record.quorum = std::max(proposal.quorum.value_or(config.quorum),
                           config.quorum);
  record.approval_threshold_percent =
      std::max(proposal.approval_threshold_percent.value_or(
                   config.approval_threshold_percent),
               config.approval_threshold_percent);
  record.weighting = proposal.weighting.value_or(config.weighting);
  record.abstain_counts_toward_approval = config.abstain_counts_toward_approval;

  auto id_material =
      encoder_.encode(std::tuple{proposer, description_hash, sequence});
  record.proposal_id = ballot::blake3::hash(
      bytes_view_t{id_material.data(), id_material.size()});

  storage_.write_batch(
      {{key::make_proposal_key(record.proposal_id), encoder_.encode(record)},
       {content_key, encoder_.encode(record.proposal_id)},
       {sequence_key, encoder_.encode(sequence)}},
      {});
  spdlog::debug("Stored proposal {} (sequence {})", to_hex(record.proposal_id),
                sequence);
  return record;
}

store_result_t<proposal_state_t> proposal_store::get(
    const proposal_id_t& proposal_id) const {
  auto record = storage_.get<proposal_state_t>(
      encoder_, key::make_proposal_key(proposal_id));
  if (!record) {
    return governance_error_code::proposal_missing;
  }
  return *record;
}

std::optional<governance_error_code> proposal_store::transition(
    const proposal_id_t& proposal_id,
    const proposal_status_t from,
    const proposal_status_t to,
    const timestamp_milliseconds_t now) {
  auto loaded = get(proposal_id);
  auto* record = std::get_if<proposal_state_t>(&loaded);
  if (record == nullptr) {
    return std::get<governance_error_code>(loaded);
  }
  if (resolve_status(*record, now) != from || !is_allowed_edge(from, to)) {
    return governance_error_code::illegal_transition;
  }

  switch (to) {
    case proposal_status_t::queued:
      record->queued_at = now;
      record->execute_after =
          adds_without_overflow(now, record->execution_delay)
              ? now + record->execution_delay
              : std::numeric_limits<timestamp_milliseconds_t>::max();
      break;
    case proposal_status_t::executed:
      record->executed = true;
      record->executed_at = now;
      break;
    case proposal_status_t::cancelled:
      record->cancelled = true;
      record->cancelled_at = now;
      break;
    default:
      return governance_error_code::illegal_transition;
  }

  storage_.put(encoder_, key::make_proposal_key(proposal_id), *record);
  spdlog::debug("Proposal {} moved {} -> {}", to_hex(proposal_id),
                to_string(from), to_string(to));
  return std::nullopt;
}

ballot::storage::key_value_entry_t proposal_store::stage_vote(
    proposal_state_t& proposal,
    const vote_choice_t choice,
    const amount_t& weight) {
  switch (choice) {
    case vote_choice_t::against:
      proposal.tally.against = saturating_add(proposal.tally.against, weight);
      break;
    case vote_choice_t::in_favor:
      proposal.tally.in_favor = saturating_add(proposal.tally.in_favor, weight);
      break;
    case vote_choice_t::abstain:
      proposal.tally.abstain = saturating_add(proposal.tally.abstain, weight);
      break;
  }
  ++proposal.tally.voters;
  return {key::make_proposal_key(proposal.proposal_id),
          encoder_.encode(proposal)};
}

std::vector<proposal_state_t> proposal_store::list() const {
  auto entries =
      storage_.list_by_prefix(key::make_prefix_key(key::kProposalKeyPrefix));
  auto proposals = std::vector<proposal_state_t>{};
  proposals.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    proposals.push_back(encoder_.decode<proposal_state_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  std::sort(std::begin(proposals), std::end(proposals),
            [](const auto& lhs, const auto& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return proposals;
}

}  // namespace ballot::governance
