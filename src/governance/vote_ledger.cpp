#include <ballot/governance/vote_ledger.hpp>

#include <ballot/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <utility>

using namespace ballot::schema;

namespace ballot::governance {

vote_ledger::vote_ledger(encoder_t& encoder,
                         storage_t& storage,
                         proposal_store& proposals,
                         const delegation_registry& delegations,
                         reputation_source_t reputation_source)
    : encoder_{encoder},
      storage_{storage},
      proposals_{proposals},
      delegations_{delegations},
      reputation_source_{std::move(reputation_source)} {}

store_result_t<vote_receipt_t> vote_ledger::cast_vote(
    const proposal_id_t& proposal_id,
    const account_id_t& voter,
    const vote_choice_t choice,
    const timestamp_milliseconds_t now) {
  auto loaded = proposals_.get(proposal_id);
  auto* proposal = std::get_if<proposal_state_t>(&loaded);
  if (proposal == nullptr) {
    return std::get<governance_error_code>(loaded);
  }

  auto status = resolve_status(*proposal, now);
  if (status == proposal_status_t::cancelled) {
    return governance_error_code::illegal_transition;
  }
  if (status != proposal_status_t::active) {
    return governance_error_code::voting_not_open;
  }

  auto receipt_key = key::make_receipt_key(proposal_id, voter);
  if (storage_.get<vote_receipt_t>(encoder_, receipt_key)) {
    return governance_error_code::already_voted;
  }

  auto receipt = vote_receipt_t{};
  receipt.proposal_id = proposal_id;
  receipt.voter = voter;
  receipt.choice = choice;
  receipt.snapshot_power =
      delegations_.snapshot_power_of(voter, proposal->voting_start);
  receipt.weight = voting_weight(*proposal, voter);
  receipt.cast_at = now;
  if (receipt.weight == 0) {
    return governance_error_code::zero_voting_weight;
  }

  auto tally_entry = proposals_.stage_vote(*proposal, choice, receipt.weight);
  storage_.write_batch(
      {{receipt_key, encoder_.encode(receipt)}, std::move(tally_entry)}, {});
  spdlog::debug("Recorded {} vote of weight {} on {}", to_string(choice),
                to_string(receipt.weight), to_hex(proposal_id));
  return receipt;
}

store_result_t<vote_receipt_t> vote_ledger::receipt_of(
    const proposal_id_t& proposal_id,
    const account_id_t& voter) const {
  auto receipt = storage_.get<vote_receipt_t>(
      encoder_, key::make_receipt_key(proposal_id, voter));
  if (!receipt) {
    return governance_error_code::receipt_missing;
  }
  return *receipt;
}

std::vector<vote_receipt_t> vote_ledger::receipts(
    const proposal_id_t& proposal_id) const {
  auto entries =
      storage_.list_by_prefix(key::make_receipt_prefix(proposal_id));
  auto out = std::vector<vote_receipt_t>{};
  out.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    out.push_back(encoder_.decode<vote_receipt_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  return out;
}

amount_t vote_ledger::voting_weight(const proposal_state_t& proposal,
                                    const account_id_t& voter) const {
  auto power = delegations_.snapshot_power_of(voter, proposal.voting_start);
  auto reputation = reputation_source_
                        ? reputation_source_(voter, proposal.voting_start)
                        : uint32_t{0};
  return apply_weighting(proposal.weighting, power, reputation);
}

}  // namespace ballot::governance
