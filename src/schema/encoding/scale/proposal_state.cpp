#include <ballot/schema/encoding/scale/proposal_state.hpp>

namespace ballot::schema {

void encode(const proposal_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
  encode(o.proposer, encoder);
  encode(o.sequence, encoder);
  encode(o.targets, encoder);
  encode(o.values, encoder);
  encode(o.payloads, encoder);
  encode(o.description, encoder);
  encode(o.description_hash, encoder);
  encode(o.content_hash, encoder);
  encode(o.created_at, encoder);
  encode(o.voting_start, encoder);
  encode(o.voting_end, encoder);
  encode(o.execution_delay, encoder);
  encode(o.quorum, encoder);
  encode(o.approval_threshold_percent, encoder);
  encode(o.weighting, encoder);
  encode(o.abstain_counts_toward_approval, encoder);
  encode(o.tally, encoder);
  encode(o.queued_at, encoder);
  encode(o.execute_after, encoder);
  encode(o.executed_at, encoder);
  encode(o.cancelled_at, encoder);
  encode(o.executed, encoder);
  encode(o.cancelled, encoder);
}

void decode(proposal_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
  decode(o.proposer, decoder);
  decode(o.sequence, decoder);
  decode(o.targets, decoder);
  decode(o.values, decoder);
  decode(o.payloads, decoder);
  decode(o.description, decoder);
  decode(o.description_hash, decoder);
  decode(o.content_hash, decoder);
  decode(o.created_at, decoder);
  decode(o.voting_start, decoder);
  decode(o.voting_end, decoder);
  decode(o.execution_delay, decoder);
  decode(o.quorum, decoder);
  decode(o.approval_threshold_percent, decoder);
  decode(o.weighting, decoder);
  decode(o.abstain_counts_toward_approval, decoder);
  decode(o.tally, decoder);
  decode(o.queued_at, decoder);
  decode(o.execute_after, decoder);
  decode(o.executed_at, decoder);
  decode(o.cancelled_at, decoder);
  decode(o.executed, decoder);
  decode(o.cancelled, decoder);
}

}  // namespace ballot::schema
