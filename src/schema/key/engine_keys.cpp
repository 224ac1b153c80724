#include <ballot/schema/key/engine_keys.hpp>

#include <ballot/schema/encoding/scale/encoder.hpp>

#include <iterator>
#include <tuple>

namespace ballot::schema::key {

namespace {

using key_encoder_t = ballot::schema::encoding::encoder<
    ballot::schema::encoding::scale_encoder_tag>;

// SCALE product types are encoded as concatenated field bytes, so this is
// equivalent to encoding tuple{prefix, id}.
template <typename T>
ballot::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const T& id) {
  auto encoder = key_encoder_t{};
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

}  // namespace

ballot::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return key_encoder_t{}.encode(prefix);
}

ballot::schema::bytes_t make_proposal_key(
    const ballot::schema::proposal_id_t& proposal_id) {
  return make_prefixed_key(kProposalKeyPrefix, proposal_id);
}

ballot::schema::bytes_t make_proposal_content_key(
    const ballot::schema::hash32_t& content_hash) {
  return make_prefixed_key(kProposalContentKeyPrefix, content_hash);
}

ballot::schema::bytes_t make_proposal_sequence_key() {
  return make_prefix_key(kProposalSequenceKeyPrefix);
}

ballot::schema::bytes_t make_receipt_key(
    const ballot::schema::proposal_id_t& proposal_id,
    const ballot::schema::account_id_t& voter) {
  return make_prefixed_key(kReceiptKeyPrefix, std::tuple{proposal_id, voter});
}

ballot::schema::bytes_t make_receipt_prefix(
    const ballot::schema::proposal_id_t& proposal_id) {
  return make_prefixed_key(kReceiptKeyPrefix, proposal_id);
}

ballot::schema::bytes_t make_delegation_key(
    const ballot::schema::account_id_t& delegator,
    const ballot::schema::account_id_t& delegate) {
  return make_prefixed_key(kDelegationKeyPrefix,
                           std::tuple{delegator, delegate});
}

ballot::schema::bytes_t make_delegation_prefix(
    const ballot::schema::account_id_t& delegator) {
  return make_prefixed_key(kDelegationKeyPrefix, delegator);
}

ballot::schema::bytes_t make_checkpoint_key(
    const ballot::schema::account_id_t& account) {
  return make_prefixed_key(kCheckpointKeyPrefix, account);
}

ballot::schema::bytes_t make_clock_key() {
  return make_prefix_key(kClockKeyPrefix);
}

ballot::schema::bytes_t make_event_sequence_key() {
  return make_prefix_key(kEventSeqKeyPrefix);
}

ballot::schema::bytes_t make_event_key(const uint64_t sequence) {
  return make_prefixed_key(kEventPrefix, sequence);
}

}  // namespace ballot::schema::key
