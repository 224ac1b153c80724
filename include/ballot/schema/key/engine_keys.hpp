#pragma once

#include <ballot/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Governance workflow: canonical key prefixes and key builders for proposal,
// receipt, delegation, clock and event state.
namespace ballot::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kProposalKeyPrefix{"SYS|STATE|PROPOSAL|"};
inline constexpr std::string_view kProposalContentKeyPrefix{
    "SYS|STATE|PROPOSAL_CONTENT|"};
inline constexpr std::string_view kProposalSequenceKeyPrefix{
    "SYS|STATE|PROPOSAL_SEQ|"};
inline constexpr std::string_view kReceiptKeyPrefix{"SYS|STATE|RECEIPT|"};
inline constexpr std::string_view kDelegationKeyPrefix{
    "SYS|STATE|DELEGATION|"};
inline constexpr std::string_view kCheckpointKeyPrefix{
    "SYS|STATE|CHECKPOINT|"};
inline constexpr std::string_view kClockKeyPrefix{"SYS|STATE|CLOCK|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr std::array<std::string_view, 10> kEngineKeyspaces{
    kStatePrefix,
    kProposalKeyPrefix,
    kProposalContentKeyPrefix,
    kProposalSequenceKeyPrefix,
    kReceiptKeyPrefix,
    kDelegationKeyPrefix,
    kCheckpointKeyPrefix,
    kClockKeyPrefix,
    kEventSeqKeyPrefix,
    kEventPrefix};

/// SCALE encoding of the prefix alone; usable as a list_by_prefix argument.
ballot::schema::bytes_t make_prefix_key(std::string_view prefix);

ballot::schema::bytes_t make_proposal_key(
    const ballot::schema::proposal_id_t& proposal_id);
ballot::schema::bytes_t make_proposal_content_key(
    const ballot::schema::hash32_t& content_hash);
ballot::schema::bytes_t make_proposal_sequence_key();

ballot::schema::bytes_t make_receipt_key(
    const ballot::schema::proposal_id_t& proposal_id,
    const ballot::schema::account_id_t& voter);
ballot::schema::bytes_t make_receipt_prefix(
    const ballot::schema::proposal_id_t& proposal_id);

ballot::schema::bytes_t make_delegation_key(
    const ballot::schema::account_id_t& delegator,
    const ballot::schema::account_id_t& delegate);
ballot::schema::bytes_t make_delegation_prefix(
    const ballot::schema::account_id_t& delegator);

ballot::schema::bytes_t make_checkpoint_key(
    const ballot::schema::account_id_t& account);

ballot::schema::bytes_t make_clock_key();
ballot::schema::bytes_t make_event_sequence_key();
ballot::schema::bytes_t make_event_key(uint64_t sequence);

}  // namespace ballot::schema::key
