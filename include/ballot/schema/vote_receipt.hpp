#pragma once

#include <ballot/schema/primitives.hpp>
#include <ballot/schema/vote_choice.hpp>

// Schema type: vote receipt.
// Governance workflow: immutable record of one voter's choice on one proposal
// and the snapshot power behind it.
namespace ballot::schema {

template <uint16_t Version>
struct vote_receipt;

template <>
struct vote_receipt<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  account_id_t voter{};
  vote_choice_t choice{vote_choice_t::against};
  amount_t snapshot_power{};
  amount_t weight{};
  timestamp_milliseconds_t cast_at{};
};

using vote_receipt_t = vote_receipt<1>;

}  // namespace ballot::schema
