#pragma once

#include <ballot/schema/primitives.hpp>

// Schema type: vote tally.
// Governance workflow: weighted sums per choice plus the number of distinct
// voters that produced them.
namespace ballot::schema {

template <uint16_t Version>
struct vote_tally;

template <>
struct vote_tally<1> final {
  uint16_t version{1};
  amount_t against{};
  amount_t in_favor{};
  amount_t abstain{};
  uint32_t voters{};
};

using vote_tally_t = vote_tally<1>;

}  // namespace ballot::schema
