#pragma once

#include <ballot/schema/primitives.hpp>

// Schema type: delegation edge.
// Governance workflow: power currently lent by one account to another.
namespace ballot::schema {

template <uint16_t Version>
struct delegation_edge;

template <>
struct delegation_edge<1> final {
  uint16_t version{1};
  account_id_t delegator{};
  account_id_t delegate{};
  amount_t amount{};
  timestamp_milliseconds_t updated_at{};
};

using delegation_edge_t = delegation_edge<1>;

}  // namespace ballot::schema
