#pragma once

#include <ballot/schema/primitives.hpp>

// Schema type: power checkpoint.
// Governance workflow: an account's delegated-in and delegated-out totals as
// of `at`. Checkpoints for one account are kept in ascending `at` order.
namespace ballot::schema {

template <uint16_t Version>
struct power_checkpoint;

template <>
struct power_checkpoint<1> final {
  uint16_t version{1};
  timestamp_milliseconds_t at{};
  amount_t delegated_in{};
  amount_t delegated_out{};
};

using power_checkpoint_t = power_checkpoint<1>;

}  // namespace ballot::schema
