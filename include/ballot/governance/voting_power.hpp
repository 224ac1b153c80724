#pragma once

#include <ballot/schema/primitives.hpp>
#include <ballot/schema/vote_weighting.hpp>

#include <cstdint>
#include <functional>

namespace ballot::governance {

/// Oracle for an account's own (undelegated) voting power at a point in time.
///
/// Must be deterministic for a fixed (account, snapshot) argument.
using voting_power_source_t =
    std::function<ballot::schema::amount_t(const ballot::schema::account_id_t&,
                                           ballot::schema::timestamp_milliseconds_t)>;

/// Reputation score used by the reputation weighting mode.
using reputation_source_t =
    std::function<uint32_t(const ballot::schema::account_id_t&,
                           ballot::schema::timestamp_milliseconds_t)>;

/// Map snapshot power to tallied weight under `weighting`.
///
/// quadratic: floor(sqrt(power)); reputation: power * (100 + reputation) / 100.
ballot::schema::amount_t apply_weighting(
    ballot::schema::vote_weighting_t weighting,
    const ballot::schema::amount_t& power,
    uint32_t reputation);

}  // namespace ballot::governance
