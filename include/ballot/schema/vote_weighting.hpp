#pragma once

#include <ballot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: vote weighting.
// Governance workflow: maps snapshot power to tallied weight. Chosen once when
// the proposal is created.
namespace ballot::schema {

enum class vote_weighting_t : uint8_t {
  linear = 0,
  quadratic = 1,
  reputation = 2
};

inline constexpr auto kVoteWeightingMappings = std::array{
    std::pair<std::string_view, vote_weighting_t>{"linear",
                                                  vote_weighting_t::linear},
    std::pair<std::string_view, vote_weighting_t>{"quadratic",
                                                  vote_weighting_t::quadratic},
    std::pair<std::string_view, vote_weighting_t>{
        "reputation", vote_weighting_t::reputation}};

template <>
inline std::optional<vote_weighting_t> try_from_string<vote_weighting_t>(
    const std::string_view value) {
  return from_string(value, kVoteWeightingMappings);
}

inline constexpr std::string_view to_string(const vote_weighting_t value) {
  return enum_name(value, kVoteWeightingMappings);
}

}  // namespace ballot::schema
