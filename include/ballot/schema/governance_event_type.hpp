#pragma once

#include <ballot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ballot::schema {

enum class governance_event_type_t : uint8_t {
  proposal_created = 0,
  vote_cast = 1,
  proposal_state_changed = 2,
  proposal_queued = 3,
  proposal_executed = 4,
  proposal_cancelled = 5,
  delegation_changed = 6
};

inline constexpr auto kGovernanceEventTypeMappings = std::array{
    std::pair<std::string_view, governance_event_type_t>{
        "proposal_created", governance_event_type_t::proposal_created},
    std::pair<std::string_view, governance_event_type_t>{
        "vote_cast", governance_event_type_t::vote_cast},
    std::pair<std::string_view, governance_event_type_t>{
        "proposal_state_changed",
        governance_event_type_t::proposal_state_changed},
    std::pair<std::string_view, governance_event_type_t>{
        "proposal_queued", governance_event_type_t::proposal_queued},
    std::pair<std::string_view, governance_event_type_t>{
        "proposal_executed", governance_event_type_t::proposal_executed},
    std::pair<std::string_view, governance_event_type_t>{
        "proposal_cancelled", governance_event_type_t::proposal_cancelled},
    std::pair<std::string_view, governance_event_type_t>{
        "delegation_changed", governance_event_type_t::delegation_changed}};

template <>
inline std::optional<governance_event_type_t>
try_from_string<governance_event_type_t>(const std::string_view value) {
  return from_string(value, kGovernanceEventTypeMappings);
}

inline constexpr std::string_view to_string(
    const governance_event_type_t value) {
  return enum_name(value, kGovernanceEventTypeMappings);
}

}  // namespace ballot::schema
