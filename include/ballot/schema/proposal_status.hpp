#pragma once

#include <ballot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: proposal status.
// Governance workflow: lifecycle of a proposal. pending, active, succeeded and
// defeated are derived from time and tally; queued, executed and cancelled are
// recorded flags.
namespace ballot::schema {

enum class proposal_status_t : uint8_t {
  pending = 0,
  active = 1,
  defeated = 2,
  succeeded = 3,
  queued = 4,
  executed = 5,
  cancelled = 6
};

inline constexpr auto kProposalStatusMappings = std::array{
    std::pair<std::string_view, proposal_status_t>{"pending",
                                                   proposal_status_t::pending},
    std::pair<std::string_view, proposal_status_t>{"active",
                                                   proposal_status_t::active},
    std::pair<std::string_view, proposal_status_t>{
        "defeated", proposal_status_t::defeated},
    std::pair<std::string_view, proposal_status_t>{
        "succeeded", proposal_status_t::succeeded},
    std::pair<std::string_view, proposal_status_t>{"queued",
                                                   proposal_status_t::queued},
    std::pair<std::string_view, proposal_status_t>{
        "executed", proposal_status_t::executed},
    std::pair<std::string_view, proposal_status_t>{
        "cancelled", proposal_status_t::cancelled}};

template <>
inline std::optional<proposal_status_t> try_from_string<proposal_status_t>(
    const std::string_view value) {
  return from_string(value, kProposalStatusMappings);
}

inline constexpr std::string_view to_string(const proposal_status_t value) {
  return enum_name(value, kProposalStatusMappings);
}

inline constexpr bool is_terminal(const proposal_status_t value) {
  return value == proposal_status_t::executed ||
         value == proposal_status_t::cancelled ||
         value == proposal_status_t::defeated;
}

}  // namespace ballot::schema
