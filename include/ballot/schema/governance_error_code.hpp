#pragma once

#include <ballot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace ballot::schema {

enum class governance_error_code : uint32_t {
  invalid_proposal = 1,
  duplicate_proposal = 2,
  proposal_missing = 3,
  not_authorized = 4,
  voting_not_open = 5,
  timelock_not_elapsed = 6,
  illegal_transition = 7,
  already_voted = 8,
  already_executed = 9,
  target_call_failed = 10,
  self_delegation = 11,
  insufficient_power = 12,
  insufficient_delegation = 13,
  zero_voting_weight = 14,
  invalid_amount = 15,
  clock_regression = 16,
  receipt_missing = 17,
  proposal_threshold_not_met = 18,
};

/// Coarse grouping of error codes. Temporal errors may clear on their own as
/// time advances; validation and state errors never will.
enum class error_class_t : uint8_t {
  validation = 0,
  authorization = 1,
  temporal = 2,
  state = 3,
  execution = 4
};

inline constexpr auto kGovernanceErrorCodeMappings = std::array{
    std::pair<std::string_view, governance_error_code>{
        "invalid_proposal", governance_error_code::invalid_proposal},
    std::pair<std::string_view, governance_error_code>{
        "duplicate_proposal", governance_error_code::duplicate_proposal},
    std::pair<std::string_view, governance_error_code>{
        "proposal_missing", governance_error_code::proposal_missing},
    std::pair<std::string_view, governance_error_code>{
        "not_authorized", governance_error_code::not_authorized},
    std::pair<std::string_view, governance_error_code>{
        "voting_not_open", governance_error_code::voting_not_open},
    std::pair<std::string_view, governance_error_code>{
        "timelock_not_elapsed", governance_error_code::timelock_not_elapsed},
    std::pair<std::string_view, governance_error_code>{
        "illegal_transition", governance_error_code::illegal_transition},
    std::pair<std::string_view, governance_error_code>{
        "already_voted", governance_error_code::already_voted},
    std::pair<std::string_view, governance_error_code>{
        "already_executed", governance_error_code::already_executed},
    std::pair<std::string_view, governance_error_code>{
        "target_call_failed", governance_error_code::target_call_failed},
    std::pair<std::string_view, governance_error_code>{
        "self_delegation", governance_error_code::self_delegation},
    std::pair<std::string_view, governance_error_code>{
        "insufficient_power", governance_error_code::insufficient_power},
    std::pair<std::string_view, governance_error_code>{
        "insufficient_delegation",
        governance_error_code::insufficient_delegation},
    std::pair<std::string_view, governance_error_code>{
        "zero_voting_weight", governance_error_code::zero_voting_weight},
    std::pair<std::string_view, governance_error_code>{
        "invalid_amount", governance_error_code::invalid_amount},
    std::pair<std::string_view, governance_error_code>{
        "clock_regression", governance_error_code::clock_regression},
    std::pair<std::string_view, governance_error_code>{
        "receipt_missing", governance_error_code::receipt_missing},
    std::pair<std::string_view, governance_error_code>{
        "proposal_threshold_not_met",
        governance_error_code::proposal_threshold_not_met}};

inline constexpr std::string_view to_string(const governance_error_code value) {
  return enum_name(value, kGovernanceErrorCodeMappings);
}

inline constexpr error_class_t error_class(const governance_error_code code) {
  switch (code) {
    case governance_error_code::invalid_proposal:
    case governance_error_code::duplicate_proposal:
    case governance_error_code::self_delegation:
    case governance_error_code::insufficient_power:
    case governance_error_code::insufficient_delegation:
    case governance_error_code::zero_voting_weight:
    case governance_error_code::invalid_amount:
    case governance_error_code::proposal_threshold_not_met:
      return error_class_t::validation;
    case governance_error_code::not_authorized:
      return error_class_t::authorization;
    case governance_error_code::voting_not_open:
    case governance_error_code::timelock_not_elapsed:
    case governance_error_code::clock_regression:
      return error_class_t::temporal;
    case governance_error_code::target_call_failed:
      return error_class_t::execution;
    case governance_error_code::proposal_missing:
    case governance_error_code::illegal_transition:
    case governance_error_code::already_voted:
    case governance_error_code::already_executed:
    case governance_error_code::receipt_missing:
      return error_class_t::state;
  }
  return error_class_t::state;
}

/// True when the same call may succeed later without any other input change.
inline constexpr bool is_retryable(const governance_error_code code) {
  auto klass = error_class(code);
  return klass == error_class_t::temporal || klass == error_class_t::execution;
}

/// Result of a store read or creation: the value or the reason it failed.
template <typename T>
using store_result_t = std::variant<T, governance_error_code>;

}  // namespace ballot::schema
