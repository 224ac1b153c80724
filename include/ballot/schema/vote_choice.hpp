#pragma once

#include <ballot/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ballot::schema {

enum class vote_choice_t : uint8_t { against = 0, in_favor = 1, abstain = 2 };

inline constexpr auto kVoteChoiceMappings = std::array{
    std::pair<std::string_view, vote_choice_t>{"against",
                                               vote_choice_t::against},
    std::pair<std::string_view, vote_choice_t>{"for", vote_choice_t::in_favor},
    std::pair<std::string_view, vote_choice_t>{"abstain",
                                               vote_choice_t::abstain}};

template <>
inline std::optional<vote_choice_t> try_from_string<vote_choice_t>(
    const std::string_view value) {
  return from_string(value, kVoteChoiceMappings);
}

inline constexpr std::string_view to_string(const vote_choice_t value) {
  return enum_name(value, kVoteChoiceMappings);
}

}  // namespace ballot::schema
