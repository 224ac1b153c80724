#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for the governance enums. Names are the wire and CLI spelling
// ("for", "queued", "target_call_failed"); each enum header owns one table.
namespace ballot::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Table name of `value`, or "unknown" for a value decoded from newer data.
template <typename Enum, std::size_t N>
constexpr std::string_view enum_name(const Enum value,
                                     const enum_mappings_t<Enum, N>& mappings) {
  return to_string(value, mappings).value_or("unknown");
}

// Specialized beside each enum's table; parsing an enum without one does not
// link.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace ballot::schema
