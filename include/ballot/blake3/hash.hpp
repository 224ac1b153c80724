#pragma once
#include <ballot/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace ballot::blake3 {

ballot::schema::hash32_t hash(const std::string_view& str);
ballot::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace ballot::blake3
