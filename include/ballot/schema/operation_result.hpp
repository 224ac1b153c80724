#pragma once

#include <ballot/schema/governance_event.hpp>
#include <ballot/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ballot::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<governance_event_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace ballot::schema
