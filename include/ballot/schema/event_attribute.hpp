#pragma once

#include <cstdint>
#include <string>

// Schema type: event attribute.
// Governance workflow: key/value pair attached to a governance event.
namespace ballot::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using event_attribute_t = event_attribute<1>;

}  // namespace ballot::schema
