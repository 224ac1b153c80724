#pragma once

#include <ballot/schema/event_attribute.hpp>
#include <ballot/schema/governance_event_type.hpp>
#include <ballot/schema/primitives.hpp>
#include <vector>

// Schema type: governance event.
// Governance workflow: append-only audit stream for off-chain observers.
namespace ballot::schema {

template <uint16_t Version>
struct governance_event;

template <>
struct governance_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  governance_event_type_t type{governance_event_type_t::proposal_created};
  timestamp_milliseconds_t emitted_at{};
  std::vector<event_attribute_t> attributes;
};

using governance_event_t = governance_event<1>;

}  // namespace ballot::schema
