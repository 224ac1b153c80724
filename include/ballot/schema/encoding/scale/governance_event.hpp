#pragma once
#include <ballot/schema/encoding/scale/event_attribute.hpp>
#include <ballot/schema/governance_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ballot::schema {

void encode(const governance_event<1>& o, ::scale::Encoder& encoder);
void decode(governance_event<1>& o, ::scale::Decoder& decoder);

}  // namespace ballot::schema
