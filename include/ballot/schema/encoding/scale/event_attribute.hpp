#pragma once
#include <ballot/schema/event_attribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ballot::schema {

void encode(const event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(event_attribute<1>& o, ::scale::Decoder& decoder);

}  // namespace ballot::schema
