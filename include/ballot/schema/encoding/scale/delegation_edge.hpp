#pragma once
#include <ballot/schema/delegation_edge.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ballot::schema {

void encode(const delegation_edge<1>& o, ::scale::Encoder& encoder);
void decode(delegation_edge<1>& o, ::scale::Decoder& decoder);

}  // namespace ballot::schema
