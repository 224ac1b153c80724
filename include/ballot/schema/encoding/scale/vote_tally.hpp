#pragma once
#include <ballot/schema/vote_tally.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ballot::schema {

void encode(const vote_tally<1>& o, ::scale::Encoder& encoder);
void decode(vote_tally<1>& o, ::scale::Decoder& decoder);

}  // namespace ballot::schema
