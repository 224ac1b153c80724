#pragma once
#include <ballot/schema/encoding/scale/vote_tally.hpp>
#include <ballot/schema/proposal_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Codecs live in the schema namespace so SCALE finds them by argument
// dependent lookup.
namespace ballot::schema {

void encode(const proposal_state<1>& o, ::scale::Encoder& encoder);
void decode(proposal_state<1>& o, ::scale::Decoder& decoder);

}  // namespace ballot::schema
