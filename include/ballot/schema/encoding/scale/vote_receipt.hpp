#pragma once
#include <ballot/schema/vote_receipt.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ballot::schema {

void encode(const vote_receipt<1>& o, ::scale::Encoder& encoder);
void decode(vote_receipt<1>& o, ::scale::Decoder& decoder);

}  // namespace ballot::schema
