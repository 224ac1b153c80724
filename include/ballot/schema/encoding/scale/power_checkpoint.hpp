#pragma once
#include <ballot/schema/power_checkpoint.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ballot::schema {

void encode(const power_checkpoint<1>& o, ::scale::Encoder& encoder);
void decode(power_checkpoint<1>& o, ::scale::Decoder& decoder);

}  // namespace ballot::schema
