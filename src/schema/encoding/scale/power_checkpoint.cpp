#include <ballot/schema/encoding/scale/power_checkpoint.hpp>

namespace ballot::schema {

void encode(const power_checkpoint<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.at, encoder);
  encode(o.delegated_in, encoder);
  encode(o.delegated_out, encoder);
}

void decode(power_checkpoint<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.at, decoder);
  decode(o.delegated_in, decoder);
  decode(o.delegated_out, decoder);
}

}  // namespace ballot::schema
