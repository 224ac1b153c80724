#include <ballot/schema/encoding/scale/governance_event.hpp>

namespace ballot::schema {

void encode(const governance_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.type, encoder);
  encode(o.emitted_at, encoder);
  encode(o.attributes, encoder);
}

void decode(governance_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.type, decoder);
  decode(o.emitted_at, decoder);
  decode(o.attributes, decoder);
}

}  // namespace ballot::schema
