#include <ballot/schema/encoding/scale/delegation_edge.hpp>

namespace ballot::schema {

void encode(const delegation_edge<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.delegator, encoder);
  encode(o.delegate, encoder);
  encode(o.amount, encoder);
  encode(o.updated_at, encoder);
}

void decode(delegation_edge<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.delegator, decoder);
  decode(o.delegate, decoder);
  decode(o.amount, decoder);
  decode(o.updated_at, decoder);
}

}  // namespace ballot::schema
