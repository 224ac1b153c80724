#include <ballot/schema/encoding/scale/vote_receipt.hpp>

namespace ballot::schema {

void encode(const vote_receipt<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
  encode(o.voter, encoder);
  encode(o.choice, encoder);
  encode(o.snapshot_power, encoder);
  encode(o.weight, encoder);
  encode(o.cast_at, encoder);
}

void decode(vote_receipt<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
  decode(o.voter, decoder);
  decode(o.choice, decoder);
  decode(o.snapshot_power, decoder);
  decode(o.weight, decoder);
  decode(o.cast_at, decoder);
}

}  // namespace ballot::schema
