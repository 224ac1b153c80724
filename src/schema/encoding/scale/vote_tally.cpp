#include <ballot/schema/encoding/scale/vote_tally.hpp>

namespace ballot::schema {

void encode(const vote_tally<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.against, encoder);
  encode(o.in_favor, encoder);
  encode(o.abstain, encoder);
  encode(o.voters, encoder);
}

void decode(vote_tally<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.against, decoder);
  decode(o.in_favor, decoder);
  decode(o.abstain, decoder);
  decode(o.voters, decoder);
}

}  // namespace ballot::schema
