#include <notary/schema/encoding/scale/commitment.hpp>

using namespace notary::schema;

namespace notary::schema::encoding::scale {

void encode(commitment<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.confirmed_round, encoder);
  encode(o.committed_at_millis, encoder);
  encode(o.fingerprint, encoder);
  encode(o.identity_address, encoder);
}

void decode(commitment<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.confirmed_round, decoder);
  decode(o.committed_at_millis, decoder);
  decode(o.fingerprint, decoder);
  decode(o.identity_address, decoder);
}

}  // namespace notary::schema::encoding::scale
