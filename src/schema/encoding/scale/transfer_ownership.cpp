#include <provenance/schema/encoding/scale/primitives.hpp>
#include <provenance/schema/encoding/scale/transfer_ownership.hpp>

namespace provenance::schema {

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.new_owner, decoder);
}

}  // namespace provenance::schema
