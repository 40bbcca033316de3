#include <provenance/schema/encoding/scale/set_product_active.hpp>

namespace provenance::schema {

void encode(const set_product_active<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.active, encoder);
}

void decode(set_product_active<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.active, decoder);
}

}  // namespace provenance::schema
