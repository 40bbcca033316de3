#include <provenance/schema/encoding/scale/custom_field.hpp>
#include <provenance/schema/encoding/scale/register_product.hpp>

namespace provenance::schema {

void encode(const register_product<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.name, encoder);
  encode(o.origin, encoder);
  encode(o.description, encoder);
  encode(o.category, encoder);
  encode(o.tags, encoder);
  encode(o.certifications, encoder);
  encode(o.media_hashes, encoder);
  encode(o.custom, encoder);
}

void decode(register_product<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.name, decoder);
  decode(o.origin, decoder);
  decode(o.description, decoder);
  decode(o.category, decoder);
  decode(o.tags, decoder);
  decode(o.certifications, decoder);
  decode(o.media_hashes, decoder);
  decode(o.custom, decoder);
}

}  // namespace provenance::schema
