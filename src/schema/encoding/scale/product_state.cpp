#include <provenance/schema/encoding/scale/custom_field.hpp>
#include <provenance/schema/encoding/scale/primitives.hpp>
#include <provenance/schema/encoding/scale/product_state.hpp>

namespace provenance::schema {

void encode(const product_state<1>& o, ::scale::Encoder& encoder) {
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
  encode(o.owner, encoder);
  encode(o.created_at, encoder);
  encode(o.created_height, encoder);
  encode(o.authorized_actors, encoder);
  encode(o.active, encoder);
}

void decode(product_state<1>& o, ::scale::Decoder& decoder) {
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
  decode(o.owner, decoder);
  decode(o.created_at, decoder);
  decode(o.created_height, decoder);
  decode(o.authorized_actors, decoder);
  decode(o.active, decoder);
}

}  // namespace provenance::schema
