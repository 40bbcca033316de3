#include <provenance/schema/encoding/scale/primitives.hpp>
#include <provenance/schema/encoding/scale/remove_authorized_actor.hpp>

namespace provenance::schema {

void encode(const remove_authorized_actor<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.actor, encoder);
}

void decode(remove_authorized_actor<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.actor, decoder);
}

}  // namespace provenance::schema
