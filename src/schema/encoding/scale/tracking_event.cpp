#include <provenance/schema/encoding/scale/primitives.hpp>
#include <provenance/schema/encoding/scale/tracking_event.hpp>

namespace provenance::schema {

void encode(const tracking_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.sequence, encoder);
  encode(o.actor, encoder);
  encode(o.event_type, encoder);
  encode(o.location, encoder);
  encode(o.metadata, encoder);
  encode(o.data_hash, encoder);
  encode(o.timestamp, encoder);
  encode(o.height, encoder);
}

void decode(tracking_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.sequence, decoder);
  decode(o.actor, decoder);
  decode(o.event_type, decoder);
  decode(o.location, decoder);
  decode(o.metadata, decoder);
  decode(o.data_hash, decoder);
  decode(o.timestamp, decoder);
  decode(o.height, decoder);
}

}  // namespace provenance::schema
