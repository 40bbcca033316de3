#include <provenance/schema/encoding/scale/add_tracking_event.hpp>
#include <provenance/schema/encoding/scale/event_input.hpp>

namespace provenance::schema {

void encode(const add_tracking_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.product_id, encoder);
  encode(o.event, encoder);
}

void decode(add_tracking_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.product_id, decoder);
  decode(o.event, decoder);
}

}  // namespace provenance::schema
