#include <provenance/schema/encoding/scale/event_page.hpp>
#include <provenance/schema/encoding/scale/tracking_event.hpp>

namespace provenance::schema {

void encode(const event_page<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.events, encoder);
  encode(o.total_count, encoder);
  encode(o.has_more, encoder);
}

void decode(event_page<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.events, decoder);
  decode(o.total_count, decoder);
  decode(o.has_more, decoder);
}

}  // namespace provenance::schema
