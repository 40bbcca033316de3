#include <provenance/schema/encoding/scale/event_filter.hpp>

namespace provenance::schema {

void encode(const event_filter<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_type, encoder);
  encode(o.start_time, encoder);
  encode(o.end_time, encoder);
  encode(o.location, encoder);
}

void decode(event_filter<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_type, decoder);
  decode(o.start_time, decoder);
  decode(o.end_time, decoder);
  decode(o.location, decoder);
}

}  // namespace provenance::schema
