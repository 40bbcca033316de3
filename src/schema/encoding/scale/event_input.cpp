#include <provenance/schema/encoding/scale/event_input.hpp>
#include <provenance/schema/encoding/scale/primitives.hpp>

namespace provenance::schema {

void encode(const event_input<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_type, encoder);
  encode(o.location, encoder);
  encode(o.metadata, encoder);
  encode(o.data_hash, encoder);
}

void decode(event_input<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_type, decoder);
  decode(o.location, decoder);
  decode(o.metadata, decoder);
  decode(o.data_hash, decoder);
}

}  // namespace provenance::schema
