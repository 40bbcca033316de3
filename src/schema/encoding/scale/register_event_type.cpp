#include <provenance/schema/encoding/scale/register_event_type.hpp>

namespace provenance::schema {

void encode(const register_event_type<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_type, encoder);
  encode(o.label, encoder);
}

void decode(register_event_type<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_type, decoder);
  decode(o.label, decoder);
}

}  // namespace provenance::schema
