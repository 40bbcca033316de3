#include <provenance/schema/encoding/scale/event_type_record.hpp>
#include <provenance/schema/encoding/scale/primitives.hpp>

namespace provenance::schema {

void encode(const event_type_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_type, encoder);
  encode(o.label, encoder);
  encode(o.registered_by, encoder);
  encode(o.registered_at, encoder);
}

void decode(event_type_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_type, decoder);
  decode(o.label, decoder);
  decode(o.registered_by, decoder);
  decode(o.registered_at, decoder);
}

}  // namespace provenance::schema
