#include <provenance/schema/encoding/scale/custom_field.hpp>

namespace provenance::schema {

void encode(const custom_field<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.value, encoder);
}

void decode(custom_field<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.value, decoder);
}

}  // namespace provenance::schema
