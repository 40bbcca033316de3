#pragma once
#include <provenance/schema/register_event_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const register_event_type<1>& o, ::scale::Encoder& encoder);
void decode(register_event_type<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
