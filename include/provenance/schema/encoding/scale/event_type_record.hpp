#pragma once
#include <provenance/schema/event_type_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const event_type_record<1>& o, ::scale::Encoder& encoder);
void decode(event_type_record<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
