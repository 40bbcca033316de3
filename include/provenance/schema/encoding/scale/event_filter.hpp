#pragma once
#include <provenance/schema/event_filter.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const event_filter<1>& o, ::scale::Encoder& encoder);
void decode(event_filter<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
