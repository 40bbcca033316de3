#pragma once
#include <provenance/schema/event_page.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const event_page<1>& o, ::scale::Encoder& encoder);
void decode(event_page<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
