#pragma once
#include <provenance/schema/tracking_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const tracking_event<1>& o, ::scale::Encoder& encoder);
void decode(tracking_event<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
