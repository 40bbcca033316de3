#pragma once
#include <provenance/schema/add_tracking_events_batch.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const add_tracking_events_batch<1>& o, ::scale::Encoder& encoder);
void decode(add_tracking_events_batch<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
