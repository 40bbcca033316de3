#pragma once
#include <provenance/schema/custom_field.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const custom_field<1>& o, ::scale::Encoder& encoder);
void decode(custom_field<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
