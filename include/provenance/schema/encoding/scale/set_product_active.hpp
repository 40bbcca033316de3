#pragma once
#include <provenance/schema/set_product_active.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const set_product_active<1>& o, ::scale::Encoder& encoder);
void decode(set_product_active<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
