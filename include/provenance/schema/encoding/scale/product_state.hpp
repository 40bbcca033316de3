#pragma once
#include <provenance/schema/product_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const product_state<1>& o, ::scale::Encoder& encoder);
void decode(product_state<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
