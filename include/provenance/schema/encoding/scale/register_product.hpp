#pragma once
#include <provenance/schema/register_product.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const register_product<1>& o, ::scale::Encoder& encoder);
void decode(register_product<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
