#pragma once
#include <provenance/schema/block_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const block_result<1>& o, ::scale::Encoder& encoder);
void decode(block_result<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
