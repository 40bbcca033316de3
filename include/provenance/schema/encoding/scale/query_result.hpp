#pragma once
#include <provenance/schema/query_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const query_result<1>& o, ::scale::Encoder& encoder);
void decode(query_result<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
