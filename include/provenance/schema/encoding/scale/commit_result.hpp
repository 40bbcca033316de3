#pragma once
#include <provenance/schema/commit_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const commit_result<1>& o, ::scale::Encoder& encoder);
void decode(commit_result<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
