#pragma once
#include <provenance/schema/transfer_ownership.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder);
void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
