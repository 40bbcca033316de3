#pragma once
#include <provenance/schema/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const transaction_result<1>& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
