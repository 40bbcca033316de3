#pragma once
#include <provenance/schema/add_authorized_actor.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const add_authorized_actor<1>& o, ::scale::Encoder& encoder);
void decode(add_authorized_actor<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
