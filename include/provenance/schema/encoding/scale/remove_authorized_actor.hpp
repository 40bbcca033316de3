#pragma once
#include <provenance/schema/remove_authorized_actor.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const remove_authorized_actor<1>& o, ::scale::Encoder& encoder);
void decode(remove_authorized_actor<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
