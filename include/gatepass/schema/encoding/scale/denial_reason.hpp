#pragma once
#include <gatepass/schema/denial_reason.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace gatepass::schema {

void encode(const denial_reason_t& o, ::scale::Encoder& encoder);
void decode(denial_reason_t& o, ::scale::Decoder& decoder);

}  // namespace gatepass::schema
