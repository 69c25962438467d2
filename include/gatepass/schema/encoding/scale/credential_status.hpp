#pragma once
#include <gatepass/schema/credential_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace gatepass::schema {

void encode(const credential_status_t& o, ::scale::Encoder& encoder);
void decode(credential_status_t& o, ::scale::Decoder& decoder);

}  // namespace gatepass::schema
