#pragma once

#include <gatepass/schema/credential.hpp>
#include <scale/scale.hpp>

namespace gatepass::schema {

void encode(const credential<1>& o, ::scale::Encoder& encoder);
void decode(credential<1>& o, ::scale::Decoder& decoder);

}  // namespace gatepass::schema
