#pragma once

#include <gatepass/schema/scan_attempt.hpp>
#include <scale/scale.hpp>

namespace gatepass::schema {

void encode(const scan_attempt<1>& o, ::scale::Encoder& encoder);
void decode(scan_attempt<1>& o, ::scale::Decoder& decoder);

}  // namespace gatepass::schema
