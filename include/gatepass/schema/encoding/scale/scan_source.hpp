#pragma once
#include <gatepass/schema/scan_source.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace gatepass::schema {

void encode(const scan_source_t& o, ::scale::Encoder& encoder);
void decode(scan_source_t& o, ::scale::Decoder& decoder);

}  // namespace gatepass::schema
