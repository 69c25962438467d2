#include <gatepass/schema/encoding/scale/enum_codec.hpp>
#include <gatepass/schema/encoding/scale/scan_outcome.hpp>

namespace gatepass::schema {

void encode(const scan_outcome_t& o, ::scale::Encoder& encoder) {
  encoding::scale::encode_enum(o, encoder);
}

void decode(scan_outcome_t& o, ::scale::Decoder& decoder) {
  encoding::scale::decode_enum(o, decoder, kScanOutcomeMappings);
}

}  // namespace gatepass::schema
