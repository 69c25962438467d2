#include <gatepass/schema/encoding/scale/enum_codec.hpp>
#include <gatepass/schema/encoding/scale/scan_source.hpp>

namespace gatepass::schema {

void encode(const scan_source_t& o, ::scale::Encoder& encoder) {
  encoding::scale::encode_enum(o, encoder);
}

void decode(scan_source_t& o, ::scale::Decoder& decoder) {
  encoding::scale::decode_enum(o, decoder, kScanSourceMappings);
}

}  // namespace gatepass::schema
