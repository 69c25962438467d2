#include <gatepass/schema/encoding/scale/enum_codec.hpp>
#include <gatepass/schema/encoding/scale/denial_reason.hpp>

namespace gatepass::schema {

void encode(const denial_reason_t& o, ::scale::Encoder& encoder) {
  encoding::scale::encode_enum(o, encoder);
}

void decode(denial_reason_t& o, ::scale::Decoder& decoder) {
  encoding::scale::decode_enum(o, decoder, kDenialReasonMappings);
}

}  // namespace gatepass::schema
