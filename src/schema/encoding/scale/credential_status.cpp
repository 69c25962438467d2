#include <gatepass/schema/encoding/scale/enum_codec.hpp>
#include <gatepass/schema/encoding/scale/credential_status.hpp>

namespace gatepass::schema {

void encode(const credential_status_t& o, ::scale::Encoder& encoder) {
  encoding::scale::encode_enum(o, encoder);
}

void decode(credential_status_t& o, ::scale::Decoder& decoder) {
  encoding::scale::decode_enum(o, decoder, kCredentialStatusMappings);
}

}  // namespace gatepass::schema
