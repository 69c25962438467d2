#include <gatepass/schema/encoding/scale/credential.hpp>
#include <gatepass/schema/encoding/scale/credential_status.hpp>

namespace gatepass::schema {

void encode(const credential<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.subject, encoder);
  encode(o.issued_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.status, encoder);
  encode(o.tag, encoder);
  encode(o.issued_by, encoder);
  encode(o.sealed_phone, encoder);
  encode(o.sealed_purpose, encoder);
  encode(o.consumed_at, encoder);
  encode(o.consumed_by, encoder);
  encode(o.revoked_at, encoder);
  encode(o.checked_out_at, encoder);
}

void decode(credential<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.subject, decoder);
  decode(o.issued_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.status, decoder);
  decode(o.tag, decoder);
  decode(o.issued_by, decoder);
  decode(o.sealed_phone, decoder);
  decode(o.sealed_purpose, decoder);
  decode(o.consumed_at, decoder);
  decode(o.consumed_by, decoder);
  decode(o.revoked_at, decoder);
  decode(o.checked_out_at, decoder);
}

}  // namespace gatepass::schema
