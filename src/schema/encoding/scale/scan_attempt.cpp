#include <gatepass/schema/encoding/scale/denial_reason.hpp>
#include <gatepass/schema/encoding/scale/scan_attempt.hpp>
#include <gatepass/schema/encoding/scale/scan_outcome.hpp>
#include <gatepass/schema/encoding/scale/scan_source.hpp>

namespace gatepass::schema {

void encode(const scan_attempt<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.credential_id, encoder);
  encode(o.source, encoder);
  encode(o.recorded_at, encoder);
  encode(o.outcome, encoder);
  encode(o.reason, encoder);
  encode(o.payload_hash, encoder);
  encode(o.checkpoint_id, encoder);
}

void decode(scan_attempt<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.credential_id, decoder);
  decode(o.source, decoder);
  decode(o.recorded_at, decoder);
  decode(o.outcome, decoder);
  decode(o.reason, decoder);
  decode(o.payload_hash, decoder);
  decode(o.checkpoint_id, decoder);
}

}  // namespace gatepass::schema
