#pragma once

#include <gatepass/common/clock.hpp>
#include <gatepass/ingest/image.hpp>
#include <gatepass/ingest/qr_decoder.hpp>
#include <gatepass/schema/scan_source.hpp>
#include <gatepass/verification/engine.hpp>
#include <gatepass/verification/verification_result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace gatepass::ingest {

/// Decoded payload text or an image still to be decoded.
using scan_content_t = std::variant<std::string, image>;

struct scan_submission final {
  scan_content_t content;
  gatepass::schema::scan_source_t source{
      gatepass::schema::scan_source_t::mobile_upload};
  std::string checkpoint_id;
};

enum class submit_status_t : uint8_t {
  /// The engine evaluated the payload; see verification.
  evaluated = 0,
  /// The image held no QR code. No attempt was recorded.
  no_payload = 1,
  /// An image arrived but no server-side decoder is configured.
  decoder_unavailable = 2,
  /// The checkpoint id is malformed or reserved. No attempt was recorded.
  invalid_checkpoint = 3
};

struct submit_result final {
  submit_status_t status{submit_status_t::evaluated};
  std::optional<gatepass::verification::verification_result> verification;
};

/// The capability both ingestion paths share: hand over a candidate payload,
/// get the verification outcome back.
class scan_submitter {
 public:
  virtual ~scan_submitter() = default;
  virtual submit_result submit(const scan_submission& submission) = 0;
};

/// Submitter backed by the verification engine. Stamps every submission with
/// the server clock.
class engine_submitter final : public scan_submitter {
 public:
  engine_submitter(gatepass::verification::engine& engine,
                   gatepass::common::clock_t clock,
                   qr_decoder* decoder = nullptr);

  submit_result submit(const scan_submission& submission) override;

 private:
  gatepass::verification::engine& engine_;
  gatepass::common::clock_t clock_;
  qr_decoder* decoder_{nullptr};
};

}  // namespace gatepass::ingest
