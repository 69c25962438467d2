#pragma once

#include <gatepass/ingest/qr_decoder.hpp>

#include <optional>
#include <string>

namespace gatepass::ingest::opencv {

/// cv::QRCodeDetector backed decoder. A detector is built per call, so one
/// instance serves concurrent uploads.
class qr_code_detector final : public gatepass::ingest::qr_decoder {
 public:
  std::optional<std::string> decode(
      const gatepass::ingest::image& frame) override;
};

}  // namespace gatepass::ingest::opencv
