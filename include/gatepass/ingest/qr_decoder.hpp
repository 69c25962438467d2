#pragma once

#include <gatepass/ingest/image.hpp>

#include <optional>
#include <string>

namespace gatepass::ingest {

/// Image to text primitive. Implementations must tolerate concurrent calls.
class qr_decoder {
 public:
  virtual ~qr_decoder() = default;

  /// Text of the first QR code found, or std::nullopt when there is none.
  virtual std::optional<std::string> decode(const image& frame) = 0;
};

}  // namespace gatepass::ingest
