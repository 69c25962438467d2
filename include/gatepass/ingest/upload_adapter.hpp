#pragma once

#include <gatepass/ingest/image.hpp>
#include <gatepass/ingest/scan_submitter.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gatepass::ingest {

inline constexpr auto kMaxCheckpointIdLength = size_t{64};

/// Non-empty, at most kMaxCheckpointIdLength visible ASCII characters.
bool is_valid_checkpoint_id(std::string_view checkpoint_id);

/// Request-driven path for browser and mobile clients. Stateless, so any
/// number of callers may use it concurrently.
///
/// Checkpoint ids arrive from unauthenticated clients. Malformed ids and the
/// ids in `reserved_checkpoint_ids` (the local camera's, for one) are refused
/// before anything reaches the engine.
class upload_adapter final {
 public:
  explicit upload_adapter(scan_submitter& submitter,
                          std::vector<std::string> reserved_checkpoint_ids = {});

  submit_result submit_payload(std::string payload, std::string checkpoint_id);

  submit_result submit_image(image frame, std::string checkpoint_id);

 private:
  bool accepts(std::string_view checkpoint_id) const;

  scan_submitter& submitter_;
  std::vector<std::string> reserved_checkpoint_ids_;
};

}  // namespace gatepass::ingest
