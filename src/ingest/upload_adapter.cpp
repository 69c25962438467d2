#include <gatepass/ingest/upload_adapter.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace gatepass::ingest {

bool is_valid_checkpoint_id(const std::string_view checkpoint_id) {
  return !checkpoint_id.empty() &&
         checkpoint_id.size() <= kMaxCheckpointIdLength &&
         std::all_of(std::begin(checkpoint_id), std::end(checkpoint_id),
                     [](const char c) { return c > 0x20 && c < 0x7F; });
}

upload_adapter::upload_adapter(scan_submitter& submitter,
                               std::vector<std::string> reserved_checkpoint_ids)
    : submitter_{submitter},
      reserved_checkpoint_ids_{std::move(reserved_checkpoint_ids)} {}

bool upload_adapter::accepts(const std::string_view checkpoint_id) const {
  if (!is_valid_checkpoint_id(checkpoint_id)) {
    spdlog::warn("Rejected upload with a malformed checkpoint id ({} bytes)",
                 checkpoint_id.size());
    return false;
  }
  if (std::find(std::begin(reserved_checkpoint_ids_),
                std::end(reserved_checkpoint_ids_),
                checkpoint_id) != std::end(reserved_checkpoint_ids_)) {
    spdlog::warn("Rejected upload claiming reserved checkpoint '{}'",
                 checkpoint_id);
    return false;
  }
  return true;
}

submit_result upload_adapter::submit_payload(std::string payload,
                                             std::string checkpoint_id) {
  if (!accepts(checkpoint_id)) {
    return submit_result{.status = submit_status_t::invalid_checkpoint,
                         .verification = std::nullopt};
  }
  return submitter_.submit(scan_submission{
      .content = std::move(payload),
      .source = gatepass::schema::scan_source_t::mobile_upload,
      .checkpoint_id = std::move(checkpoint_id)});
}

submit_result upload_adapter::submit_image(image frame,
                                           std::string checkpoint_id) {
  if (!accepts(checkpoint_id)) {
    return submit_result{.status = submit_status_t::invalid_checkpoint,
                         .verification = std::nullopt};
  }
  return submitter_.submit(scan_submission{
      .content = std::move(frame),
      .source = gatepass::schema::scan_source_t::mobile_upload,
      .checkpoint_id = std::move(checkpoint_id)});
}

}  // namespace gatepass::ingest
