#include <gatepass/ingest/scan_submitter.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace gatepass::ingest {

engine_submitter::engine_submitter(gatepass::verification::engine& engine,
                                   gatepass::common::clock_t clock,
                                   qr_decoder* decoder)
    : engine_{engine}, clock_{std::move(clock)}, decoder_{decoder} {}

submit_result engine_submitter::submit(const scan_submission& submission) {
  auto payload = std::optional<std::string>{};
  if (const auto* text = std::get_if<std::string>(&submission.content)) {
    payload = *text;
  } else {
    if (decoder_ == nullptr) {
      spdlog::warn("Image submitted at checkpoint '{}' but no decoder is "
                   "configured",
                   submission.checkpoint_id);
      return submit_result{.status = submit_status_t::decoder_unavailable,
                           .verification = std::nullopt};
    }
    const auto& frame = std::get<image>(submission.content);
    if (is_well_formed(frame)) {
      payload = decoder_->decode(frame);
    }
    if (!payload) {
      spdlog::debug("No QR code found in image from checkpoint '{}'",
                    submission.checkpoint_id);
      return submit_result{.status = submit_status_t::no_payload,
                           .verification = std::nullopt};
    }
  }

  auto metadata = gatepass::verification::scan_metadata{
      .source = submission.source,
      .timestamp = clock_(),
      .checkpoint_id = submission.checkpoint_id};
  return submit_result{.status = submit_status_t::evaluated,
                       .verification = engine_.verify(*payload, metadata)};
}

}  // namespace gatepass::ingest
