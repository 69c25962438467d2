#pragma once

#include <gatepass/common/clock.hpp>
#include <gatepass/ingest/frame_source.hpp>
#include <gatepass/ingest/qr_decoder.hpp>
#include <gatepass/ingest/scan_submitter.hpp>
#include <gatepass/schema/primitives.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace gatepass::ingest {

struct camera_options final {
  std::string checkpoint_id{"local-camera"};
  /// Identical payload text seen again within this window is not resubmitted.
  gatepass::schema::duration_milliseconds_t debounce{3000};
  /// Decode one frame out of every N.
  uint32_t decode_every{1};
};

struct camera_stats final {
  uint64_t frames{};
  uint64_t decoded{};
  uint64_t submitted{};
  uint64_t debounced{};
};

using camera_result_handler_t =
    std::function<void(const std::string& payload, const submit_result&)>;

/// Continuous capture, decode and submit loop on one background thread.
///
/// Frames without a QR code are dropped before reaching the engine. The loop
/// ends on stop() or when the frame source reports end of stream.
class camera_adapter final {
 public:
  camera_adapter(std::unique_ptr<frame_source> source,
                 qr_decoder& decoder,
                 scan_submitter& submitter,
                 gatepass::common::clock_t clock,
                 camera_options options = {});
  ~camera_adapter();

  camera_adapter(const camera_adapter&) = delete;
  camera_adapter& operator=(const camera_adapter&) = delete;

  /// No-op while already running. Returns false when the source is closed.
  bool start();

  /// Request the loop to end and join it. No-op when not running.
  void stop();

  /// Block until the loop has ended, by end of stream or by a stop() from
  /// another thread. Returns at once when not running.
  void wait();

  bool running() const;

  camera_stats stats() const;

  void set_result_handler(camera_result_handler_t handler);

 private:
  void run();
  void process(const image& frame);

  std::unique_ptr<frame_source> source_;
  qr_decoder& decoder_;
  scan_submitter& submitter_;
  gatepass::common::clock_t clock_;
  camera_options options_;

  mutable std::mutex lifecycle_mutex_;
  std::thread thread_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
  std::mutex finished_mutex_;
  std::condition_variable finished_;

  mutable std::mutex stats_mutex_;
  camera_stats stats_;
  camera_result_handler_t result_handler_;

  // Loop-thread state.
  std::optional<std::string> last_payload_;
  gatepass::schema::timestamp_milliseconds_t last_submitted_at_{};
  uint64_t frame_index_{};
};

}  // namespace gatepass::ingest
