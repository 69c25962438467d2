#pragma once

#include <gatepass/ingest/frame_source.hpp>

#include <opencv2/videoio.hpp>

#include <cstdint>
#include <optional>

namespace gatepass::ingest::opencv {

struct video_capture_options final {
  int device_index{0};
  int frame_width{640};
  int frame_height{480};
  /// Consecutive failed reads before the device is treated as gone.
  uint32_t max_read_failures{30};
};

/// Grayscale frames from a local camera through cv::VideoCapture.
class video_capture_source final : public gatepass::ingest::frame_source {
 public:
  explicit video_capture_source(video_capture_options options = {});
  ~video_capture_source() override;

  bool is_open() const override;
  std::optional<gatepass::ingest::image> next_frame() override;

 private:
  video_capture_options options_;
  cv::VideoCapture capture_;
};

}  // namespace gatepass::ingest::opencv
