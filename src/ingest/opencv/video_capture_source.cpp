#include <gatepass/ingest/opencv/video_capture_source.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace gatepass::ingest::opencv {

video_capture_source::video_capture_source(video_capture_options options)
    : options_{std::move(options)}, capture_{options_.device_index} {
  if (!capture_.isOpened()) {
    spdlog::warn("Camera device {} is not available", options_.device_index);
    return;
  }
  capture_.set(cv::CAP_PROP_FRAME_WIDTH, options_.frame_width);
  capture_.set(cv::CAP_PROP_FRAME_HEIGHT, options_.frame_height);
  spdlog::info("Opened camera device {}", options_.device_index);
}

video_capture_source::~video_capture_source() {
  capture_.release();
}

bool video_capture_source::is_open() const {
  return capture_.isOpened();
}

std::optional<gatepass::ingest::image> video_capture_source::next_frame() {
  auto failures = uint32_t{};
  auto frame = cv::Mat{};
  while (capture_.isOpened()) {
    if (capture_.read(frame) && !frame.empty()) {
      auto gray = cv::Mat{};
      if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
      } else if (frame.channels() == 1) {
        gray = frame;
      } else {
        return std::nullopt;
      }
      if (!gray.isContinuous()) {
        gray = gray.clone();
      }
      auto out = gatepass::ingest::image{};
      out.format = gatepass::ingest::pixel_format_t::gray8;
      out.width = static_cast<uint32_t>(gray.cols);
      out.height = static_cast<uint32_t>(gray.rows);
      out.data.assign(gray.datastart, gray.dataend);
      return out;
    }
    if (++failures >= options_.max_read_failures) {
      spdlog::error("Camera device {} stopped delivering frames",
                    options_.device_index);
      capture_.release();
    }
  }
  return std::nullopt;
}

}  // namespace gatepass::ingest::opencv
