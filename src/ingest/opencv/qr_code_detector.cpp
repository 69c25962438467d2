#include <gatepass/ingest/opencv/qr_code_detector.hpp>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>

#include <spdlog/spdlog.h>

#include <vector>

namespace gatepass::ingest::opencv {

namespace {

cv::Mat to_gray(const gatepass::ingest::image& frame) {
  // The Mat headers below alias frame.data; callers only read from them.
  auto* data = const_cast<uint8_t*>(frame.data.data());
  switch (frame.format) {
    case gatepass::ingest::pixel_format_t::encoded:
      return cv::imdecode(cv::Mat{1, static_cast<int>(frame.data.size()),
                                  CV_8UC1, data},
                          cv::IMREAD_GRAYSCALE);
    case gatepass::ingest::pixel_format_t::gray8:
      return cv::Mat{static_cast<int>(frame.height),
                     static_cast<int>(frame.width), CV_8UC1, data};
    case gatepass::ingest::pixel_format_t::bgr24: {
      auto gray = cv::Mat{};
      cv::cvtColor(cv::Mat{static_cast<int>(frame.height),
                           static_cast<int>(frame.width), CV_8UC3, data},
                   gray, cv::COLOR_BGR2GRAY);
      return gray;
    }
  }
  return {};
}

}  // namespace

std::optional<std::string> qr_code_detector::decode(
    const gatepass::ingest::image& frame) {
  if (!gatepass::ingest::is_well_formed(frame)) {
    return std::nullopt;
  }
  try {
    auto gray = to_gray(frame);
    if (gray.empty()) {
      return std::nullopt;
    }
    auto detector = cv::QRCodeDetector{};
    auto points = std::vector<cv::Point2f>{};
    auto text = detector.detectAndDecode(gray, points);
    if (text.empty()) {
      return std::nullopt;
    }
    return text;
  } catch (const cv::Exception& e) {
    spdlog::warn("OpenCV failed to decode image: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace gatepass::ingest::opencv
