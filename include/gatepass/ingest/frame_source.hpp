#pragma once

#include <gatepass/ingest/image.hpp>

#include <optional>

namespace gatepass::ingest {

/// A local imaging device. Only the camera loop thread calls next_frame().
class frame_source {
 public:
  virtual ~frame_source() = default;

  virtual bool is_open() const = 0;

  /// Blocks until the next frame; std::nullopt means end of stream.
  virtual std::optional<image> next_frame() = 0;
};

}  // namespace gatepass::ingest
