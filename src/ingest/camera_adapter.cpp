#include <gatepass/ingest/camera_adapter.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace gatepass::ingest {

camera_adapter::camera_adapter(std::unique_ptr<frame_source> source,
                               qr_decoder& decoder,
                               scan_submitter& submitter,
                               gatepass::common::clock_t clock,
                               camera_options options)
    : source_{std::move(source)},
      decoder_{decoder},
      submitter_{submitter},
      clock_{std::move(clock)},
      options_{std::move(options)} {
  if (options_.decode_every == 0) {
    options_.decode_every = 1;
  }
}

camera_adapter::~camera_adapter() {
  stop();
}

bool camera_adapter::start() {
  auto lock = std::scoped_lock{lifecycle_mutex_};
  if (running_.load()) {
    return true;
  }
  if (!source_ || !source_->is_open()) {
    spdlog::warn("Camera source is not available; local scanning disabled");
    return false;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  stop_requested_.store(false);
  running_.store(true);
  last_payload_.reset();
  thread_ = std::thread{[this]() { run(); }};
  spdlog::info("Camera loop started for checkpoint '{}'",
               options_.checkpoint_id);
  return true;
}

void camera_adapter::stop() {
  auto lock = std::scoped_lock{lifecycle_mutex_};
  stop_requested_.store(true);
  if (thread_.joinable()) {
    thread_.join();
    spdlog::info("Camera loop stopped for checkpoint '{}'",
                 options_.checkpoint_id);
  }
}

void camera_adapter::wait() {
  auto lock = std::unique_lock{finished_mutex_};
  finished_.wait(lock, [this]() { return !running_.load(); });
}

bool camera_adapter::running() const {
  return running_.load();
}

camera_stats camera_adapter::stats() const {
  auto lock = std::scoped_lock{stats_mutex_};
  return stats_;
}

void camera_adapter::set_result_handler(camera_result_handler_t handler) {
  auto lock = std::scoped_lock{stats_mutex_};
  result_handler_ = std::move(handler);
}

void camera_adapter::run() {
  while (!stop_requested_.load()) {
    auto frame = std::optional<image>{};
    try {
      frame = source_->next_frame();
    } catch (const std::exception& e) {
      spdlog::error("Camera read failed: {}", e.what());
      break;
    }
    if (!frame) {
      spdlog::info("Camera stream ended");
      break;
    }
    process(*frame);
  }
  {
    auto lock = std::scoped_lock{finished_mutex_};
    running_.store(false);
  }
  finished_.notify_all();
}

void camera_adapter::process(const image& frame) {
  {
    auto lock = std::scoped_lock{stats_mutex_};
    ++stats_.frames;
  }
  if (frame_index_++ % options_.decode_every != 0) {
    return;
  }

  auto payload = decoder_.decode(frame);
  if (!payload) {
    return;
  }

  auto now = clock_();
  if (last_payload_ && *last_payload_ == *payload &&
      now - last_submitted_at_ < options_.debounce) {
    auto lock = std::scoped_lock{stats_mutex_};
    ++stats_.decoded;
    ++stats_.debounced;
    return;
  }
  last_payload_ = *payload;
  last_submitted_at_ = now;

  auto result = submitter_.submit(scan_submission{
      .content = *payload,
      .source = gatepass::schema::scan_source_t::local_camera,
      .checkpoint_id = options_.checkpoint_id});

  auto handler = camera_result_handler_t{};
  {
    auto lock = std::scoped_lock{stats_mutex_};
    ++stats_.decoded;
    ++stats_.submitted;
    handler = result_handler_;
  }
  if (handler) {
    handler(*payload, result);
  }
}

}  // namespace gatepass::ingest
