#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <gatepass/admin/service.hpp>
#include <gatepass/audit/audit_log.hpp>
#include <gatepass/blake3/hash.hpp>
#include <gatepass/codec/token_codec.hpp>
#include <gatepass/common/clock.hpp>
#include <gatepass/common/critical.hpp>
#include <gatepass/config/options.hpp>
#include <gatepass/crypto/key_file.hpp>
#include <gatepass/ingest/camera_adapter.hpp>
#include <gatepass/ingest/scan_submitter.hpp>
#include <gatepass/ingest/upload_adapter.hpp>
#include <gatepass/rpc/server.hpp>
#include <gatepass/store/credential_store.hpp>
#include <gatepass/verification/engine.hpp>
#ifdef GATEPASS_WITH_OPENCV
#include <gatepass/ingest/opencv/qr_code_detector.hpp>
#include <gatepass/ingest/opencv/video_capture_source.hpp>
#endif
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto error = std::string{};
  auto options = gatepass::config::parse_options(argc, argv, error);
  if (!options) {
    std::cerr << "gatepass: " << error << "\n"
              << gatepass::config::make_description() << std::endl;
    return 1;
  }
  if (options->show_help) {
    std::cout << gatepass::config::make_description() << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options->log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "gatepass", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options->log_level));

  if (options->config_file) {
    spdlog::info("Loaded configuration from {}", *options->config_file);
  }
  if (options->admin_token.empty()) {
    spdlog::warn("No admin token configured; admin calls are disabled");
  }

  auto root_secret = gatepass::crypto::load_or_create_secret(options->secret_file);
  if (!root_secret) {
    gatepass::common::critical("Cannot load the root secret");
  }

  auto encoder = gatepass::schema::encoding::scale_encoder_t{};
  auto storage = gatepass::storage::make_storage<
      gatepass::storage::rocksdb_storage_tag>(options->database_path);
  auto codec = gatepass::codec::token_codec::from_root_secret(*root_secret);
  auto credentials =
      gatepass::store::credential_store{encoder, storage, codec,
                                        gatepass::common::system_clock()};
  auto audit = gatepass::audit::audit_log{encoder, storage};
  auto engine = gatepass::verification::engine{codec, credentials, audit};
  spdlog::info("Audit log resumes after sequence {}", audit.last_sequence());

  auto admin = gatepass::admin::service{
      credentials, audit, gatepass::common::system_clock(),
      gatepass::blake3::derive_key(gatepass::crypto::kContactSealKeyContext,
                                   *root_secret),
      gatepass::admin::service_options{.max_ttl_seconds =
                                           options->max_ttl_seconds}};

  auto decoder = std::unique_ptr<gatepass::ingest::qr_decoder>{};
#ifdef GATEPASS_WITH_OPENCV
  decoder = std::make_unique<gatepass::ingest::opencv::qr_code_detector>();
#else
  spdlog::warn("Built without OpenCV; image scans and the camera loop are "
               "unavailable");
#endif
  auto submitter = gatepass::ingest::engine_submitter{
      engine, gatepass::common::system_clock(), decoder.get()};
  auto uploads = gatepass::ingest::upload_adapter{
      submitter, std::vector<std::string>{options->camera_checkpoint_id}};

  auto camera = std::unique_ptr<gatepass::ingest::camera_adapter>{};
  if (options->camera_device) {
#ifdef GATEPASS_WITH_OPENCV
    auto source = std::make_unique<gatepass::ingest::opencv::video_capture_source>(
        gatepass::ingest::opencv::video_capture_options{
            .device_index = *options->camera_device});
    camera = std::make_unique<gatepass::ingest::camera_adapter>(
        std::move(source), *decoder, submitter,
        gatepass::common::system_clock(),
        gatepass::ingest::camera_options{
            .checkpoint_id = options->camera_checkpoint_id,
            .debounce = options->camera_debounce_ms,
            .decode_every = options->camera_decode_every});
    camera->set_result_handler(
        [](const std::string&, const gatepass::ingest::submit_result& result) {
          if (result.verification &&
              result.verification->outcome ==
                  gatepass::schema::scan_outcome_t::admitted) {
            spdlog::info("Welcome, {}",
                         result.verification->subject.value_or(""));
          }
        });
    if (!camera->start()) {
      spdlog::error("Camera {} did not open; camera loop disabled",
                    *options->camera_device);
      camera.reset();
    }
#else
    spdlog::warn("camera-device {} ignored: built without OpenCV",
                 *options->camera_device);
#endif
  }

  spdlog::info("gRPC service listening on {}", options->listen_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener =
      gatepass::rpc::listener{admin, uploads, options->admin_token};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options->listen_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    gatepass::common::critical("Failed to start the gRPC server");
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }
  if (camera) {
    camera->stop();
  }

  spdlog::shutdown();
  return 0;
}
