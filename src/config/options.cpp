#include <gatepass/config/options.hpp>
#include <gatepass/ingest/upload_adapter.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <string>
#include <string_view>

namespace gatepass::config {

namespace po = boost::program_options;

namespace {

/// GATEPASS_ADMIN_TOKEN -> admin-token; unknown names map to "" (ignored).
std::string environment_name_mapper(const std::string& name) {
  auto prefix = std::string_view{kEnvironmentPrefix};
  if (!std::string_view{name}.starts_with(prefix)) {
    return {};
  }
  auto option = name.substr(prefix.size());
  std::transform(std::begin(option), std::end(option), std::begin(option),
                 [](const unsigned char c) {
                   return c == '_' ? '-' : static_cast<char>(std::tolower(c));
                 });
  static const auto known = make_description();
  if (known.find_nothrow(option, false) == nullptr) {
    return {};
  }
  return option;
}

bool validate(const options& parsed, std::string& error) {
  auto level = spdlog::level::from_str(parsed.log_level);
  if (level == spdlog::level::off && parsed.log_level != "off") {
    error = "unknown log level '" + parsed.log_level + "'";
    return false;
  }
  if (parsed.max_ttl_seconds == 0) {
    error = "max-ttl must be positive";
    return false;
  }
  if (parsed.max_ttl_seconds > kMaxTtlLimitSeconds) {
    error = "max-ttl must not exceed " + std::to_string(kMaxTtlLimitSeconds) +
            " seconds";
    return false;
  }
  if (parsed.camera_decode_every == 0) {
    error = "camera-decode-every must be at least 1";
    return false;
  }
  if (parsed.camera_device && *parsed.camera_device < 0) {
    error = "camera-device must be a non-negative index";
    return false;
  }
  if (!gatepass::ingest::is_valid_checkpoint_id(
          parsed.camera_checkpoint_id)) {
    error = "camera-checkpoint must be 1 to " +
            std::to_string(gatepass::ingest::kMaxCheckpointIdLength) +
            " visible characters";
    return false;
  }
  if (parsed.listen_address.empty()) {
    error = "listen address must not be empty";
    return false;
  }
  return true;
}

}  // namespace

po::options_description make_description() {
  auto description = po::options_description{"gatepass"};
  // clang-format off
  description.add_options()
      ("help,h", "Show the help message")
      ("config,c", po::value<std::string>(), "INI style configuration file")
      ("listen,l", po::value<std::string>()->default_value("0.0.0.0:50051"),
       "IP:Port for the gRPC server")
      ("database,d", po::value<std::string>()->default_value("gatepass.db"),
       "RocksDB directory")
      ("secret-file", po::value<std::string>()->default_value("gatepass.key"),
       "Root secret file, created on first start")
      ("admin-token", po::value<std::string>()->default_value(""),
       "Bearer token for admin calls; empty disables them")
      ("max-ttl", po::value<uint64_t>()->default_value(24 * 60 * 60),
       "Longest credential lifetime in seconds")
      ("log-level", po::value<std::string>()->default_value("info"),
       "trace, debug, info, warn, err, critical or off")
      ("log-file", po::value<std::string>()->default_value("gatepass.log"),
       "Log file path")
      ("camera-device", po::value<int>(),
       "Local camera index; omit to disable the camera loop")
      ("camera-checkpoint", po::value<std::string>()->default_value("local-camera"),
       "Checkpoint id recorded for camera scans")
      ("camera-debounce-ms", po::value<uint64_t>()->default_value(3000),
       "Window in which a repeated payload is not resubmitted")
      ("camera-decode-every", po::value<uint32_t>()->default_value(3),
       "Decode one camera frame out of every N");
  // clang-format on
  return description;
}

std::optional<options> parse_options(const int argc,
                                     const char* const argv[],
                                     std::string& error) {
  auto description = make_description();
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::store(po::parse_environment(description, environment_name_mapper), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        error = "cannot read config file '" + path + "'";
        return std::nullopt;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return std::nullopt;
  }

  auto parsed = options{};
  parsed.show_help = vm.contains("help");
  if (vm.contains("config")) {
    parsed.config_file = vm["config"].as<std::string>();
  }
  parsed.listen_address = vm["listen"].as<std::string>();
  parsed.database_path = vm["database"].as<std::string>();
  parsed.secret_file = vm["secret-file"].as<std::string>();
  parsed.admin_token = vm["admin-token"].as<std::string>();
  parsed.max_ttl_seconds = vm["max-ttl"].as<uint64_t>();
  parsed.log_level = vm["log-level"].as<std::string>();
  parsed.log_file = vm["log-file"].as<std::string>();
  if (vm.contains("camera-device")) {
    parsed.camera_device = vm["camera-device"].as<int>();
  }
  parsed.camera_checkpoint_id = vm["camera-checkpoint"].as<std::string>();
  parsed.camera_debounce_ms = vm["camera-debounce-ms"].as<uint64_t>();
  parsed.camera_decode_every = vm["camera-decode-every"].as<uint32_t>();

  if (!validate(parsed, error)) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace gatepass::config
