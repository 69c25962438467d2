#pragma once

#include <boost/program_options/options_description.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace gatepass::config {

inline constexpr auto kEnvironmentPrefix = "GATEPASS_";
/// Ten years; keeps issue-time expiry arithmetic far from overflow.
inline constexpr uint64_t kMaxTtlLimitSeconds = uint64_t{3650} * 24 * 60 * 60;

struct options final {
  std::string listen_address{"0.0.0.0:50051"};
  std::string database_path{"gatepass.db"};
  std::string secret_file{"gatepass.key"};
  /// Empty disables every admin RPC.
  std::string admin_token;
  uint64_t max_ttl_seconds{24 * 60 * 60};
  std::string log_level{"info"};
  std::string log_file{"gatepass.log"};
  /// Absent means no local camera loop.
  std::optional<int> camera_device;
  std::string camera_checkpoint_id{"local-camera"};
  uint64_t camera_debounce_ms{3000};
  uint32_t camera_decode_every{3};
  std::optional<std::string> config_file;
  bool show_help{false};
};

boost::program_options::options_description make_description();

/// Command line first, then GATEPASS_* environment variables, then the
/// optional --config file; the first source to set a value wins.
/// Returns std::nullopt and sets `error` on invalid input.
std::optional<options> parse_options(int argc,
                                     const char* const argv[],
                                     std::string& error);

}  // namespace gatepass::config
