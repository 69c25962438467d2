#include <gatepass/crypto/key_file.hpp>
#include <gatepass/crypto/random.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

namespace gatepass::crypto {

namespace {

std::string trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

}  // namespace

std::optional<gatepass::schema::secret_key_t> load_secret(
    const std::filesystem::path& path) {
  auto input = std::ifstream{path};
  if (!input) {
    spdlog::error("Failed to read secret key file {}", path.string());
    return std::nullopt;
  }
  auto contents = std::stringstream{};
  contents << input.rdbuf();
  auto secret = gatepass::schema::try_make_hash32(trim(contents.str()));
  if (!secret) {
    spdlog::error("Secret key file {} must hold exactly 64 hex characters",
                  path.string());
    return std::nullopt;
  }
  return secret;
}

std::optional<gatepass::schema::secret_key_t> create_secret(
    const std::filesystem::path& path) {
  auto fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd < 0) {
    spdlog::error("Failed to create secret key file {}: {}", path.string(),
                  std::strerror(errno));
    return std::nullopt;
  }
  auto secret = random_hash32();
  auto text = gatepass::schema::to_hex(secret);
  text.push_back('\n');
  auto written = ::write(fd, text.data(), text.size());
  auto synced = ::fsync(fd) == 0;
  ::close(fd);
  if (written != static_cast<ssize_t>(text.size()) || !synced) {
    spdlog::error("Failed to write secret key file {}", path.string());
    return std::nullopt;
  }
  spdlog::info("Generated new secret key file {}", path.string());
  return secret;
}

std::optional<gatepass::schema::secret_key_t> load_or_create_secret(
    const std::filesystem::path& path) {
  auto error = std::error_code{};
  if (std::filesystem::exists(path, error)) {
    return load_secret(path);
  }
  if (error) {
    spdlog::error("Failed to stat secret key file {}: {}", path.string(),
                  error.message());
    return std::nullopt;
  }
  return create_secret(path);
}

}  // namespace gatepass::crypto
