#include <gatepass/crypto/base64.hpp>

#include <openssl/evp.h>

#include <algorithm>

namespace gatepass::crypto {

namespace {

bool is_url_character(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_';
}

}  // namespace

std::string base64url_encode(const gatepass::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return {};
  }
  auto encoded = std::string(4 * ((bytes.size() + 2) / 3), '\0');
  auto written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                      bytes.data(), static_cast<int>(bytes.size()));
  encoded.resize(static_cast<size_t>(written));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  std::replace(std::begin(encoded), std::end(encoded), '+', '-');
  std::replace(std::begin(encoded), std::end(encoded), '/', '_');
  return encoded;
}

std::optional<gatepass::schema::bytes_t> base64url_decode(
    const std::string_view text) {
  if (text.empty()) {
    return gatepass::schema::bytes_t{};
  }
  if (text.size() % 4 == 1) {
    return std::nullopt;
  }
  if (!std::all_of(std::begin(text), std::end(text), is_url_character)) {
    return std::nullopt;
  }

  auto padded = std::string{text};
  std::replace(std::begin(padded), std::end(padded), '-', '+');
  std::replace(std::begin(padded), std::end(padded), '_', '/');
  auto padding = (4 - padded.size() % 4) % 4;
  padded.append(padding, '=');

  auto decoded = gatepass::schema::bytes_t(3 * (padded.size() / 4));
  auto written = EVP_DecodeBlock(
      decoded.data(), reinterpret_cast<const unsigned char*>(padded.data()),
      static_cast<int>(padded.size()));
  if (written < 0 || static_cast<size_t>(written) < padding) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts padding as zero bytes.
  decoded.resize(static_cast<size_t>(written) - padding);

  if (base64url_encode(decoded) != text) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace gatepass::crypto
