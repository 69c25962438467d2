#include <gatepass/common/critical.hpp>
#include <gatepass/crypto/random.hpp>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <spdlog/spdlog.h>

#include <limits>

namespace gatepass::crypto {

namespace {

void fill_random(uint8_t* out, const size_t size) {
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    gatepass::common::critical("random request too large");
  }
  if (RAND_bytes(out, static_cast<int>(size)) != 1) {
    spdlog::error("RAND_bytes failed: {}", ERR_get_error());
    gatepass::common::critical("OpenSSL random generator unavailable");
  }
}

}  // namespace

gatepass::schema::bytes_t random_bytes(const size_t size) {
  auto out = gatepass::schema::bytes_t(size);
  fill_random(out.data(), out.size());
  return out;
}

gatepass::schema::hash32_t random_hash32() {
  auto out = gatepass::schema::hash32_t{};
  fill_random(out.data(), out.size());
  return out;
}

bool constant_time_equal(const gatepass::schema::bytes_view_t& lhs,
                         const gatepass::schema::bytes_view_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  if (lhs.empty()) {
    return true;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace gatepass::crypto
