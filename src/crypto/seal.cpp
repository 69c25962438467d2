#include <gatepass/common/critical.hpp>
#include <gatepass/crypto/random.hpp>
#include <gatepass/crypto/seal.hpp>

#include <openssl/evp.h>

#include <array>
#include <iterator>
#include <memory>

namespace gatepass::crypto {

namespace {

using evp_cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

evp_cipher_ctx_ptr make_cipher_context() {
  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx) {
    gatepass::common::critical("failed to allocate cipher context");
  }
  return ctx;
}

}  // namespace

gatepass::schema::bytes_t seal(
    const gatepass::schema::secret_key_t& key,
    const gatepass::schema::bytes_view_t& plaintext) {
  auto nonce = random_bytes(kSealNonceSize);
  auto ctx = make_cipher_context();

  auto out = gatepass::schema::bytes_t{};
  out.reserve(kSealNonceSize + plaintext.size() + kSealTagSize);
  out.insert(std::end(out), std::begin(nonce), std::end(nonce));
  out.resize(kSealNonceSize + plaintext.size());

  auto length = 0;
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kSealNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         nonce.data()) != 1) {
    gatepass::common::critical("failed to initialize AES-256-GCM");
  }
  if (EVP_EncryptUpdate(ctx.get(), out.data() + kSealNonceSize, &length,
                        plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    gatepass::common::critical("AES-256-GCM encryption failed");
  }
  auto final_length = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + kSealNonceSize + length,
                          &final_length) != 1) {
    gatepass::common::critical("AES-256-GCM finalization failed");
  }

  auto tag = std::array<uint8_t, kSealTagSize>{};
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1) {
    gatepass::common::critical("failed to read AES-256-GCM tag");
  }
  out.insert(std::end(out), std::begin(tag), std::end(tag));
  return out;
}

std::optional<gatepass::schema::bytes_t> unseal(
    const gatepass::schema::secret_key_t& key,
    const gatepass::schema::bytes_view_t& sealed) {
  if (sealed.size() < kSealNonceSize + kSealTagSize) {
    return std::nullopt;
  }
  auto nonce = sealed.subspan(0, kSealNonceSize);
  auto ciphertext = sealed.subspan(
      kSealNonceSize, sealed.size() - kSealNonceSize - kSealTagSize);
  auto tag = gatepass::schema::make_bytes(
      sealed.subspan(sealed.size() - kSealTagSize));

  auto ctx = make_cipher_context();
  auto out = gatepass::schema::bytes_t(ciphertext.size());
  auto length = 0;
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kSealNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         nonce.data()) != 1) {
    return std::nullopt;
  }
  if (EVP_DecryptUpdate(ctx.get(), out.data(), &length, ciphertext.data(),
                        static_cast<int>(ciphertext.size())) != 1) {
    return std::nullopt;
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1) {
    return std::nullopt;
  }
  auto final_length = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + length, &final_length) !=
      1) {
    return std::nullopt;
  }
  out.resize(static_cast<size_t>(length + final_length));
  return out;
}

}  // namespace gatepass::crypto
