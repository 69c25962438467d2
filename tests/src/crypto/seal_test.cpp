#include <gtest/gtest.h>
#include <gatepass/crypto/seal.hpp>
#include <gatepass/testing/common.hpp>

#include <string>

TEST(seal, opens_with_the_same_key) {
  auto key = gatepass::testing::make_hash(5);
  auto phone = std::string{"5551234567"};

  auto sealed =
      gatepass::crypto::seal(key, gatepass::schema::make_bytes_view(phone));
  EXPECT_EQ(sealed.size(), gatepass::crypto::kSealNonceSize + phone.size() +
                               gatepass::crypto::kSealTagSize);

  auto opened =
      gatepass::crypto::unseal(key, gatepass::schema::make_bytes_view(sealed));
  ASSERT_TRUE(opened.has_value());
  EXPECT_EQ(gatepass::schema::make_string(*opened), phone);
}

TEST(seal, uses_a_fresh_nonce_per_call) {
  auto key = gatepass::testing::make_hash(5);
  auto text = std::string{"same plaintext"};
  auto first =
      gatepass::crypto::seal(key, gatepass::schema::make_bytes_view(text));
  auto second =
      gatepass::crypto::seal(key, gatepass::schema::make_bytes_view(text));
  EXPECT_NE(first, second);
}

TEST(seal, rejects_wrong_key_and_tampering) {
  auto key = gatepass::testing::make_hash(5);
  auto text = std::string{"delivery"};
  auto sealed =
      gatepass::crypto::seal(key, gatepass::schema::make_bytes_view(text));

  EXPECT_FALSE(gatepass::crypto::unseal(gatepass::testing::make_hash(6),
                                        gatepass::schema::make_bytes_view(sealed))
                   .has_value());

  auto tampered = sealed;
  tampered[gatepass::crypto::kSealNonceSize] ^= 0x01;
  EXPECT_FALSE(gatepass::crypto::unseal(
                   key, gatepass::schema::make_bytes_view(tampered))
                   .has_value());
}

TEST(seal, rejects_truncated_input) {
  auto key = gatepass::testing::make_hash(5);
  auto short_input = gatepass::schema::bytes_t(
      gatepass::crypto::kSealNonceSize + gatepass::crypto::kSealTagSize - 1);
  EXPECT_FALSE(gatepass::crypto::unseal(
                   key, gatepass::schema::make_bytes_view(short_input))
                   .has_value());
}
