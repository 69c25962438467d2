#include <gtest/gtest.h>
#include <gatepass/crypto/key_file.hpp>
#include <gatepass/testing/common.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace {

class key_file_test : public ::testing::Test {
 protected:
  void SetUp() override {
    directory_ = gatepass::testing::make_db_path("gatepass_key_file");
    std::filesystem::create_directories(directory_);
  }
  void TearDown() override { gatepass::testing::remove_path(directory_); }

  std::filesystem::path path(const std::string& name) const {
    return std::filesystem::path{directory_} / name;
  }

  std::string directory_;
};

}  // namespace

TEST_F(key_file_test, creates_secret_once_and_reloads_it) {
  auto file = path("root.key");
  auto created = gatepass::crypto::load_or_create_secret(file);
  ASSERT_TRUE(created.has_value());
  ASSERT_TRUE(std::filesystem::exists(file));

  auto reloaded = gatepass::crypto::load_or_create_secret(file);
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(*created, *reloaded);
}

TEST_F(key_file_test, created_file_is_owner_only) {
  auto file = path("private.key");
  ASSERT_TRUE(gatepass::crypto::create_secret(file).has_value());
  auto status = std::filesystem::status(file);
  auto perms = status.permissions();
  EXPECT_EQ(perms & (std::filesystem::perms::group_all |
                     std::filesystem::perms::others_all),
            std::filesystem::perms::none);
}

TEST_F(key_file_test, create_refuses_to_overwrite) {
  auto file = path("existing.key");
  ASSERT_TRUE(gatepass::crypto::create_secret(file).has_value());
  EXPECT_FALSE(gatepass::crypto::create_secret(file).has_value());
}

TEST_F(key_file_test, load_accepts_hand_written_hex) {
  auto file = path("manual.key");
  {
    auto out = std::ofstream{file};
    out << "  " << gatepass::schema::to_hex(gatepass::testing::make_hash(3))
        << "\n\n";
  }
  auto loaded = gatepass::crypto::load_secret(file);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, gatepass::testing::make_hash(3));
}

TEST_F(key_file_test, load_rejects_malformed_contents) {
  auto file = path("broken.key");
  {
    auto out = std::ofstream{file};
    out << "not a key\n";
  }
  EXPECT_FALSE(gatepass::crypto::load_secret(file).has_value());
  EXPECT_FALSE(gatepass::crypto::load_or_create_secret(file).has_value());
}
