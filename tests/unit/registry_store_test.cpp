#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "shspec/substitution/registry.hpp"
#include "shspec/substitution/registry_store.hpp"

namespace shspec::substitution {
namespace {

class RegistryStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("shspec_registry_store_" +
            std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::filesystem::remove_all(dir_);
  }

  [[nodiscard]] auto StatePath() const -> std::filesystem::path {
    return dir_ / kRegistryFileName;
  }

  std::filesystem::path dir_;
};

TEST_F(RegistryStoreTest, MissingFileIsEmptyRegistry) {
  auto loaded = LoadRegistry(StatePath());
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->Empty());
}

TEST_F(RegistryStoreTest, EntriesSurviveSaveAndLoadByteForByte) {
  SubstitutionRegistry registry;
  std::string body = "  echo \"quoted\" 'single' $HOME\n\tprintf '%s\\n' x";
  std::string original = "helper () \n{ \n    echo real\n}";
  ASSERT_TRUE(registry.MockCommand("curl", body).has_value());
  ASSERT_TRUE(registry.StubProcedure("helper", "echo: fake", original));

  ASSERT_TRUE(SaveRegistry(registry, StatePath()).has_value());
  auto loaded = LoadRegistry(StatePath());
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->Entries(), registry.Entries());
}

TEST_F(RegistryStoreTest, SaveReplacesPreviousState) {
  SubstitutionRegistry registry;
  ASSERT_TRUE(registry.MockCommand("curl", "true").has_value());
  ASSERT_TRUE(SaveRegistry(registry, StatePath()).has_value());

  registry.RemoveAll();
  ASSERT_TRUE(SaveRegistry(registry, StatePath()).has_value());

  auto loaded = LoadRegistry(StatePath());
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->Empty());
  EXPECT_FALSE(std::filesystem::exists(dir_ / "registry.yaml.tmp"));
}

TEST_F(RegistryStoreTest, UnknownKindIsAnError) {
  std::ofstream(StatePath())
      << "entries:\n  - target: x\n    kind: alias\n    body: y\n";
  auto loaded = LoadRegistry(StatePath());
  ASSERT_FALSE(loaded.has_value());
  EXPECT_NE(loaded.error().message.find("alias"), std::string::npos);
}

}  // namespace
}  // namespace shspec::substitution
