#include <gtest/gtest.h>
#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace shspec::test {
namespace {

class ConfigTest : public CliTestFixture {};

TEST_F(ConfigTest, DiscoverySectionIsHonored) {
  WriteConfig(
      "[discovery]\n"
      "root = \"specs\"\n"
      "prefix = \"check_\"\n");
  WriteFile(
      "specs/a_test.sh",
      "check_one() { true; }\n"
      "test_ignored() { false; }\n");
  WriteFile("b_test.sh", "check_outside() { false; }\n");

  auto result = Run({"run", "--tap"});

  EXPECT_EQ(result.exit_code, 0) << result.combined_output;
  EXPECT_NE(result.stdout_output.find("1..1\n"), std::string::npos)
      << result.stdout_output;
  EXPECT_NE(result.stdout_output.find("ok 1 - check_one"), std::string::npos);
}

TEST_F(ConfigTest, RootIsRelativeToConfigFile) {
  WriteConfig("[discovery]\nroot = \"specs\"\n");
  WriteFile("specs/a_test.sh", "test_one() { true; }\n");
  WriteFile("sub/placeholder", "");

  auto result = RunIn(TestDir() / "sub", {"list"});

  EXPECT_EQ(result.exit_code, 0) << result.combined_output;
  EXPECT_EQ(result.stdout_output, "a_test.sh:test_one\n");
}

TEST_F(ConfigTest, CommandLineOverridesConfig) {
  WriteConfig("[discovery]\nprefix = \"check_\"\n");
  WriteFile(
      "a_test.sh",
      "check_one() { true; }\n"
      "test_two() { true; }\n");

  auto result = Run({"list", "--prefix", "test_"});

  EXPECT_EQ(result.exit_code, 0) << result.combined_output;
  EXPECT_EQ(result.stdout_output, "a_test.sh:test_two\n");
}

TEST_F(ConfigTest, ReportSectionSelectsTap) {
  WriteConfig("[report]\ntap = true\n");
  WriteFile("a_test.sh", "test_one() { true; }\n");

  auto result = Run({"run"});

  EXPECT_EQ(result.exit_code, 0) << result.combined_output;
  EXPECT_EQ(result.stdout_output.rfind("TAP version 13\n", 0), 0U)
      << result.stdout_output;
}

TEST_F(ConfigTest, MalformedConfigIsConfigError) {
  WriteConfig("[discovery\nroot = \n");

  auto result = Run({"run"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(result.stderr_output.find("shspec.toml"), std::string::npos)
      << result.stderr_output;
}

TEST_F(ConfigTest, WrongValueTypeIsConfigError) {
  WriteConfig("[discovery]\nprefix = 3\n");

  auto result = Run({"list"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(
      result.stderr_output.find("'discovery.prefix' must be a string"),
      std::string::npos)
      << result.stderr_output;
}

TEST_F(ConfigTest, InvalidPrefixIsConfigError) {
  auto result = Run({"run", "--prefix", "1x"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(result.stderr_output.find("'1x'"), std::string::npos)
      << result.stderr_output;
}

TEST_F(ConfigTest, MissingRootIsConfigError) {
  auto result = Run({"run", "--root", "missing"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(
      result.stderr_output.find("is not a directory"), std::string::npos)
      << result.stderr_output;
}

TEST_F(ConfigTest, UnknownSubcommandIsUsageError) {
  auto result = Run({"frobnicate"});

  EXPECT_EQ(result.exit_code, 2);
}

}  // namespace
}  // namespace shspec::test
