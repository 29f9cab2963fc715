#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shspec/assertions/assertions.hpp"

namespace shspec::assertions {
namespace {

TEST(AssertionsTest, EqualsPassesOnIdenticalText) {
  auto outcome = Equals("5", "5");
  EXPECT_TRUE(outcome.passed);
  EXPECT_EQ(outcome.expected, "5");
  EXPECT_EQ(outcome.actual, "5");
}

TEST(AssertionsTest, EqualsFailureCarriesBothValues) {
  auto outcome = Equals("5", "6");
  EXPECT_FALSE(outcome.passed);
  EXPECT_EQ(outcome.description, "Expected '5', got '6'");
  EXPECT_EQ(outcome.expected, "5");
  EXPECT_EQ(outcome.actual, "6");
}

TEST(AssertionsTest, EqualsUsesCustomMessage) {
  auto outcome = Equals("a", "b", "sum is wrong");
  EXPECT_FALSE(outcome.passed);
  EXPECT_EQ(outcome.description, "sum is wrong");
}

TEST(AssertionsTest, EqualsComparesWhitespaceExactly) {
  EXPECT_FALSE(Equals("a", "a ").passed);
  EXPECT_FALSE(Equals("", " ").passed);
  EXPECT_TRUE(Equals("", "").passed);
}

TEST(AssertionsTest, NotEquals) {
  EXPECT_TRUE(NotEquals("a", "b").passed);

  auto outcome = NotEquals("same", "same");
  EXPECT_FALSE(outcome.passed);
  EXPECT_EQ(
      outcome.description,
      "Expected values to be different, but both were 'same'");
}

TEST(AssertionsTest, CommandSucceeded) {
  EXPECT_TRUE(CommandSucceeded(0, "true").passed);

  auto outcome = CommandSucceeded(3, "false");
  EXPECT_FALSE(outcome.passed);
  EXPECT_EQ(outcome.description, "command failed with exit code 3: false");
  EXPECT_EQ(outcome.actual, "exit code 3");
}

TEST(AssertionsTest, CommandFailed) {
  EXPECT_TRUE(CommandFailed(1, "false").passed);
  EXPECT_FALSE(CommandFailed(0, "true").passed);
}

TEST(AssertionsTest, OutputEqualsAndContains) {
  EXPECT_TRUE(OutputEquals("hello", "hello", "echo hello").passed);
  EXPECT_FALSE(OutputEquals("hello", "hello\n", "echo hello").passed);

  EXPECT_TRUE(OutputContains("ell", "hello", "echo hello").passed);
  auto outcome = OutputContains("xyz", "hello", "echo hello");
  EXPECT_FALSE(outcome.passed);
  EXPECT_EQ(outcome.actual, "hello");
}

TEST(AssertionsTest, PathChecks) {
  auto dir = std::filesystem::temp_directory_path() / "shspec_assert_paths";
  std::filesystem::create_directories(dir);
  auto file = dir / "present.txt";
  std::ofstream(file) << "x";

  EXPECT_TRUE(PathExists(file).passed);
  EXPECT_FALSE(PathAbsent(file).passed);
  EXPECT_FALSE(PathExists(dir / "missing.txt").passed);
  EXPECT_TRUE(PathAbsent(dir / "missing.txt").passed);

  std::filesystem::remove_all(dir);
}

TEST(AssertionsTest, VariableAndProcedureFlags) {
  EXPECT_TRUE(VariableIsSet("HOME", true).passed);
  EXPECT_FALSE(VariableIsSet("NOPE", false).passed);
  EXPECT_TRUE(ProcedureIsDefined("helper", true).passed);
  EXPECT_FALSE(ProcedureIsDefined("helper", false).passed);
}

TEST(AssertionsTest, ParseAssertionKind) {
  EXPECT_EQ(ParseAssertionKind("equals"), AssertionKind::kEquals);
  EXPECT_EQ(ParseAssertionKind("output-contains"), AssertionKind::kOutputContains);
  EXPECT_EQ(ParseAssertionKind("function"), AssertionKind::kFunction);
  EXPECT_FALSE(ParseAssertionKind("assert_equals").has_value());
}

TEST(AssertionsTest, EvaluateDispatchesPositionalArguments) {
  std::vector<std::string> args = {"2", "ls /nope"};
  auto outcome = Evaluate(AssertionKind::kSuccess, args);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_FALSE(outcome->passed);
  EXPECT_EQ(outcome->description, "command failed with exit code 2: ls /nope");
}

TEST(AssertionsTest, EvaluateRejectsMalformedArguments) {
  std::vector<std::string> too_few = {"only"};
  EXPECT_FALSE(Evaluate(AssertionKind::kEquals, too_few).has_value());

  std::vector<std::string> bad_code = {"x", "cmd"};
  EXPECT_FALSE(Evaluate(AssertionKind::kFail, bad_code).has_value());

  std::vector<std::string> bad_flag = {"VAR", "yes"};
  EXPECT_FALSE(Evaluate(AssertionKind::kVariableSet, bad_flag).has_value());
}

TEST(AssertionsTest, FormatOutcome) {
  EXPECT_EQ(FormatOutcome(Equals("1", "1")), "  PASS: should be equal\n");
  EXPECT_EQ(
      FormatOutcome(Equals("1", "2")),
      "  FAIL: Expected '1', got '2'\n"
      "    expected: 1\n"
      "    actual: 2\n");
}

}  // namespace
}  // namespace shspec::assertions
