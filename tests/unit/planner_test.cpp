#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "shspec/common/diagnostic.hpp"
#include "shspec/common/text.hpp"
#include "shspec/discovery/planner.hpp"
#include "shspec/discovery/test_case.hpp"

namespace shspec::discovery {
namespace {

namespace fs = std::filesystem;

class PlannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("shspec_planner_" +
             std::string(
                 ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::create_directories(root_);
  }

  void TearDown() override {
    fs::remove_all(root_);
  }

  void WriteFile(const fs::path& relative, const std::string& content) {
    auto path = root_ / relative;
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
  }

  [[nodiscard]] auto Options() const -> DiscoveryOptions {
    DiscoveryOptions options;
    options.root = root_;
    return options;
  }

  fs::path root_;
};

TEST(DeclarationTest, RecognizesAllDeclarationForms) {
  EXPECT_EQ(DeclaredProcedure("test_a() {"), "test_a");
  EXPECT_EQ(DeclaredProcedure("  test_b ()"), "test_b");
  EXPECT_EQ(DeclaredProcedure("function test_c {"), "test_c");
  EXPECT_EQ(DeclaredProcedure("function test_d() {"), "test_d");
  EXPECT_EQ(DeclaredProcedure("test_e() { echo one; }"), "test_e");
  EXPECT_EQ(DeclaredProcedure("echo test_f"), "");
  EXPECT_EQ(DeclaredProcedure("# test_g() {"), "");
}

TEST(DeclarationTest, OrdersByDeclarationLineThenName) {
  auto lines = FindDeclarationLines(
      "test_zeta() { :; }\n"
      "helper() { :; }\n"
      "test_alpha() { :; }\n");
  EXPECT_EQ(lines.at("test_zeta"), 1U);
  EXPECT_EQ(lines.at("test_alpha"), 3U);

  auto ordered = OrderByDeclaration(
      {"test_alpha", "test_dynamic_b", "test_zeta", "test_dynamic_a"}, lines);
  EXPECT_EQ(
      ordered, (std::vector<std::string>{
                   "test_zeta", "test_alpha", "test_dynamic_a",
                   "test_dynamic_b"}));
}

TEST(DeclarationTest, DirectiveMustImmediatelyPrecedeDeclaration) {
  std::string source =
      "# @SKIP slow\n"
      "test_a() { :; }\n"
      "# @TODO later\n"
      "\n"
      "test_b() { :; }\n";
  auto lines = common::SplitLines(source);
  EXPECT_EQ(DirectiveBefore(lines, 2).kind, DirectiveKind::kSkip);
  EXPECT_EQ(DirectiveBefore(lines, 2).reason, "slow");
  EXPECT_EQ(DirectiveBefore(lines, 5).kind, DirectiveKind::kNone);
  EXPECT_EQ(DirectiveBefore(lines, 1).kind, DirectiveKind::kNone);
}

TEST_F(PlannerTest, ValidateRejectsBadOptions) {
  auto options = Options();
  options.pattern = "";
  EXPECT_EQ(ValidateOptions(options).error().kind, DiagKind::kConfigError);

  options = Options();
  options.pattern = "tests/*_test.sh";
  EXPECT_EQ(ValidateOptions(options).error().kind, DiagKind::kConfigError);

  options = Options();
  options.prefix = "1test";
  EXPECT_EQ(ValidateOptions(options).error().kind, DiagKind::kConfigError);

  options = Options();
  options.root = root_ / "missing";
  EXPECT_EQ(ValidateOptions(options).error().kind, DiagKind::kConfigError);

  EXPECT_TRUE(ValidateOptions(Options()).has_value());
}

TEST_F(PlannerTest, FindsMatchingFilesRecursivelyInSortedOrder) {
  WriteFile("b_test.sh", "");
  WriteFile("a_test.sh", "");
  WriteFile("nested/c_test.sh", "");
  WriteFile("lib.sh", "");
  WriteFile("notes_test.sh.bak", "");

  auto files = FindTestFiles(Options());
  ASSERT_TRUE(files.has_value());
  std::vector<std::string> names;
  for (const auto& file : *files) {
    names.push_back(file.display_path);
    EXPECT_TRUE(file.path.is_absolute());
  }
  EXPECT_EQ(
      names, (std::vector<std::string>{
                 "a_test.sh", "b_test.sh", "nested/c_test.sh"}));
}

TEST_F(PlannerTest, EmptyRootGivesEmptyPlan) {
  auto result = BuildPlan(Options());
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->plan.Empty());
  EXPECT_EQ(result->file_count, 0U);
}

TEST_F(PlannerTest, LoadsProceduresInDeclarationOrderWithDirectives) {
  WriteFile(
      "math_test.sh",
      "source ./lib.sh\n"
      "test_sub() { [[ $(sub 5 3) == 2 ]]; }\n"
      "# @TODO rounding\n"
      "test_div() { false; }\n"
      "helper() { :; }\n"
      "function test_add {\n"
      "  [[ $(add 2 3) == 5 ]]\n"
      "}\n"
      "eval 'test_generated() { :; }'\n");
  WriteFile("lib.sh", "add() { echo $(( $1 + $2 )); }\nsub() { :; }\n");

  auto result = BuildPlan(Options());
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->failures.empty());

  const auto& cases = result->plan.Cases();
  ASSERT_EQ(cases.size(), 4U);
  EXPECT_EQ(cases[0].procedure, "test_sub");
  EXPECT_EQ(cases[1].procedure, "test_div");
  EXPECT_EQ(cases[1].directive.kind, DirectiveKind::kTodo);
  EXPECT_EQ(cases[2].procedure, "test_add");
  EXPECT_EQ(cases[3].procedure, "test_generated");
  EXPECT_EQ(cases[0].QualifiedName(), "math_test.sh:test_sub");
}

TEST_F(PlannerTest, BrokenFileIsSkippedOthersLoad) {
  WriteFile("bad_test.sh", "test_x() {\n  if true; then\n}\n");
  WriteFile("good_test.sh", "test_ok() { :; }\n");

  auto result = BuildPlan(Options());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->file_count, 2U);
  ASSERT_EQ(result->failures.size(), 1U);
  EXPECT_EQ(result->failures[0].kind, DiagKind::kDiscoveryError);
  ASSERT_EQ(result->plan.Size(), 1U);
  EXPECT_EQ(result->plan.Cases()[0].procedure, "test_ok");
}

TEST_F(PlannerTest, CustomPrefixSelectsProcedures) {
  WriteFile("x_test.sh", "check_one() { :; }\ntest_two() { :; }\n");
  auto options = Options();
  options.prefix = "check_";

  auto result = BuildPlan(options);
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->plan.Size(), 1U);
  EXPECT_EQ(result->plan.Cases()[0].procedure, "check_one");
}

}  // namespace
}  // namespace shspec::discovery
