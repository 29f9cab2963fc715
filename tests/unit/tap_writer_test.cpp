#include <sstream>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "shspec/discovery/test_case.hpp"
#include "shspec/executor/execution_result.hpp"
#include "shspec/report/tap_writer.hpp"

namespace shspec::report {
namespace {

auto MakeCase(
    const std::string& procedure,
    discovery::Directive directive = {}) -> discovery::TestCase {
  return discovery::TestCase{
      .file = {.path = "/w/math_test.sh", .display_path = "math_test.sh"},
      .procedure = procedure,
      .directive = std::move(directive),
  };
}

class TapWriterTest : public ::testing::Test {
 protected:
  std::ostringstream out_;
  TapWriter writer_{out_};
};

TEST_F(TapWriterTest, PlanLineComesFirst) {
  writer_.OnPlan(2);
  EXPECT_EQ(out_.str(), "TAP version 13\n1..2\n");
}

TEST_F(TapWriterTest, EmptyPlan) {
  writer_.OnPlan(0);
  EXPECT_EQ(out_.str(), "TAP version 13\n1..0\n");
}

TEST_F(TapWriterTest, PassingAndFailingResults) {
  writer_.OnPlan(2);
  writer_.OnResult(executor::ExecutionResult(MakeCase("test_add"), 0, "", 4));
  writer_.OnResult(
      executor::ExecutionResult(
          MakeCase("test_sub"), 1,
          "  FAIL: Expected '2', got '3'\n    expected: 2\n    actual: 3\n", 7));

  EXPECT_EQ(
      out_.str(),
      "TAP version 13\n"
      "1..2\n"
      "ok 1 - test_add\n"
      "not ok 2 - test_sub\n"
      "  ---\n"
      "  message: '  FAIL: Expected ''2'', got ''3''\n"
      "        expected: 2\n"
      "        actual: 3'\n"
      "  severity: fail\n"
      "  file: 'math_test.sh'\n"
      "  function: 'test_sub'\n"
      "  duration_ms: 7\n"
      "  ...\n");
  EXPECT_EQ(writer_.Count(), 2U);
}

TEST_F(TapWriterTest, TodoAndSkipDirectives) {
  discovery::Directive todo{.kind = discovery::DirectiveKind::kTodo, .reason = "not yet"};
  discovery::Directive skip{.kind = discovery::DirectiveKind::kSkip, .reason = ""};

  auto failed_todo = writer_.MakeEvent(
      executor::ExecutionResult(MakeCase("test_a", todo), 1, "x", 1));
  EXPECT_EQ(FormatTapEvent(failed_todo), "not ok 1 - test_a # TODO not yet\n");

  auto passed_todo = writer_.MakeEvent(
      executor::ExecutionResult(MakeCase("test_b", todo), 0, "", 1));
  EXPECT_EQ(FormatTapEvent(passed_todo), "ok 2 - test_b # TODO not yet\n");

  auto skipped = writer_.MakeEvent(
      executor::ExecutionResult::Skipped(MakeCase("test_c", skip)));
  EXPECT_EQ(FormatTapEvent(skipped), "ok 3 - test_c # SKIP\n");
}

TEST_F(TapWriterTest, CommentsArePrefixed) {
  writer_.OnComment("\n--- Coverage Report ---\nTotal: 1/2 (50.0%)\n");
  EXPECT_EQ(out_.str(), "# \n# --- Coverage Report ---\n# Total: 1/2 (50.0%)\n");
}

TEST(QuoteTapScalarTest, StripsAnsiAndTrailingNewlines) {
  EXPECT_EQ(QuoteTapScalar("\x1b[31mred\x1b[0m\n\n"), "'red'");
  EXPECT_EQ(QuoteTapScalar("it's"), "'it''s'");
  EXPECT_EQ(QuoteTapScalar(""), "''");
}

}  // namespace
}  // namespace shspec::report
