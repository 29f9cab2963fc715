#include "shspec/discovery/test_case.hpp"

#include <iterator>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "shspec/common/text.hpp"

namespace shspec::discovery {

auto ToString(DirectiveKind kind) -> std::string_view {
  switch (kind) {
    case DirectiveKind::kNone:
      return "";
    case DirectiveKind::kSkip:
      return "SKIP";
    case DirectiveKind::kTodo:
      return "TODO";
  }
  return "";
}

auto ParseDirective(std::string_view line) -> Directive {
  static const std::regex kPattern(R"(^[ \t]*#[ \t]*@(SKIP|TODO)[ \t]*(.*)$)");

  std::string text(line);
  if (!text.empty() && text.back() == '\r') {
    text.pop_back();
  }

  std::smatch match;
  if (!std::regex_match(text, match, kPattern)) {
    return {};
  }
  return Directive{
      .kind = match[1] == "SKIP" ? DirectiveKind::kSkip : DirectiveKind::kTodo,
      .reason = std::string(common::Trim(match[2].str())),
  };
}

auto TestCase::QualifiedName() const -> std::string {
  return fmt::format("{}:{}", file.display_path, procedure);
}

void ExecutionPlan::Append(std::vector<TestCase> cases) {
  cases_.insert(
      cases_.end(), std::make_move_iterator(cases.begin()),
      std::make_move_iterator(cases.end()));
}

}  // namespace shspec::discovery
