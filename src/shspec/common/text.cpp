#include "shspec/common/text.hpp"

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace shspec::common {

auto StripAnsi(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      size_t j = i + 2;
      while (j < text.size() &&
             (std::isdigit(static_cast<unsigned char>(text[j])) != 0 ||
              text[j] == ';')) {
        ++j;
      }
      if (j < text.size() && text[j] == 'm') {
        i = j + 1;
        continue;
      }
    }
    result.push_back(text[i]);
    ++i;
  }
  return result;
}

auto Trim(std::string_view text) -> std::string_view {
  constexpr std::string_view kWhitespace = " \t\r\n\v\f";
  auto start = text.find_first_not_of(kWhitespace);
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(kWhitespace);
  return text.substr(start, end - start + 1);
}

auto SplitLines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

auto SplitNulTerminated(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> fields;
  size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\0', start);
    if (end == std::string_view::npos) {
      fields.emplace_back(text.substr(start));
      break;
    }
    fields.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return fields;
}

auto IsIdentifier(std::string_view text) -> bool {
  if (text.empty()) {
    return false;
  }
  auto is_start = [](char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
  };
  if (!is_start(text.front())) {
    return false;
  }
  for (char c : text.substr(1)) {
    if (!is_start(c) && std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

auto ShellQuote(std::string_view text) -> std::string {
  std::string result = "'";
  for (char c : text) {
    if (c == '\'') {
      result += "'\\''";
    } else {
      result.push_back(c);
    }
  }
  result.push_back('\'');
  return result;
}

}  // namespace shspec::common
