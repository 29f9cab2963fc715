#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace shspec::common {

// Remove SGR escape sequences (ESC [ digits/semicolons m).
auto StripAnsi(std::string_view text) -> std::string;

// Strip leading and trailing whitespace.
auto Trim(std::string_view text) -> std::string_view;

// Split on '\n'. A trailing newline does not produce an empty last element.
auto SplitLines(std::string_view text) -> std::vector<std::string_view>;

// Fields each terminated by '\0' (printf '%s\0'). An unterminated tail is
// kept as a last field; empty input yields no fields.
auto SplitNulTerminated(std::string_view text) -> std::vector<std::string>;

// True if text is a valid bash identifier prefix ([A-Za-z_][A-Za-z0-9_]*).
auto IsIdentifier(std::string_view text) -> bool;

// Quote for bash as a single word: 'it'\''s'.
auto ShellQuote(std::string_view text) -> std::string;

}  // namespace shspec::common
