#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace runtrack::command {

/*
  POSIX shell word splitting.

    - whitespace separates words
    - '...' is literal
    - "..." allows \" and \\ escapes, other backslashes are kept
    - outside quotes a backslash escapes the next character
    - adjacent quoted and unquoted parts join into one word; "" is an
      empty word

  No expansion of any kind. Throws util::InvalidCommand on an unclosed
  quote or a trailing backslash.
*/
std::vector<std::string> ShellSplit(std::string_view text);

} // namespace runtrack::command
