#include "internal/command/shell_split.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using runtrack::command::ShellSplit;
using Words = std::vector<std::string>;

bool ThrowsInvalidCommand(const std::string& text) {
  try {
    (void)ShellSplit(text);
  } catch (const runtrack::util::InvalidCommand&) {
    return true;
  }
  return false;
}

void TestWhitespaceSeparatesWords() {
  assert(ShellSplit("train.py  --epochs\t1\n") == (Words{"train.py", "--epochs", "1"}));
  assert(ShellSplit("   ").empty());
  assert(ShellSplit("").empty());
}

void TestQuotingAndEscaping() {
  assert(ShellSplit("say 'hello world'") == (Words{"say", "hello world"}));
  assert(ShellSplit(R"(say "a \"b\" \c")") == (Words{"say", R"(a "b" \c)"}));
  assert(ShellSplit(R"(a\ b c)") == (Words{"a b", "c"}));
  assert(ShellSplit(R"(pre'fix'"ed" x)") == (Words{"prefixed", "x"}));
  assert(ShellSplit(R"(a "" b)") == (Words{"a", "", "b"}));
}

void TestUnterminatedInputIsInvalid() {
  assert(ThrowsInvalidCommand("say 'oops"));
  assert(ThrowsInvalidCommand("say \"oops"));
  assert(ThrowsInvalidCommand("trailing\\"));
}

} // namespace

int main() {
  TestWhitespaceSeparatesWords();
  TestQuotingAndEscaping();
  TestUnterminatedInputIsInvalid();

  std::cout << "runtrack_unit_shell_split: pass\n";
  return 0;
}
