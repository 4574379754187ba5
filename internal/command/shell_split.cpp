#include "internal/command/shell_split.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace runtrack::command {

std::vector<std::string> ShellSplit(std::string_view text) {
  enum class State { kBlank, kWord, kSingle, kDouble };

  std::vector<std::string> words;
  std::string              word;
  State                    state = State::kBlank;

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    switch (state) {
      case State::kBlank:
      case State::kWord:
        if (std::isspace(static_cast<unsigned char>(c))) {
          if (state == State::kWord) {
            words.push_back(std::move(word));
            word.clear();
          }
          state = State::kBlank;
        } else if (c == '\'') {
          state = State::kSingle;
        } else if (c == '"') {
          state = State::kDouble;
        } else if (c == '\\') {
          if (i + 1 >= text.size()) {
            throw util::InvalidCommand("no escaped character in: " + std::string(text));
          }
          word.push_back(text[++i]);
          state = State::kWord;
        } else {
          word.push_back(c);
          state = State::kWord;
        }
        break;

      case State::kSingle:
        if (c == '\'') {
          state = State::kWord;
        } else {
          word.push_back(c);
        }
        break;

      case State::kDouble:
        if (c == '"') {
          state = State::kWord;
        } else if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
          word.push_back(text[++i]);
        } else {
          word.push_back(c);
        }
        break;
    }
  }

  if (state == State::kSingle || state == State::kDouble) {
    throw util::InvalidCommand("no closing quotation in: " + std::string(text));
  }
  if (state == State::kWord) {
    words.push_back(std::move(word));
  }
  return words;
}

} // namespace runtrack::command
