#include "command.hpp"

namespace zreplicate::process {

namespace {

bool IsShellSafe(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.' ||
         c == '/' || c == ':' || c == '@' || c == '%' || c == '+' || c == '=' || c == ',';
}

} // namespace

std::string ShellQuote(std::string_view word) {
  if (word.empty()) {
    return "''";
  }

  bool safe = true;
  for (char c : word) {
    if (!IsShellSafe(c)) {
      safe = false;
      break;
    }
  }
  if (safe) {
    return std::string(word);
  }

  std::string quoted;
  quoted.reserve(word.size() + 2);
  quoted.push_back('\'');
  for (char c : word) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

bool Command::Empty() const {
  return argv.empty();
}

std::string Command::ToString() const {
  std::string line;
  for (const auto& word : argv) {
    if (!line.empty()) {
      line.push_back(' ');
    }
    line += ShellQuote(word);
  }
  return line;
}

} // namespace zreplicate::process
