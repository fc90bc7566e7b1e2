#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace zreplicate::process {

/*
  An argv vector, executed without a shell.

  ToString() renders it with POSIX shell quoting so the result can be logged
  or handed to ssh as a remote command line.
*/
struct Command {
  std::vector<std::string> argv;

  bool        Empty() const;
  std::string ToString() const;
};

std::string ShellQuote(std::string_view word);

/*
  Outcome of a command run to completion with its output captured.
*/
struct CommandResult {
  int         exit_code = 0;
  std::string out;
  std::string err;

  bool Ok() const {
    return exit_code == 0;
  }
};

// Exit status reported when the program could not be executed at all.
inline constexpr int kExecFailedExitCode = 127;

} // namespace zreplicate::process
