#pragma once

#include <sys/types.h>

#include "command.hpp"
#include "unique_fd.hpp"

namespace zreplicate::process {

/*
  One child process started with fork/exec.

  Standard streams are wired before Spawn():
    - SetStdin/SetStdout hand the child an existing descriptor (the caller
      keeps ownership and closes its copy after Spawn()).
    - CaptureOutput() collects stdout and stderr for Communicate().
  Unset streams are inherited, except stdin which reads /dev/null unless
  InheritStdin() is requested.

  A Subprocess that was spawned must be waited on; the destructor reaps a
  child that is still running so no zombie outlives the object.
*/
class Subprocess {
 public:
  explicit Subprocess(Command command);
  ~Subprocess();

  Subprocess(const Subprocess&)            = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  void SetStdin(int fd);
  void SetStdout(int fd);
  void InheritStdin();
  void CaptureOutput();

  // Throws std::system_error if fork or pipe creation fails. A program that
  // cannot be executed surfaces as exit status 127 from Wait().
  void Spawn();

  // Reads captured stdout/stderr to EOF, then waits. Requires CaptureOutput().
  CommandResult Communicate();

  // Exit status; 128 + signal number if the child was killed.
  int Wait();

  bool Spawned() const {
    return pid_ > 0;
  }

  const Command& command() const {
    return command_;
  }

 private:
  Command command_;

  int  stdin_fd_       = -1;
  int  stdout_fd_      = -1;
  bool inherit_stdin_  = false;
  bool capture_output_ = false;

  UniqueFd out_pipe_;
  UniqueFd err_pipe_;

  pid_t pid_ = -1;
};

} // namespace zreplicate::process
