#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/syscall.h>
#endif

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace zreplicate::process {

PipeFds MakePipe() {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  return PipeFds{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

namespace {

// Runs in the forked child: async-signal-safe calls only.
void CloseInheritedDescriptors() {
#if defined(__linux__) && defined(SYS_close_range)
  if (::syscall(SYS_close_range, STDERR_FILENO + 1, ~0U, 0) == 0) {
    return;
  }
#endif
  long maxfd = ::sysconf(_SC_OPEN_MAX);
  if (maxfd == -1) {
    maxfd = 16384;
  }
  for (int fd = STDERR_FILENO + 1; fd < maxfd; ++fd) {
    ::close(fd);
  }
}

[[noreturn]] void ExecFailed(const char* program) {
  const char* reason = std::strerror(errno);
  const char  prefix[] = "exec failed: ";
  (void)!::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
  (void)!::write(STDERR_FILENO, program, std::strlen(program));
  (void)!::write(STDERR_FILENO, ": ", 2);
  (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
  (void)!::write(STDERR_FILENO, "\n", 1);
  ::_exit(kExecFailedExitCode);
}

void AppendAvailable(int fd, std::string* sink, bool* open) {
  char    buffer[4096];
  ssize_t n = ::read(fd, buffer, sizeof(buffer));
  if (n > 0) {
    sink->append(buffer, static_cast<size_t>(n));
    return;
  }
  if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    *open = false;
  }
}

} // namespace

Subprocess::Subprocess(Command command) : command_(std::move(command)) {
}

Subprocess::~Subprocess() {
  if (Spawned()) {
    out_pipe_.Reset();
    err_pipe_.Reset();
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
    }
    pid_ = -1;
  }
}

void Subprocess::SetStdin(int fd) {
  stdin_fd_ = fd;
}

void Subprocess::SetStdout(int fd) {
  stdout_fd_ = fd;
}

void Subprocess::InheritStdin() {
  inherit_stdin_ = true;
}

void Subprocess::CaptureOutput() {
  capture_output_ = true;
}

void Subprocess::Spawn() {
  if (Spawned()) {
    throw std::logic_error("subprocess already spawned: " + command_.ToString());
  }
  if (command_.Empty()) {
    throw std::invalid_argument("cannot spawn an empty command");
  }

  std::vector<char*> args;
  args.reserve(command_.argv.size() + 1);
  for (auto& word : command_.argv) {
    args.push_back(word.data());
  }
  args.push_back(nullptr);

  UniqueFd dev_null;
  if (stdin_fd_ < 0 && !inherit_stdin_) {
    dev_null.Reset(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.Valid()) {
      throw std::system_error(errno, std::generic_category(), "open /dev/null failed");
    }
  }

  PipeFds out;
  PipeFds err;
  if (capture_output_) {
    out = MakePipe();
    err = MakePipe();
  }

  const int child_stdin  = stdin_fd_ >= 0 ? stdin_fd_ : dev_null.Get();
  const int child_stdout = capture_output_ ? out.write.Get() : stdout_fd_;
  const int child_stderr = capture_output_ ? err.write.Get() : -1;

  const pid_t pid = ::fork();
  if (pid == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (pid == 0) {
    // dup2 clears close-on-exec on the target descriptor.
    if (child_stdin >= 0 && ::dup2(child_stdin, STDIN_FILENO) == -1) {
      ::_exit(kExecFailedExitCode);
    }
    if (child_stdout >= 0 && ::dup2(child_stdout, STDOUT_FILENO) == -1) {
      ::_exit(kExecFailedExitCode);
    }
    if (child_stderr >= 0 && ::dup2(child_stderr, STDERR_FILENO) == -1) {
      ::_exit(kExecFailedExitCode);
    }
    CloseInheritedDescriptors();
    ::execvp(args[0], args.data());
    ExecFailed(args[0]);
  }

  pid_ = pid;
  if (capture_output_) {
    out_pipe_ = std::move(out.read);
    err_pipe_ = std::move(err.read);
  }
}

CommandResult Subprocess::Communicate() {
  if (!capture_output_ || !Spawned()) {
    throw std::logic_error("Communicate() requires a spawned subprocess with captured output");
  }

  CommandResult result;
  bool          out_open = true;
  bool          err_open = true;

  while (out_open || err_open) {
    pollfd fds[2];
    nfds_t count = 0;
    if (out_open) {
      fds[count++] = pollfd{out_pipe_.Get(), POLLIN, 0};
    }
    if (err_open) {
      fds[count++] = pollfd{err_pipe_.Get(), POLLIN, 0};
    }

    if (::poll(fds, count, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }

    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      if (fds[i].fd == out_pipe_.Get()) {
        AppendAvailable(fds[i].fd, &result.out, &out_open);
      } else {
        AppendAvailable(fds[i].fd, &result.err, &err_open);
      }
    }
  }

  out_pipe_.Reset();
  err_pipe_.Reset();
  result.exit_code = Wait();
  return result;
}

int Subprocess::Wait() {
  if (!Spawned()) {
    throw std::logic_error("Wait() on a subprocess that is not running: " + command_.ToString());
  }

  int status = 0;
  while (::waitpid(pid_, &status, 0) == -1) {
    if (errno != EINTR) {
      const int saved = errno;
      pid_            = -1;
      throw std::system_error(saved, std::generic_category(), "waitpid failed");
    }
  }
  pid_ = -1;

  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return EXIT_FAILURE;
}

} // namespace zreplicate::process
