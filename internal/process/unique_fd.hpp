#pragma once

#include <unistd.h>

#include <utility>

namespace zreplicate::process {

/*
  Owning file descriptor; closes on destruction.
*/
class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {
  }
  ~UniqueFd() {
    Reset();
  }

  UniqueFd(const UniqueFd&)            = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {
  }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      Reset(std::exchange(other.fd_, -1));
    }
    return *this;
  }

  int Get() const {
    return fd_;
  }

  bool Valid() const {
    return fd_ >= 0;
  }

  int Release() {
    return std::exchange(fd_, -1);
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

struct PipeFds {
  UniqueFd read;
  UniqueFd write;
};

// Both ends close-on-exec. Throws std::system_error.
PipeFds MakePipe();

} // namespace zreplicate::process
