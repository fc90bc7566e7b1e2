#pragma once

#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "lock_service.hpp"

namespace zreplicate::lock {

/*
  Holds one lock for the lifetime of the object.

  Acquire() throws util::LockUnavailable when the lock is held elsewhere; the
  destructor releases a held lock on every exit path.
*/
class ScopedLock {
 public:
  ScopedLock(LockServicePtr service, std::string filesystem) : service_(std::move(service)), filesystem_(std::move(filesystem)) {
  }

  ~ScopedLock() {
    Release();
  }

  ScopedLock(const ScopedLock&)            = delete;
  ScopedLock& operator=(const ScopedLock&) = delete;

  void Acquire(const std::string& comment);

  void Release() noexcept;

  bool held() const {
    return held_;
  }

  const std::string& filesystem() const {
    return filesystem_;
  }

 private:
  LockServicePtr service_;
  std::string    filesystem_;
  bool           held_ = false;
};

} // namespace zreplicate::lock
