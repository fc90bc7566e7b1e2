#include "scoped_lock.hpp"

#include <exception>

#include "internal/util/errors.hpp"

namespace zreplicate::lock {

void ScopedLock::Acquire(const std::string& comment) {
  if (held_) {
    return;
  }
  if (!service_->Lock(filesystem_, comment)) {
    throw util::LockUnavailable("lock for " + filesystem_ + " is held by another run");
  }
  held_ = true;
}

void ScopedLock::Release() noexcept {
  if (!held_) {
    return;
  }
  held_ = false;

  try {
    if (!service_->Unlock(filesystem_)) {
      ZREPLICATE_LOG_WARN("lock was already released", {observability::StringField("filesystem", filesystem_)});
    }
  } catch (const std::exception& e) {
    // Runs from the destructor; the stale lock needs manual removal.
    ZREPLICATE_LOG_ERROR("failed to release lock",
                         {observability::StringField("filesystem", filesystem_), observability::StringField("error", e.what())});
  }
}

} // namespace zreplicate::lock
