#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace zreplicate::lock {

struct LockRecord {
  std::string     filesystem;
  util::TimePoint acquired_at;
  std::string     comment;
};

/*
  Mutual exclusion between replication runs, keyed by filesystem name.

  Unlock() performs no ownership check: any caller may release any lock.
*/
class LockService {
 public:
  virtual ~LockService() = default;

  // False if the lock is already held.
  virtual bool Lock(const std::string& filesystem, const std::string& comment = {}) = 0;

  // False if the lock was not held.
  virtual bool Unlock(const std::string& filesystem) = 0;

  // Dry run: whether Lock() would currently succeed. Takes nothing.
  virtual bool WouldLock(const std::string& filesystem) const = 0;

  virtual std::vector<LockRecord> List() const = 0;
};

using LockServicePtr = std::shared_ptr<LockService>;

} // namespace zreplicate::lock
