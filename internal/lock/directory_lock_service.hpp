#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "lock_service.hpp"

namespace zreplicate::lock {

/*
  LockService backed by atomic directory creation.

  The lock for "pool/a/b" is the directory <root>/pool;a;b. Acquisition time
  and the optional comment are written inside it for List().
*/
class DirectoryLockService final : public LockService {
 public:
  explicit DirectoryLockService(std::filesystem::path root);

  bool Lock(const std::string& filesystem, const std::string& comment = {}) override;
  bool Unlock(const std::string& filesystem) override;
  bool WouldLock(const std::string& filesystem) const override;

  std::vector<LockRecord> List() const override;

  static std::string EncodeName(const std::string& filesystem);
  static std::string DecodeName(const std::string& name);

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path LockPath(const std::string& filesystem) const;

  std::filesystem::path root_;
};

} // namespace zreplicate::lock
