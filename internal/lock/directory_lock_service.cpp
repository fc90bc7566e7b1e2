#include "directory_lock_service.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace zreplicate::lock {

namespace {

constexpr const char* kAcquiredFile = "acquired_ms";
constexpr const char* kCommentFile  = "comment";

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return {};
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
  out.close();
  if (!out) {
    throw std::runtime_error("failed to write " + path.string());
  }
}

} // namespace

DirectoryLockService::DirectoryLockService(std::filesystem::path root) : root_(std::move(root)) {
  if (root_.empty()) {
    throw std::invalid_argument("lock directory must not be empty");
  }
  std::filesystem::create_directories(root_);
}

std::string DirectoryLockService::EncodeName(const std::string& filesystem) {
  std::string name = filesystem;
  std::replace(name.begin(), name.end(), '/', ';');
  return name;
}

std::string DirectoryLockService::DecodeName(const std::string& name) {
  std::string filesystem = name;
  std::replace(filesystem.begin(), filesystem.end(), ';', '/');
  return filesystem;
}

std::filesystem::path DirectoryLockService::LockPath(const std::string& filesystem) const {
  if (filesystem.empty()) {
    throw std::invalid_argument("lock name must not be empty");
  }
  return root_ / EncodeName(filesystem);
}

bool DirectoryLockService::Lock(const std::string& filesystem, const std::string& comment) {
  const auto path = LockPath(filesystem);

  // create_directory is the atomic test-and-set: false if it already exists.
  if (!std::filesystem::create_directory(path)) {
    ZREPLICATE_LOG_DEBUG("lock already held", {observability::StringField("filesystem", filesystem)});
    return false;
  }

  try {
    WriteFile(path / kAcquiredFile, std::to_string(util::ToUnixMillis(util::Now())));
    if (!comment.empty()) {
      WriteFile(path / kCommentFile, comment);
    }
  } catch (const std::exception&) {
    // A half-written lock would never be released by its owner.
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    throw;
  }

  ZREPLICATE_LOG_DEBUG("lock acquired", {observability::StringField("filesystem", filesystem)});
  return true;
}

bool DirectoryLockService::Unlock(const std::string& filesystem) {
  const auto removed = std::filesystem::remove_all(LockPath(filesystem));
  if (removed > 0) {
    ZREPLICATE_LOG_DEBUG("lock released", {observability::StringField("filesystem", filesystem)});
  }
  return removed > 0;
}

bool DirectoryLockService::WouldLock(const std::string& filesystem) const {
  return !std::filesystem::exists(LockPath(filesystem));
}

std::vector<LockRecord> DirectoryLockService::List() const {
  std::vector<LockRecord> records;

  for (const auto& entry : std::filesystem::directory_iterator(root_)) {
    if (!entry.is_directory()) {
      continue;
    }

    LockRecord record;
    record.filesystem = DecodeName(entry.path().filename().string());
    record.comment    = ReadFile(entry.path() / kCommentFile);

    const auto acquired = ReadFile(entry.path() / kAcquiredFile);
    try {
      record.acquired_at = util::FromUnixMillis(acquired.empty() ? 0 : std::stoull(acquired));
    } catch (const std::logic_error&) {
      ZREPLICATE_LOG_WARN("unreadable lock timestamp", {observability::StringField("filesystem", record.filesystem)});
      record.acquired_at = util::FromUnixMillis(0);
    }
    records.push_back(std::move(record));
  }

  std::sort(records.begin(), records.end(), [](const LockRecord& a, const LockRecord& b) { return a.filesystem < b.filesystem; });
  return records;
}

} // namespace zreplicate::lock
