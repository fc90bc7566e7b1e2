#include "lock_command.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace zreplicate::lock {

bool IsLockCommand(const std::vector<std::string>& args) {
  if (args.empty()) {
    return false;
  }
  const auto& command = args[0];
  return (command == "lock" && (args.size() == 2 || args.size() == 3)) || (command == "unlock" && args.size() == 2) ||
         (command == "list" && args.size() == 1);
}

int RunLockCommand(LockService& locks, const std::vector<std::string>& args, bool dry_run, std::ostream& out, std::ostream& err) {
  if (!IsLockCommand(args)) {
    throw std::invalid_argument("unknown lock command");
  }
  const auto& command = args[0];

  if (command == "lock") {
    const auto comment = args.size() == 3 ? args[2] : std::string();
    const bool ok      = dry_run ? locks.WouldLock(args[1]) : locks.Lock(args[1], comment);
    if (!ok) {
      err << "lock for " << args[1] << " is held\n";
      return kLockCommandHeld;
    }
    return kLockCommandOk;
  }

  if (command == "unlock") {
    // Held means there is something to release, as for the real unlock.
    const bool ok = dry_run ? !locks.WouldLock(args[1]) : locks.Unlock(args[1]);
    if (!ok) {
      err << args[1] << " was not locked\n";
      return kLockCommandNotHeld;
    }
    return kLockCommandOk;
  }

  for (const auto& record : locks.List()) {
    out << record.filesystem << '\t' << util::FormatIso8601(record.acquired_at);
    if (!record.comment.empty()) {
      out << '\t' << record.comment;
    }
    out << '\n';
  }
  return kLockCommandOk;
}

} // namespace zreplicate::lock
