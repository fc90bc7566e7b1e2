#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "lock_service.hpp"

namespace zreplicate::lock {

// Exit statuses of the lock subcommands. With dry_run, lock and unlock
// report what the real command would return without changing anything.
constexpr int kLockCommandOk      = 0;
constexpr int kLockCommandNotHeld = 1;
constexpr int kLockCommandHeld    = 3;

// args[0] is the subcommand: "lock <fs> [comment]", "unlock <fs>" or "list".
bool IsLockCommand(const std::vector<std::string>& args);

// Throws std::invalid_argument unless IsLockCommand(args); service errors
// propagate.
int RunLockCommand(LockService& locks, const std::vector<std::string>& args, bool dry_run, std::ostream& out, std::ostream& err);

} // namespace zreplicate::lock
