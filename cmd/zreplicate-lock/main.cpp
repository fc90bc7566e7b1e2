#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/lock/lock_command.hpp"
#include "internal/observability/logging.hpp"

namespace {

void Usage() {
  std::cout << "Usage:\n"
            << "  zreplicate-lock [--lock-dir <dir>] [-n] lock <filesystem> [comment]\n"
            << "  zreplicate-lock [--lock-dir <dir>] [-n] unlock <filesystem>\n"
            << "  zreplicate-lock [--lock-dir <dir>] list\n"
            << "\n"
            << "Exit status: 0 on success, 1 on usage errors or when unlock finds no\n"
            << "lock, 2 on failure, 3 when lock finds the lock held. With -n, lock and\n"
            << "unlock report the status the real command would return.\n";
}

} // namespace

int main(int argc, char** argv) {
  zreplicate::runtime::config::RuntimeConfig config;
  bool                                       dry_run = false;
  std::vector<std::string>                   args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--lock-dir" && i + 1 < argc) {
      config.mutable_lock()->set_root_path(argv[++i]);
    } else if (arg == "-n" || arg == "--dry-run") {
      dry_run = true;
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else {
      args.push_back(arg);
    }
  }

  if (!zreplicate::lock::IsLockCommand(args)) {
    Usage();
    return 1;
  }

  zreplicate::observability::InitializeLogging(config);

  try {
    auto locks = zreplicate::factory::BuildLockService(config);
    return zreplicate::lock::RunLockCommand(*locks, args, dry_run, std::cout, std::cerr);
  } catch (const std::exception& e) {
    ZREPLICATE_LOG_ERROR("lock command failed", {zreplicate::observability::StringField("error", e.what())});
    return 2;
  }
}
