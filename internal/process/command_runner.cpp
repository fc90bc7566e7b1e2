#include "command_runner.hpp"

#include "internal/observability/logging.hpp"
#include "subprocess.hpp"

namespace zreplicate::process {

CommandResult SubprocessRunner::Run(const Command& command) {
  ZREPLICATE_LOG_DEBUG("running command", {observability::StringField("command", command.ToString())});

  Subprocess process(command);
  process.CaptureOutput();
  process.Spawn();
  return process.Communicate();
}

} // namespace zreplicate::process
