#pragma once

#include <memory>

#include "command.hpp"

namespace zreplicate::process {

/*
  Runs one command to completion and captures its output.

  Host connections issue every remote primitive through this seam so tests
  can substitute canned results.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const Command& command) = 0;
};

using CommandRunnerPtr = std::shared_ptr<CommandRunner>;

class SubprocessRunner final : public CommandRunner {
 public:
  CommandResult Run(const Command& command) override;
};

} // namespace zreplicate::process
