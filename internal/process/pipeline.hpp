#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "command.hpp"

namespace zreplicate::process {

struct StageStatus {
  std::string command;
  int         exit_code = 0;
};

struct PipelineResult {
  std::vector<StageStatus> stages;

  // True only if every stage exited with status 0.
  bool Ok() const;

  // True if the last stage failed while every earlier stage exited 0.
  bool OnlyLastStageFailed() const;

  // "stage 1 (zfs send ...) exited 1; stage 3 (...) exited 141"
  std::string DescribeFailures() const;
};

/*
  Stages joined stdout → stdin by anonymous pipes, all running concurrently.

  Run() returns only after every stage has exited; a non-zero exit from any
  stage fails the whole pipeline regardless of the others. The first stage
  reads /dev/null, the last stage writes to the inherited stdout, stderr is
  inherited by every stage.
*/
class Pipeline {
 public:
  // pipe_capacity_bytes: requested capacity of every inter-stage pipe
  // (F_SETPIPE_SZ); std::nullopt keeps the kernel default.
  explicit Pipeline(std::optional<std::size_t> pipe_capacity_bytes = std::nullopt);

  void AddStage(Command command);

  std::size_t StageCount() const {
    return stages_.size();
  }

  // Throws std::system_error if a stage cannot be started; stages already
  // running are reaped before the exception propagates.
  PipelineResult Run();

 private:
  std::optional<std::size_t> pipe_capacity_bytes_;
  std::vector<Command>       stages_;
};

} // namespace zreplicate::process
