#include "pipeline.hpp"

#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "subprocess.hpp"
#include "unique_fd.hpp"

namespace zreplicate::process {

namespace {

void ApplyPipeCapacity(int fd, std::size_t capacity) {
#ifdef F_SETPIPE_SZ
  if (::fcntl(fd, F_SETPIPE_SZ, static_cast<int>(capacity)) == -1) {
    ZREPLICATE_LOG_WARN("could not resize pipe buffer", {observability::IntField("requested_bytes", static_cast<int64_t>(capacity)),
                                                         observability::StringField("error", std::strerror(errno))});
  }
#else
  (void)fd;
  (void)capacity;
#endif
}

} // namespace

bool PipelineResult::Ok() const {
  for (const auto& stage : stages) {
    if (stage.exit_code != 0) {
      return false;
    }
  }
  return true;
}

bool PipelineResult::OnlyLastStageFailed() const {
  if (stages.empty() || stages.back().exit_code == 0) {
    return false;
  }
  for (std::size_t i = 0; i + 1 < stages.size(); ++i) {
    if (stages[i].exit_code != 0) {
      return false;
    }
  }
  return true;
}

std::string PipelineResult::DescribeFailures() const {
  std::string description;
  for (std::size_t i = 0; i < stages.size(); ++i) {
    if (stages[i].exit_code == 0) {
      continue;
    }
    if (!description.empty()) {
      description += "; ";
    }
    description += "stage " + std::to_string(i + 1) + " (" + stages[i].command + ") exited " + std::to_string(stages[i].exit_code);
  }
  return description;
}

Pipeline::Pipeline(std::optional<std::size_t> pipe_capacity_bytes) : pipe_capacity_bytes_(pipe_capacity_bytes) {
}

void Pipeline::AddStage(Command command) {
  if (command.Empty()) {
    throw std::invalid_argument("pipeline stage must not be empty");
  }
  stages_.push_back(std::move(command));
}

PipelineResult Pipeline::Run() {
  if (stages_.empty()) {
    throw std::logic_error("pipeline has no stages");
  }

  std::vector<std::unique_ptr<Subprocess>> processes;
  processes.reserve(stages_.size());

  // Read end of the pipe feeding the next stage.
  UniqueFd upstream;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const bool last = i + 1 == stages_.size();

    PipeFds downstream;
    if (!last) {
      downstream = MakePipe();
      if (pipe_capacity_bytes_) {
        ApplyPipeCapacity(downstream.write.Get(), *pipe_capacity_bytes_);
      }
    }

    auto process = std::make_unique<Subprocess>(stages_[i]);
    if (upstream.Valid()) {
      process->SetStdin(upstream.Get());
    }
    if (!last) {
      process->SetStdout(downstream.write.Get());
    }

    // On failure the Subprocess destructors reap the stages already started;
    // they see EOF or SIGPIPE once our pipe ends close.
    process->Spawn();
    processes.push_back(std::move(process));

    // The children hold their own copies now.
    upstream = std::move(downstream.read);
  }

  PipelineResult result;
  result.stages.reserve(processes.size());
  for (auto& process : processes) {
    StageStatus status;
    status.command   = process->command().ToString();
    status.exit_code = process->Wait();
    result.stages.push_back(std::move(status));
  }
  return result;
}

} // namespace zreplicate::process
