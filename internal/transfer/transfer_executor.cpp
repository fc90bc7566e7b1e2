#include "transfer_executor.hpp"

#include <chrono>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/process/pipeline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace zreplicate::transfer {

using observability::IntField;
using observability::StringField;

TransferExecutor::TransferExecutor(host::HostConnectionPtr source, host::HostConnectionPtr destination, TransferOptions options)
    : source_(std::move(source)), destination_(std::move(destination)), options_(std::move(options)) {
  if (!source_ || !destination_) {
    throw std::invalid_argument("TransferExecutor requires source and destination connections");
  }
  options_.Validate();
}

void TransferExecutor::Execute(const plan::OptimizedSchedule& schedule) {
  ZREPLICATE_LOG_INFO("executing schedule", {IntField("steps", static_cast<int64_t>(schedule.size())),
                                             observability::BoolField("dry_run", options_.dry_run)});

  for (std::size_t i = 0; i < schedule.size(); ++i) {
    ZREPLICATE_LOG_INFO("step", {IntField("index", static_cast<int64_t>(i + 1)), StringField("operation", plan::Describe(schedule[i]))});
    ExecuteStep(schedule[i]);
  }
}

void TransferExecutor::ExecuteStep(const plan::TransferStep& step) {
  if (options_.dry_run) {
    return;
  }

  observability::SpanScope span("zreplicate.step");
  span.SetAttribute("operation", plan::Describe(step));

  try {
    std::visit(plan::Overloaded{
                   [&](const plan::CreateStub& op) { destination_->CreateDataset(op.path, /*create_parents=*/false); },
                   [&](const plan::Destroy& op) { destination_->DestroyDataset(op.path); },
                   [&](const plan::DestroyRecursively& op) { destination_->DestroyRecursively(op.path); },
                   [&](const plan::ReplicateSingle& op) {
                     Transfer(op.source_path, op.destination_path, op.base, op.target, /*recursive=*/false, op.into_stub);
                   },
                   [&](const plan::ReplicateRecursive& op) {
                     Transfer(op.source_path, op.destination_path, op.base, op.target, /*recursive=*/true, /*into_stub=*/false);
                   },
               },
               step);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw;
  }
}

process::Command TransferExecutor::FilterCommand() const {
  process::Command filter;
  filter.argv.push_back(options_.filter_command);
  if (!options_.progress) {
    filter.argv.push_back("-q");
  }
  if (options_.rate_limit_bytes_per_sec > 0) {
    filter.argv.push_back("-L");
    filter.argv.push_back(std::to_string(options_.rate_limit_bytes_per_sec));
  }
  if (options_.buffer_size_bytes > 0) {
    filter.argv.push_back("-B");
    filter.argv.push_back(std::to_string(options_.buffer_size_bytes));
  }
  return filter;
}

std::vector<process::Command> TransferExecutor::TransferStages(const std::string& source_path, const std::string& destination_path,
                                                               const std::optional<std::string>& base, const std::string& target,
                                                               bool recursive, bool force) const {
  host::SendRequest request;
  request.dataset   = source_path;
  request.base      = base;
  request.target    = target;
  request.recursive = recursive;
  request.dedup     = options_.dedup;

  std::vector<process::Command> stages;
  stages.push_back(source_->SendCommand(request));
  if (options_.NeedsFilter()) {
    stages.push_back(FilterCommand());
  }
  stages.push_back(destination_->ReceiveCommand(destination_path, force));
  return stages;
}

void TransferExecutor::Transfer(const std::string& source_path, const std::string& destination_path,
                                const std::optional<std::string>& base, const std::string& target, bool recursive, bool into_stub) {
  std::optional<std::size_t> pipe_capacity;
  if (options_.buffer_size_bytes > 0) {
    pipe_capacity = static_cast<std::size_t>(options_.buffer_size_bytes);
  }

  process::Pipeline pipeline(pipe_capacity);
  for (auto& stage : TransferStages(source_path, destination_path, base, target, recursive, into_stub)) {
    ZREPLICATE_LOG_DEBUG("pipeline stage", {StringField("command", stage.ToString())});
    pipeline.AddStage(std::move(stage));
  }

  const auto started = std::chrono::steady_clock::now();

  process::PipelineResult result;
  try {
    result = pipeline.Run();
  } catch (const std::system_error& e) {
    throw util::TransferError("cannot start transfer of " + source_path + "@" + target + ": " + e.what());
  }

  if (!result.Ok()) {
    const auto detail = result.DescribeFailures();
    // Only the receiving side can reject a full send for lack of common history.
    if (!base && !into_stub && result.OnlyLastStageFailed()) {
      throw util::ConflictError("full send of " + source_path + "@" + target + " rejected by " + destination_path +
                                " (no common snapshot with existing history): " + detail);
    }
    throw util::TransferError("transfer of " + source_path + "@" + target + " into " + destination_path + " failed: " + detail);
  }

  ZREPLICATE_LOG_INFO("transfer complete", {StringField("source", source_path + "@" + target), StringField("destination", destination_path),
                                            IntField("elapsed_ms", static_cast<int64_t>(util::ElapsedMillis(started)))});
}

} // namespace zreplicate::transfer
