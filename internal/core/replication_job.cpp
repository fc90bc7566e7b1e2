#include "replication_job.hpp"

#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "internal/lock/scoped_lock.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/plan/diff_planner.hpp"
#include "internal/plan/schedule_optimizer.hpp"
#include "internal/retention/retention_pruner.hpp"
#include "internal/transfer/transfer_executor.hpp"
#include "internal/util/errors.hpp"

namespace zreplicate::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

ReplicationJob::ReplicationJob(host::HostConnectionPtr source, host::HostConnectionPtr destination, lock::LockServicePtr locks,
                               ReplicationJobOptions options, transfer::TransferOptions transfer_options)
    : source_(std::move(source)),
      destination_(std::move(destination)),
      locks_(std::move(locks)),
      options_(std::move(options)),
      transfer_options_(std::move(transfer_options)) {
  if (!source_ || !destination_ || !locks_) {
    throw std::invalid_argument("ReplicationJob requires source, destination and lock service");
  }
  if (options_.source_dataset.empty() || options_.destination_dataset.empty()) {
    throw util::InvalidArgument("source and destination datasets are required");
  }
  transfer_options_.Validate();
}

void ReplicationJob::CheckLocksAvailable() const {
  for (const auto* name : {&options_.source_dataset, &options_.extra_lock}) {
    if (!name->empty() && !locks_->WouldLock(*name)) {
      throw util::LockUnavailable("lock for " + *name + " is held by another run");
    }
  }
}

ReplicationReport ReplicationJob::Run() {
  observability::SpanScope span("zreplicate.job");
  span.SetAttribute("source", options_.source_dataset);
  span.SetAttribute("destination", options_.destination_dataset);

  ZREPLICATE_LOG_INFO("replication started", {StringField("source", source_->Describe() + ":" + options_.source_dataset),
                                              StringField("destination", destination_->Describe() + ":" + options_.destination_dataset),
                                              BoolField("dry_run", transfer_options_.dry_run)});

  // A dry run never takes a lock; it only reports whether it could.
  lock::ScopedLock source_lock(locks_, options_.source_dataset);
  lock::ScopedLock extra_lock(locks_, options_.extra_lock);
  if (transfer_options_.dry_run) {
    CheckLocksAvailable();
  } else {
    source_lock.Acquire(options_.lock_comment);
    if (!options_.extra_lock.empty()) {
      extra_lock.Acquire(options_.lock_comment);
    }
  }

  ReplicationReport report;
  try {
    const auto schedule = Plan(&report);

    transfer::TransferExecutor executor(source_, destination_, transfer_options_);
    executor.Execute(schedule);
    report.executed_steps = schedule.size();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw;
  }

  span.SetAttribute("steps", static_cast<std::int64_t>(report.executed_steps));
  ZREPLICATE_LOG_INFO("replication finished", {IntField("operations", static_cast<int64_t>(report.planned_operations)),
                                               IntField("steps", static_cast<int64_t>(report.executed_steps)),
                                               IntField("pruned", static_cast<int64_t>(report.pruned_snapshots))});
  return report;
}

plan::OptimizedSchedule ReplicationJob::Plan(ReplicationReport* report) {
  auto source_tree = model::BuildTree(*source_, options_.source_dataset);

  if (options_.daily_only) {
    retention::RetentionPruner pruner(source_, options_.snapshot_prefix, transfer_options_.dry_run);
    report->pruned_snapshots = pruner.CollapseToDaily(source_tree);
    if (report->pruned_snapshots > 0 && !transfer_options_.dry_run) {
      source_tree = model::BuildTree(*source_, options_.source_dataset);
    }
  }

  const auto destination_tree = BuildDestinationTree(report);

  auto schedule = plan::DiffPlanner::RecursiveReplicate(source_tree, destination_tree);
  if (options_.clear_obsolete) {
    auto obsolete = plan::DiffPlanner::RecursiveClearObsolete(source_tree, destination_tree);
    schedule.insert(schedule.end(), std::make_move_iterator(obsolete.begin()), std::make_move_iterator(obsolete.end()));
  }
  report->planned_operations = schedule.size();

  plan::ScheduleOptimizer optimizer(source_tree, destination_tree.RootPath());
  auto optimized = optimizer.Optimize(schedule, options_.allow_recursivize);

  ZREPLICATE_LOG_INFO("schedule planned", {IntField("operations", static_cast<int64_t>(schedule.size())),
                                           IntField("steps", static_cast<int64_t>(optimized.size()))});
  return optimized;
}

model::DatasetTree ReplicationJob::BuildDestinationTree(ReplicationReport* report) {
  try {
    return model::BuildTree(*destination_, options_.destination_dataset);
  } catch (const util::NotFound& e) {
    if (!options_.create_destination) {
      throw;
    }
    ZREPLICATE_LOG_INFO("creating missing destination", {StringField("dataset", options_.destination_dataset),
                                                          StringField("reason", e.what()), BoolField("dry_run", transfer_options_.dry_run)});
  }

  report->destination_created = true;
  if (transfer_options_.dry_run) {
    // Plan against the empty dataset the real run would create.
    return model::DatasetTree(options_.destination_dataset);
  }

  destination_->CreateDataset(options_.destination_dataset, /*create_parents=*/true);
  return model::BuildTree(*destination_, options_.destination_dataset);
}

} // namespace zreplicate::core
