#pragma once

#include <cstddef>
#include <string>

#include "internal/host/host_connection.hpp"
#include "internal/lock/lock_service.hpp"
#include "internal/model/dataset_tree.hpp"
#include "internal/plan/operation.hpp"
#include "internal/transfer/transfer_options.hpp"

namespace zreplicate::core {

struct ReplicationJobOptions {
  std::string source_dataset;
  std::string destination_dataset;

  bool clear_obsolete     = false;
  bool create_destination = false;
  bool allow_recursivize  = true;

  // Collapse the source history to one daily snapshot before planning.
  bool        daily_only      = false;
  std::string snapshot_prefix = "zfs-auto-snap";

  std::string lock_comment;
  // Second lock held for the duration of the run; empty → none.
  std::string extra_lock;
};

struct ReplicationReport {
  std::size_t planned_operations = 0;
  std::size_t executed_steps     = 0;
  std::size_t pruned_snapshots   = 0;
  bool        destination_created = false;
};

/*
  One replication run: source → destination.

    lock → [prune source] → build trees → plan → optimize → execute → unlock

  Trees are built fresh for every run, so an interrupted run is resumed by
  running again. Locks are released on every exit path.
*/
class ReplicationJob {
 public:
  ReplicationJob(host::HostConnectionPtr source, host::HostConnectionPtr destination, lock::LockServicePtr locks,
                 ReplicationJobOptions options, transfer::TransferOptions transfer_options);

  // Throws util::LockUnavailable without touching either host if a lock is
  // held; every other error of the pipeline propagates unchanged.
  ReplicationReport Run();

  // Builds both trees and returns the optimized schedule without executing it.
  plan::OptimizedSchedule Plan(ReplicationReport* report);

 private:
  void CheckLocksAvailable() const;

  model::DatasetTree BuildDestinationTree(ReplicationReport* report);

  host::HostConnectionPtr   source_;
  host::HostConnectionPtr   destination_;
  lock::LockServicePtr      locks_;
  ReplicationJobOptions     options_;
  transfer::TransferOptions transfer_options_;
};

} // namespace zreplicate::core
