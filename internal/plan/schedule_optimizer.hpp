#pragma once

#include <string>

#include "internal/model/dataset_tree.hpp"
#include "operation.hpp"

namespace zreplicate::plan {

/*
  Rewrites a planner schedule into the fewest transfer invocations.

  A source dataset P with children becomes one ReplicateRecursive when
  recursivizing is allowed and every dataset of P's source subtree (P
  included) has a Replicate with the same base and target, none of them
  landing in a stub. Only the topmost such P is emitted; the transfers it
  covers are dropped. Every other Replicate becomes a ReplicateSingle that
  still carries its whole base → target range in one stream.

  CreateStub / Destroy / DestroyRecursively pass through unmerged in their
  original relative order. Inferred destinations are resolved against the
  destination root.

  Needs the source tree: a dataset that is already in sync has no operation,
  and only the tree shows that it would be swept up by a recursive send.
*/
class ScheduleOptimizer {
 public:
  ScheduleOptimizer(const model::DatasetTree& source, std::string destination_root);

  OptimizedSchedule Optimize(const OperationSchedule& schedule, bool allow_recursivize) const;

 private:
  const model::DatasetTree& source_;
  std::string               destination_root_;
};

} // namespace zreplicate::plan
