#pragma once

#include <optional>

#include "internal/model/dataset_tree.hpp"
#include "operation.hpp"

namespace zreplicate::plan {

/*
  Compares a source tree against a destination tree.

  Pure functions over two already-built trees; the result is an
  unoptimized schedule in parent-before-child order.
*/
class DiffPlanner {
 public:
  // Operations that bring every source dataset up to its latest snapshot.
  static OperationSchedule RecursiveReplicate(const model::DatasetTree& source, const model::DatasetTree& destination);

  // DestroyRecursively for every destination subtree root without a source
  // counterpart; nothing below such a root.
  static OperationSchedule RecursiveClearObsolete(const model::DatasetTree& source, const model::DatasetTree& destination);

  // Latest snapshot of `source` whose name also exists on `destination`,
  // scanning from the tail of the source history.
  static std::optional<model::Snapshot> LatestCommonSnapshot(const model::Dataset& source, const model::Dataset& destination);
};

} // namespace zreplicate::plan
