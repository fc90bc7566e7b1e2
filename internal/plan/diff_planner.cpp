#include "diff_planner.hpp"

#include <unordered_set>

#include "internal/model/dataset_path.hpp"
#include "internal/observability/logging.hpp"

namespace zreplicate::plan {

using model::Dataset;
using model::DatasetIndex;
using model::DatasetTree;

namespace {

void PlanReplicate(const DatasetTree& source, DatasetIndex source_index, const DatasetTree& destination,
                   std::optional<DatasetIndex> destination_index, OperationSchedule* schedule) {
  const Dataset& s      = source.At(source_index);
  const auto*    latest = s.LatestSnapshot();

  if (!destination_index) {
    schedule->push_back(CreateStub{model::JoinPath(destination.RootPath(), source.RelativePath(source_index))});
    if (latest) {
      Replicate op;
      op.source_path = s.path;
      op.target      = latest->name;
      op.into_stub   = true;
      schedule->push_back(std::move(op));
    }

    for (const auto& [name, child] : s.children) {
      PlanReplicate(source, child, destination, std::nullopt, schedule);
    }
    return;
  }

  const Dataset& d = destination.At(*destination_index);
  if (latest) {
    const auto common = DiffPlanner::LatestCommonSnapshot(s, d);
    if (!common) {
      if (!d.snapshots.empty()) {
        // Divergent histories: left for the receive side to reject.
        ZREPLICATE_LOG_WARN("no common snapshot, planning full send", {observability::StringField("source", s.path),
                                                                      observability::StringField("destination", d.path)});
      }
      Replicate op;
      op.source_path      = s.path;
      op.destination_path = d.path;
      op.target           = latest->name;
      op.into_stub        = d.snapshots.empty();
      schedule->push_back(std::move(op));
    } else if (common->name != latest->name) {
      Replicate op;
      op.source_path      = s.path;
      op.destination_path = d.path;
      op.base             = common->name;
      op.target           = latest->name;
      schedule->push_back(std::move(op));
    }
  }

  for (const auto& [name, child] : s.children) {
    std::optional<DatasetIndex> counterpart;
    if (const auto it = d.children.find(name); it != d.children.end()) {
      counterpart = it->second;
    }
    PlanReplicate(source, child, destination, counterpart, schedule);
  }
}

void PlanClearObsolete(const DatasetTree& source, std::optional<DatasetIndex> source_index, const DatasetTree& destination,
                       DatasetIndex destination_index, OperationSchedule* schedule) {
  const Dataset& d = destination.At(destination_index);
  if (!source_index) {
    schedule->push_back(DestroyRecursively{d.path});
    return;
  }

  const Dataset& s = source.At(*source_index);
  for (const auto& [name, child] : d.children) {
    std::optional<DatasetIndex> counterpart;
    if (const auto it = s.children.find(name); it != s.children.end()) {
      counterpart = it->second;
    }
    PlanClearObsolete(source, counterpart, destination, child, schedule);
  }
}

} // namespace

std::optional<model::Snapshot> DiffPlanner::LatestCommonSnapshot(const Dataset& source, const Dataset& destination) {
  std::unordered_set<std::string> destination_names;
  destination_names.reserve(destination.snapshots.size());
  for (const auto& snapshot : destination.snapshots) {
    destination_names.insert(snapshot.name);
  }

  for (auto it = source.snapshots.rbegin(); it != source.snapshots.rend(); ++it) {
    if (destination_names.count(it->name) != 0) {
      return *it;
    }
  }
  return std::nullopt;
}

OperationSchedule DiffPlanner::RecursiveReplicate(const DatasetTree& source, const DatasetTree& destination) {
  OperationSchedule schedule;
  PlanReplicate(source, source.Root(), destination, destination.Root(), &schedule);
  return schedule;
}

OperationSchedule DiffPlanner::RecursiveClearObsolete(const DatasetTree& source, const DatasetTree& destination) {
  OperationSchedule schedule;
  PlanClearObsolete(source, source.Root(), destination, destination.Root(), &schedule);
  return schedule;
}

} // namespace zreplicate::plan
