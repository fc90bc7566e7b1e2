#include "retention_pruner.hpp"

#include <array>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace zreplicate::retention {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::array<std::pair<const char*, std::size_t>, 4> kDailyOnlyTiers{{
    {"hourly", 0},
    {"daily", 1},
    {"weekly", 0},
    {"monthly", 0},
}};

} // namespace

RetentionPruner::RetentionPruner(host::HostConnectionPtr connection, std::string prefix, bool dry_run)
    : connection_(std::move(connection)), prefix_(std::move(prefix)), dry_run_(dry_run) {
  if (!connection_) {
    throw std::invalid_argument("RetentionPruner requires a host connection");
  }
  if (prefix_.empty()) {
    throw std::invalid_argument("snapshot prefix must not be empty");
  }
}

bool RetentionPruner::Matches(const std::string& snapshot_name, const std::string& tier) const {
  const auto wanted = prefix_ + "_" + tier;
  return snapshot_name.compare(0, wanted.size(), wanted) == 0;
}

std::size_t RetentionPruner::Prune(const model::DatasetTree& tree, const std::string& tier, std::size_t keep) {
  std::size_t destroyed = 0;

  for (const auto index : tree.PreOrder()) {
    const auto& dataset = tree.At(index);

    std::vector<const model::Snapshot*> matching;
    for (const auto& snapshot : dataset.snapshots) {
      if (Matches(snapshot.name, tier)) {
        matching.push_back(&snapshot);
      }
    }
    if (matching.size() <= keep) {
      continue;
    }

    // Oldest first; the tail of `matching` is what survives.
    const auto excess = matching.size() - keep;
    for (std::size_t i = 0; i < excess; ++i) {
      ZREPLICATE_LOG_INFO("pruning snapshot", {StringField("dataset", dataset.path), StringField("snapshot", matching[i]->name),
                                               observability::BoolField("dry_run", dry_run_)});
      if (!dry_run_) {
        connection_->DestroySnapshot(dataset.path, matching[i]->name);
      }
      ++destroyed;
    }
  }

  return destroyed;
}

std::size_t RetentionPruner::CollapseToDaily(const model::DatasetTree& tree) {
  std::size_t destroyed = 0;
  for (const auto& [tier, keep] : kDailyOnlyTiers) {
    destroyed += Prune(tree, tier, keep);
  }
  ZREPLICATE_LOG_INFO("collapsed history to daily", {StringField("root", tree.RootPath()), IntField("destroyed", static_cast<int64_t>(destroyed))});
  return destroyed;
}

} // namespace zreplicate::retention
