#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "snapshot.hpp"

namespace zreplicate::model {

using DatasetIndex = std::size_t;

/*
  One node of a DatasetTree.

  Records live in the tree's arena; parent and children refer to other
  records by index. Snapshots keep creation order.
*/
struct Dataset {
  std::string path;
  std::string name;

  std::optional<DatasetIndex>         parent;
  std::map<std::string, DatasetIndex> children;
  std::vector<Snapshot>               snapshots;

  const Snapshot* LatestSnapshot() const {
    return snapshots.empty() ? nullptr : &snapshots.back();
  }

  bool HasSnapshot(const std::string& snapshot_name) const;
};

} // namespace zreplicate::model
