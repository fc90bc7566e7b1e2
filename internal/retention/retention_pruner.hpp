#pragma once

#include <cstddef>
#include <string>

#include "internal/host/host_connection.hpp"
#include "internal/model/dataset_tree.hpp"

namespace zreplicate::retention {

/*
  Thins rotating snapshot tiers named <prefix>_<tier>... on one host.

  Only snapshots matching the tier prefix are considered; the newest `keep`
  of them (by creation order) survive in every dataset of the tree.
*/
class RetentionPruner {
 public:
  RetentionPruner(host::HostConnectionPtr connection, std::string prefix, bool dry_run);

  // Returns the number of snapshots destroyed (or, in dry run, that would be).
  std::size_t Prune(const model::DatasetTree& tree, const std::string& tier, std::size_t keep);

  // Keeps the single newest daily snapshot and nothing from the other tiers.
  std::size_t CollapseToDaily(const model::DatasetTree& tree);

  bool Matches(const std::string& snapshot_name, const std::string& tier) const;

 private:
  host::HostConnectionPtr connection_;
  std::string             prefix_;
  bool                    dry_run_;
};

} // namespace zreplicate::retention
