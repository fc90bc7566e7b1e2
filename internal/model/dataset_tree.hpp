#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dataset.hpp"

namespace zreplicate::host {
class HostConnection;
}

namespace zreplicate::model {

/*
  In-memory dataset hierarchy of one host, rooted at a single dataset.

  Arena layout: every Dataset lives in one vector and refers to its parent
  and children by index, so the tree owns all records and drops them
  together. Built fresh for every run and treated as read-only afterwards;
  after destructive operations the tree is rebuilt, never patched.
*/
class DatasetTree {
 public:
  explicit DatasetTree(std::string root_path);

  DatasetIndex Root() const {
    return 0;
  }

  const std::string& RootPath() const {
    return datasets_.front().path;
  }

  std::size_t Size() const {
    return datasets_.size();
  }

  const Dataset& At(DatasetIndex index) const;

  // ------------------------------------------------------------------
  // Construction
  // ------------------------------------------------------------------

  // Adds `path`; its parent must already be present. Returns the existing
  // index if `path` was added before. Throws std::invalid_argument.
  DatasetIndex AddDataset(std::string_view path);

  // Appends to the dataset's history. Throws std::invalid_argument on a
  // duplicate name or a sequence that does not increase.
  void AppendSnapshot(DatasetIndex index, Snapshot snapshot);

  // ------------------------------------------------------------------
  // Lookup, O(depth)
  // ------------------------------------------------------------------

  std::optional<DatasetIndex> Find(std::string_view path) const;
  std::optional<DatasetIndex> FindRelative(std::string_view relative_path) const;

  // Throws util::NotFound.
  const Dataset& Lookup(std::string_view path) const;

  // "" for the root, "a/b" for RootPath()/a/b.
  std::string RelativePath(DatasetIndex index) const;

  // Parent before child, siblings in name order.
  std::vector<DatasetIndex> PreOrder(DatasetIndex from = 0) const;

 private:
  std::vector<Dataset> datasets_;
};

/*
  Enumerates `root_path` on `connection` once and builds its tree.

  Throws util::ConnectionError if enumeration cannot be performed and
  util::NotFound if the root does not exist on that host.
*/
DatasetTree BuildTree(host::HostConnection& connection, const std::string& root_path);

} // namespace zreplicate::model
