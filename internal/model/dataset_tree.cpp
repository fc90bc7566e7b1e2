#include "dataset_tree.hpp"

#include <algorithm>
#include <stdexcept>

#include "dataset_path.hpp"
#include "internal/host/host_connection.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace zreplicate::model {

bool Dataset::HasSnapshot(const std::string& snapshot_name) const {
  return std::any_of(snapshots.begin(), snapshots.end(), [&](const Snapshot& snapshot) { return snapshot.name == snapshot_name; });
}

DatasetTree::DatasetTree(std::string root_path) {
  while (!root_path.empty() && root_path.back() == '/') {
    root_path.pop_back();
  }
  if (root_path.empty()) {
    throw std::invalid_argument("dataset tree root must not be empty");
  }

  Dataset root;
  root.name = SplitPath(root_path).back();
  root.path = std::move(root_path);
  datasets_.push_back(std::move(root));
}

const Dataset& DatasetTree::At(DatasetIndex index) const {
  if (index >= datasets_.size()) {
    throw std::out_of_range("dataset index out of range: " + std::to_string(index));
  }
  return datasets_[index];
}

DatasetIndex DatasetTree::AddDataset(std::string_view path) {
  const auto relative = RelativeTo(path, RootPath());
  if (relative.empty()) {
    return Root();
  }

  const auto components = SplitPath(relative);
  DatasetIndex parent = Root();
  for (std::size_t i = 0; i + 1 < components.size(); ++i) {
    const auto& children = datasets_[parent].children;
    const auto  it       = children.find(components[i]);
    if (it == children.end()) {
      throw std::invalid_argument("parent of " + std::string(path) + " is not in the tree");
    }
    parent = it->second;
  }

  const auto& name = components.back();
  if (const auto it = datasets_[parent].children.find(name); it != datasets_[parent].children.end()) {
    return it->second;
  }

  Dataset dataset;
  dataset.path   = JoinPath(datasets_[parent].path, name);
  dataset.name   = name;
  dataset.parent = parent;

  const DatasetIndex index = datasets_.size();
  datasets_.push_back(std::move(dataset));
  datasets_[parent].children.emplace(name, index);
  return index;
}

void DatasetTree::AppendSnapshot(DatasetIndex index, Snapshot snapshot) {
  if (index >= datasets_.size()) {
    throw std::out_of_range("dataset index out of range: " + std::to_string(index));
  }

  auto& dataset = datasets_[index];
  if (dataset.HasSnapshot(snapshot.name)) {
    throw std::invalid_argument("duplicate snapshot " + dataset.path + "@" + snapshot.name);
  }
  if (!dataset.snapshots.empty() && snapshot.sequence <= dataset.snapshots.back().sequence) {
    throw std::invalid_argument("snapshot " + dataset.path + "@" + snapshot.name + " is older than " + dataset.path + "@" +
                                dataset.snapshots.back().name);
  }
  dataset.snapshots.push_back(std::move(snapshot));
}

std::optional<DatasetIndex> DatasetTree::Find(std::string_view path) const {
  if (!IsSameOrDescendant(path, RootPath())) {
    return std::nullopt;
  }
  return FindRelative(RelativeTo(path, RootPath()));
}

std::optional<DatasetIndex> DatasetTree::FindRelative(std::string_view relative_path) const {
  DatasetIndex current = Root();
  for (const auto& component : SplitPath(relative_path)) {
    const auto& children = datasets_[current].children;
    const auto  it       = children.find(component);
    if (it == children.end()) {
      return std::nullopt;
    }
    current = it->second;
  }
  return current;
}

const Dataset& DatasetTree::Lookup(std::string_view path) const {
  const auto index = Find(path);
  if (!index) {
    throw util::NotFound("dataset not found: " + std::string(path));
  }
  return datasets_[*index];
}

std::string DatasetTree::RelativePath(DatasetIndex index) const {
  return RelativeTo(At(index).path, RootPath());
}

std::vector<DatasetIndex> DatasetTree::PreOrder(DatasetIndex from) const {
  std::vector<DatasetIndex> order;
  std::vector<DatasetIndex> stack{from};
  while (!stack.empty()) {
    const auto index = stack.back();
    stack.pop_back();
    order.push_back(index);

    const auto& children = At(index).children;
    // Reverse so the smallest name is visited first.
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back(it->second);
    }
  }
  return order;
}

DatasetTree BuildTree(host::HostConnection& connection, const std::string& root_path) {
  const auto entries = connection.Enumerate(root_path);

  const bool has_root = std::any_of(entries.begin(), entries.end(), [&](const host::ListingEntry& entry) {
    return entry.kind == host::EntryKind::kDataset && entry.dataset == root_path;
  });
  if (!has_root) {
    throw util::NotFound("dataset " + root_path + " does not exist on " + connection.Describe());
  }

  DatasetTree tree(root_path);

  // Datasets first, shallowest first, so every parent exists before its
  // children regardless of listing order.
  std::vector<const host::ListingEntry*> datasets;
  for (const auto& entry : entries) {
    if (entry.kind == host::EntryKind::kDataset) {
      datasets.push_back(&entry);
    }
  }
  std::stable_sort(datasets.begin(), datasets.end(), [](const host::ListingEntry* a, const host::ListingEntry* b) {
    return SplitPath(a->dataset).size() < SplitPath(b->dataset).size();
  });

  try {
    for (const auto* entry : datasets) {
      tree.AddDataset(entry->dataset);
    }

    // Snapshots keep listing order: the connection lists them by creation txg.
    for (const auto& entry : entries) {
      if (entry.kind != host::EntryKind::kSnapshot) {
        continue;
      }
      const auto index = tree.Find(entry.dataset);
      if (!index) {
        throw std::invalid_argument("snapshot " + entry.dataset + "@" + entry.snapshot + " has no dataset");
      }
      tree.AppendSnapshot(*index, model::Snapshot{entry.snapshot, entry.create_txg});
    }
  } catch (const std::invalid_argument& e) {
    throw util::RemoteError("malformed listing from " + connection.Describe() + ": " + e.what());
  }

  ZREPLICATE_LOG_DEBUG("built dataset tree", {observability::StringField("host", connection.Describe()),
                                              observability::StringField("root", root_path),
                                              observability::IntField("datasets", static_cast<int64_t>(tree.Size()))});
  return tree;
}

} // namespace zreplicate::model
