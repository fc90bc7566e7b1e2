#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/host/host_connection.hpp"
#include "internal/model/dataset_path.hpp"
#include "internal/util/errors.hpp"

namespace zreplicate::testing {

/*
  In-memory host for tests.

  Keeps a dataset listing that the mutating primitives update, records every
  primitive call, and hands out caller-chosen commands for the streaming
  primitives.
*/
class FakeHostConnection final : public host::HostConnection {
 public:
  explicit FakeHostConnection(std::string name = "fake") : name_(std::move(name)) {
  }

  void AddDataset(const std::string& path) {
    if (std::find(datasets_.begin(), datasets_.end(), path) == datasets_.end()) {
      datasets_.push_back(path);
    }
  }

  void AddSnapshot(const std::string& dataset, const std::string& snapshot) {
    snapshots_.push_back(host::ListingEntry{host::EntryKind::kSnapshot, dataset, snapshot, ++txg_});
  }

  std::string Describe() const override {
    return name_;
  }

  bool IsLocal() const override {
    return true;
  }

  std::vector<host::ListingEntry> Enumerate(const std::string& root) override {
    calls.push_back("enumerate " + root);
    if (std::find(datasets_.begin(), datasets_.end(), root) == datasets_.end()) {
      throw util::NotFound("cannot open '" + root + "': dataset does not exist");
    }

    std::vector<host::ListingEntry> entries;
    for (const auto& dataset : datasets_) {
      if (model::IsSameOrDescendant(dataset, root)) {
        entries.push_back(host::ListingEntry{host::EntryKind::kDataset, dataset, {}, 0});
      }
    }
    for (const auto& snapshot : snapshots_) {
      if (model::IsSameOrDescendant(snapshot.dataset, root)) {
        entries.push_back(snapshot);
      }
    }
    return entries;
  }

  void CreateDataset(const std::string& path, bool create_parents) override {
    calls.push_back(std::string(create_parents ? "create -p " : "create ") + path);
    AddDataset(path);
  }

  void DestroyDataset(const std::string& path) override {
    calls.push_back("destroy " + path);
    RemoveWhere([&](const std::string& dataset) { return dataset == path; });
  }

  void DestroyRecursively(const std::string& path) override {
    calls.push_back("destroy -r " + path);
    RemoveWhere([&](const std::string& dataset) { return model::IsSameOrDescendant(dataset, path); });
  }

  void DestroySnapshot(const std::string& dataset, const std::string& snapshot) override {
    calls.push_back("destroy " + dataset + "@" + snapshot);
    snapshots_.erase(std::remove_if(snapshots_.begin(), snapshots_.end(),
                                    [&](const host::ListingEntry& entry) { return entry.dataset == dataset && entry.snapshot == snapshot; }),
                     snapshots_.end());
  }

  process::Command SendCommand(const host::SendRequest& request) const override {
    sends.push_back(request);
    return send_command;
  }

  process::Command ReceiveCommand(const std::string& path, bool force) const override {
    receives.push_back(std::string(force ? "-F " : "") + path);
    return receive_command;
  }

  // Primitive calls in issue order, e.g. "create pool/a", "destroy -r pool/b".
  std::vector<std::string> calls;

  mutable std::vector<host::SendRequest> sends;
  mutable std::vector<std::string>       receives;

  process::Command send_command{{"sh", "-c", "printf stream"}};
  process::Command receive_command{{"sh", "-c", "cat > /dev/null"}};

 private:
  template <class Predicate>
  void RemoveWhere(Predicate predicate) {
    datasets_.erase(std::remove_if(datasets_.begin(), datasets_.end(), predicate), datasets_.end());
    snapshots_.erase(std::remove_if(snapshots_.begin(), snapshots_.end(),
                                    [&](const host::ListingEntry& entry) { return predicate(entry.dataset); }),
                     snapshots_.end());
  }

  std::string                     name_;
  std::vector<std::string>        datasets_;
  std::vector<host::ListingEntry> snapshots_;
  uint64_t                        txg_ = 0;
};

} // namespace zreplicate::testing
