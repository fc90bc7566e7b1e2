#include "internal/retention/retention_pruner.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "fake_host_connection.hpp"
#include "internal/model/dataset_tree.hpp"

namespace {

using zreplicate::retention::RetentionPruner;
using zreplicate::testing::FakeHostConnection;

std::shared_ptr<FakeHostConnection> RotatingHost() {
  auto host = std::make_shared<FakeHostConnection>("source");
  host->AddDataset("tank");
  host->AddDataset("tank/a");
  for (const char* dataset : {"tank", "tank/a"}) {
    host->AddSnapshot(dataset, "auto_monthly-1");
    host->AddSnapshot(dataset, "auto_daily-1");
    host->AddSnapshot(dataset, "auto_weekly-1");
    host->AddSnapshot(dataset, "auto_daily-2");
    host->AddSnapshot(dataset, "auto_hourly-1");
    host->AddSnapshot(dataset, "auto_hourly-2");
    host->AddSnapshot(dataset, "manual");
  }
  return host;
}

std::vector<std::string> SnapshotNames(const zreplicate::model::DatasetTree& tree, const std::string& path) {
  std::vector<std::string> names;
  for (const auto& snapshot : tree.Lookup(path).snapshots) {
    names.push_back(snapshot.name);
  }
  return names;
}

void TestTierPrefixMatching() {
  RetentionPruner pruner(std::make_shared<FakeHostConnection>(), "auto", false);
  assert(pruner.Matches("auto_daily-2024", "daily"));
  assert(!pruner.Matches("auto_hourly-1", "daily"));
  assert(!pruner.Matches("other_daily-1", "daily"));
}

void TestPruneKeepsNewest() {
  auto host = RotatingHost();
  auto tree = zreplicate::model::BuildTree(*host, "tank");

  RetentionPruner pruner(host, "auto", false);
  assert(pruner.Prune(tree, "hourly", 1) == 2);

  tree = zreplicate::model::BuildTree(*host, "tank");
  const std::vector<std::string> expected{"auto_monthly-1", "auto_daily-1", "auto_weekly-1", "auto_daily-2", "auto_hourly-2", "manual"};
  assert(SnapshotNames(tree, "tank") == expected);
  assert(SnapshotNames(tree, "tank/a") == expected);
}

void TestCollapseToDailyLeavesOneDaily() {
  auto host = RotatingHost();
  auto tree = zreplicate::model::BuildTree(*host, "tank");

  RetentionPruner pruner(host, "auto", false);
  assert(pruner.CollapseToDaily(tree) == 10);

  tree = zreplicate::model::BuildTree(*host, "tank");
  const std::vector<std::string> expected{"auto_daily-2", "manual"};
  assert(SnapshotNames(tree, "tank") == expected);
  assert(SnapshotNames(tree, "tank/a") == expected);
}

void TestDryRunDestroysNothing() {
  auto host = RotatingHost();
  auto tree = zreplicate::model::BuildTree(*host, "tank");
  host->calls.clear();

  RetentionPruner pruner(host, "auto", true);
  assert(pruner.CollapseToDaily(tree) == 10);
  assert(host->calls.empty());
}

} // namespace

int main() {
  TestTierPrefixMatching();
  TestPruneKeepsNewest();
  TestCollapseToDailyLeavesOneDaily();
  TestDryRunDestroysNothing();

  std::cout << "zreplicate_unit_retention_pruner: pass\n";
  return 0;
}
