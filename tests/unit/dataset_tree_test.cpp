#include "internal/model/dataset_tree.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "fake_host_connection.hpp"
#include "internal/model/dataset_path.hpp"
#include "internal/util/errors.hpp"

namespace {

using zreplicate::model::DatasetTree;
using zreplicate::model::Snapshot;
using zreplicate::testing::FakeHostConnection;

void TestPathHelpers() {
  using namespace zreplicate::model;

  assert(SplitPath("pool/a//b/").size() == 3);
  assert(JoinPath("pool/a", "b/c") == "pool/a/b/c");
  assert(JoinPath("pool", "") == "pool");
  assert(IsSameOrDescendant("pool/a", "pool"));
  assert(IsSameOrDescendant("pool", "pool"));
  assert(!IsSameOrDescendant("pool2/a", "pool"));
  assert(RelativeTo("pool/a/b", "pool") == "a/b");
  assert(RelativeTo("pool", "pool").empty());
  assert(InferDestinationPath("tank/a/b", "tank", "backup/tank") == "backup/tank/a/b");

  bool threw = false;
  try {
    (void)RelativeTo("other/a", "pool");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestPreOrderVisitsParentsFirstAndSiblingsByName() {
  DatasetTree tree("pool");
  tree.AddDataset("pool/zeta");
  tree.AddDataset("pool/alpha");
  tree.AddDataset("pool/alpha/inner");
  tree.AddDataset("pool/mid");

  std::vector<std::string> paths;
  for (const auto index : tree.PreOrder()) {
    paths.push_back(tree.At(index).path);
  }

  const std::vector<std::string> expected{"pool", "pool/alpha", "pool/alpha/inner", "pool/mid", "pool/zeta"};
  assert(paths == expected);
  assert(tree.RelativePath(*tree.Find("pool/alpha/inner")) == "alpha/inner");
  assert(tree.RelativePath(tree.Root()).empty());
}

void TestAddDatasetRequiresParentAndIsIdempotent() {
  DatasetTree tree("pool");
  const auto  a = tree.AddDataset("pool/a");
  assert(tree.AddDataset("pool/a") == a);
  assert(tree.Size() == 2);
  assert(tree.At(a).parent == tree.Root());

  bool threw = false;
  try {
    tree.AddDataset("pool/missing/child");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "a dataset without parent must be rejected");
}

void TestSnapshotHistoryKeepsCreationOrder() {
  DatasetTree tree("pool");
  tree.AppendSnapshot(tree.Root(), Snapshot{"zz-first", 10});
  tree.AppendSnapshot(tree.Root(), Snapshot{"aa-second", 11});

  const auto& root = tree.At(tree.Root());
  assert(root.snapshots.front().name == "zz-first");
  assert(root.LatestSnapshot()->name == "aa-second");
  assert(root.HasSnapshot("zz-first"));

  bool duplicate = false;
  try {
    tree.AppendSnapshot(tree.Root(), Snapshot{"zz-first", 12});
  } catch (const std::invalid_argument&) {
    duplicate = true;
  }
  assert(duplicate);

  bool older = false;
  try {
    tree.AppendSnapshot(tree.Root(), Snapshot{"late", 5});
  } catch (const std::invalid_argument&) {
    older = true;
  }
  assert(older);
}

void TestLookupThrowsNotFound() {
  DatasetTree tree("pool");
  tree.AddDataset("pool/a");

  assert(tree.Lookup("pool/a").name == "a");
  assert(!tree.Find("pool/b"));
  assert(!tree.Find("elsewhere"));

  bool threw = false;
  try {
    (void)tree.Lookup("pool/b");
  } catch (const zreplicate::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestBuildTreeFromListing() {
  FakeHostConnection host;
  host.AddDataset("tank");
  host.AddDataset("tank/a");
  host.AddDataset("tank/a/b");
  host.AddDataset("other");
  host.AddSnapshot("tank", "s1");
  host.AddSnapshot("tank/a", "s1");
  host.AddSnapshot("tank", "s2");
  host.AddSnapshot("other", "s1");

  const auto tree = zreplicate::model::BuildTree(host, "tank");
  assert(tree.Size() == 3);
  assert(tree.At(tree.Root()).snapshots.size() == 2);
  assert(tree.Lookup("tank/a").snapshots.size() == 1);
  assert(tree.Lookup("tank/a/b").snapshots.empty());
  assert(!tree.Find("other"));
  assert(host.calls.size() == 1);
}

void TestBuildTreeMissingRoot() {
  FakeHostConnection host;
  host.AddDataset("tank");

  bool threw = false;
  try {
    (void)zreplicate::model::BuildTree(host, "backup");
  } catch (const zreplicate::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestBuildTreeRejectsOrphanEntries() {
  FakeHostConnection host;
  host.AddDataset("tank");
  host.AddDataset("tank/a/b");

  bool threw = false;
  try {
    (void)zreplicate::model::BuildTree(host, "tank");
  } catch (const zreplicate::util::RemoteError&) {
    threw = true;
  }
  assert(threw && "a dataset whose parent is not listed is malformed");
}

} // namespace

int main() {
  TestPathHelpers();
  TestPreOrderVisitsParentsFirstAndSiblingsByName();
  TestAddDatasetRequiresParentAndIsIdempotent();
  TestSnapshotHistoryKeepsCreationOrder();
  TestLookupThrowsNotFound();
  TestBuildTreeFromListing();
  TestBuildTreeMissingRoot();
  TestBuildTreeRejectsOrphanEntries();

  std::cout << "zreplicate_unit_dataset_tree: pass\n";
  return 0;
}
