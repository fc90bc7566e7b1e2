#include "internal/core/replication_job.hpp"

#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fake_host_connection.hpp"
#include "internal/lock/directory_lock_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using zreplicate::core::ReplicationJob;
using zreplicate::core::ReplicationJobOptions;
using zreplicate::lock::DirectoryLockService;
using zreplicate::testing::FakeHostConnection;
using zreplicate::transfer::TransferOptions;

struct Fixture {
  std::shared_ptr<FakeHostConnection>   source      = std::make_shared<FakeHostConnection>("source");
  std::shared_ptr<FakeHostConnection>   destination = std::make_shared<FakeHostConnection>("destination");
  std::shared_ptr<DirectoryLockService> locks;
  ReplicationJobOptions                 options;
  TransferOptions                       transfer;

  explicit Fixture(const std::string& test_name) {
    const auto dir = std::filesystem::temp_directory_path() / ("zreplicate_job_tests_" + std::to_string(::getpid())) / test_name;
    std::filesystem::remove_all(dir);
    locks = std::make_shared<DirectoryLockService>(dir);

    options.source_dataset      = "tank";
    options.destination_dataset = "backup";

    source->AddDataset("tank");
    source->AddDataset("tank/a");
    for (const char* dataset : {"tank", "tank/a"}) {
      source->AddSnapshot(dataset, "s1");
      source->AddSnapshot(dataset, "s2");
    }
  }

  void SeedDestination() {
    destination->AddDataset("backup");
    destination->AddDataset("backup/a");
    destination->AddSnapshot("backup", "s1");
    destination->AddSnapshot("backup/a", "s1");
  }

  ReplicationJob Job() {
    return ReplicationJob(source, destination, locks, options, transfer);
  }
};

bool Contains(const std::vector<std::string>& calls, const std::string& call) {
  return std::find(calls.begin(), calls.end(), call) != calls.end();
}

void TestIncrementalRunUsesOneRecursiveStream() {
  Fixture fixture("incremental");
  fixture.SeedDestination();
  fixture.options.lock_comment = "test";

  const auto report = fixture.Job().Run();
  assert(report.planned_operations == 2);
  assert(report.executed_steps == 1);
  assert(fixture.source->sends.size() == 1);
  assert(fixture.source->sends[0].recursive);
  assert(fixture.source->sends[0].base == std::optional<std::string>("s1"));
  assert(fixture.destination->receives.front() == "backup");

  // Released afterwards.
  assert(fixture.locks->WouldLock("tank"));
}

void TestRecursiveStreamCanBeDisabled() {
  Fixture fixture("no_recursive");
  fixture.SeedDestination();
  fixture.options.allow_recursivize = false;

  const auto report = fixture.Job().Run();
  assert(report.executed_steps == 2);
  assert(!fixture.source->sends[0].recursive && !fixture.source->sends[1].recursive);
}

void TestMissingDestinationIsFatalUnlessCreated() {
  Fixture missing("missing_destination");
  bool    threw = false;
  try {
    missing.Job().Run();
  } catch (const zreplicate::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(missing.source->sends.empty());
  assert(missing.locks->WouldLock("tank"));

  Fixture created("create_destination");
  created.options.create_destination = true;

  const auto report = created.Job().Run();
  assert(report.destination_created);
  assert(created.destination->calls[1] == "create -p backup");
  assert(Contains(created.destination->calls, "create backup/a"));
  assert(created.destination->receives.front() == "-F backup");
}

void TestHeldLockSkipsTheRun() {
  Fixture fixture("held_lock");
  fixture.SeedDestination();
  assert(fixture.locks->Lock("tank", "other run"));

  bool threw = false;
  try {
    fixture.Job().Run();
  } catch (const zreplicate::util::LockUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(fixture.source->calls.empty());
  assert(fixture.destination->calls.empty());
  // Someone else's lock stays in place.
  assert(!fixture.locks->WouldLock("tank"));
}

void TestExtraLockIsHeldToo() {
  Fixture fixture("extra_lock");
  fixture.SeedDestination();
  fixture.options.extra_lock = "nightly";
  assert(fixture.locks->Lock("nightly"));

  bool threw = false;
  try {
    fixture.Job().Run();
  } catch (const zreplicate::util::LockUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(fixture.locks->WouldLock("tank") && "the source lock is released when the extra lock fails");
}

void TestFailedTransferReleasesLocks() {
  Fixture fixture("failed_transfer");
  fixture.SeedDestination();
  fixture.destination->receive_command = zreplicate::process::Command{{"sh", "-c", "cat > /dev/null; exit 1"}};

  bool threw = false;
  try {
    fixture.Job().Run();
  } catch (const zreplicate::util::TransferError&) {
    threw = true;
  }
  assert(threw);
  assert(fixture.locks->WouldLock("tank"));
}

void TestClearObsoleteDestroysAfterReplicating() {
  Fixture fixture("clear_obsolete");
  fixture.SeedDestination();
  fixture.destination->AddDataset("backup/old");
  fixture.destination->AddDataset("backup/old/child");
  fixture.options.clear_obsolete = true;

  fixture.Job().Run();
  assert(fixture.destination->calls.back() == "destroy -r backup/old");
  assert(fixture.source->sends.size() == 1);
}

void TestDryRunTouchesNothing() {
  Fixture fixture("dry_run");
  fixture.transfer.dry_run           = true;
  fixture.options.create_destination = true;
  fixture.options.clear_obsolete     = true;

  const auto report = fixture.Job().Run();
  assert(report.destination_created);
  assert(report.executed_steps > 0);
  assert(fixture.source->sends.empty());
  assert(fixture.destination->receives.empty());
  assert(fixture.destination->calls.size() == 1 && fixture.destination->calls[0] == "enumerate backup");
  assert(fixture.locks->List().empty());
}

void TestDailyOnlyPrunesSourceFirst() {
  Fixture fixture("daily_only");
  fixture.SeedDestination();
  fixture.options.daily_only      = true;
  fixture.options.snapshot_prefix = "auto";
  fixture.source->AddSnapshot("tank", "auto_hourly-1");
  fixture.source->AddSnapshot("tank", "auto_daily-1");

  const auto report = fixture.Job().Run();
  assert(report.pruned_snapshots == 1);
  assert(Contains(fixture.source->calls, "destroy tank@auto_hourly-1"));
  assert(fixture.source->sends.front().target == "auto_daily-1");
}

} // namespace

int main() {
  TestIncrementalRunUsesOneRecursiveStream();
  TestRecursiveStreamCanBeDisabled();
  TestMissingDestinationIsFatalUnlessCreated();
  TestHeldLockSkipsTheRun();
  TestExtraLockIsHeldToo();
  TestFailedTransferReleasesLocks();
  TestClearObsoleteDestroysAfterReplicating();
  TestDryRunTouchesNothing();
  TestDailyOnlyPrunesSourceFirst();

  std::cout << "zreplicate_unit_replication_job: pass\n";
  return 0;
}
