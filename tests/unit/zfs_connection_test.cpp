#include "internal/host/zfs_connection.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/host/host_endpoint.hpp"
#include "internal/util/errors.hpp"

namespace {

using zreplicate::host::EntryKind;
using zreplicate::host::HostEndpoint;
using zreplicate::host::SendRequest;
using zreplicate::host::SshOptions;
using zreplicate::host::ZfsConnection;
using zreplicate::process::Command;
using zreplicate::process::CommandResult;

class RecordingRunner final : public zreplicate::process::CommandRunner {
 public:
  CommandResult Run(const Command& command) override {
    commands.push_back(command.ToString());
    return next;
  }

  std::vector<std::string> commands;
  CommandResult            next;
};

void TestEndpointParsing() {
  const auto local = HostEndpoint::Parse("tank/data/");
  assert(local.IsLocal());
  assert(local.dataset == "tank/data");
  assert(local.ToString() == "tank/data");

  const auto remote = HostEndpoint::Parse("backup@nas:pool/tank");
  assert(!remote.IsLocal());
  assert(remote.user == "backup");
  assert(remote.host == "nas");
  assert(remote.dataset == "pool/tank");
  assert(remote.Destination() == "backup@nas");

  // A colon after the first slash belongs to the dataset name.
  const auto colon = HostEndpoint::Parse("pool/a:b");
  assert(colon.IsLocal());
  assert(colon.dataset == "pool/a:b");

  // Before the first slash the colon always ends the host part.
  const auto bare = HostEndpoint::Parse("pool:x");
  assert(!bare.IsLocal());
  assert(bare.host == "pool");
  assert(bare.dataset == "x");

  for (const char* bad : {":pool", "nas:", ""}) {
    bool threw = false;
    try {
      (void)HostEndpoint::Parse(bad);
    } catch (const zreplicate::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestLocalCommandLines() {
  auto          runner = std::make_shared<RecordingRunner>();
  ZfsConnection local(HostEndpoint::Parse("tank"), SshOptions{}, runner);

  SendRequest incremental{"tank/a", std::string("s1"), "s3", true, true};
  assert(local.SendCommand(incremental).ToString() == "zfs send -R -D -I tank/a@s1 tank/a@s3");

  SendRequest full{"tank/a", std::nullopt, "s3", false, false};
  assert(local.SendCommand(full).ToString() == "zfs send tank/a@s3");

  assert(local.ReceiveCommand("backup/a", true).ToString() == "zfs receive -F backup/a");
  assert(local.ReceiveCommand("backup/a", false).ToString() == "zfs receive backup/a");

  local.CreateDataset("tank/new", true);
  local.DestroyRecursively("tank/old");
  local.DestroySnapshot("tank", "hourly-1");

  const std::vector<std::string> expected{"zfs create -p tank/new", "zfs destroy -r tank/old", "zfs destroy tank@hourly-1"};
  assert(runner->commands == expected);
}

void TestRemoteCommandsGoThroughSsh() {
  auto       runner = std::make_shared<RecordingRunner>();
  SshOptions ssh;
  ssh.port               = 2222;
  ssh.cipher             = "aes128-ctr";
  ssh.compression        = true;
  ssh.trust_unknown_host = true;

  ZfsConnection remote(HostEndpoint::Parse("root@nas:pool/backup"), ssh, runner, "/sbin/zfs");
  assert(remote.Describe() == "root@nas");

  const auto receive = remote.ReceiveCommand("pool/backup/my data", false);
  assert(receive.argv.front() == "ssh");
  assert(receive.argv.back() == "/sbin/zfs receive 'pool/backup/my data'");
  assert(receive.ToString() ==
         "ssh -o BatchMode=yes -o StrictHostKeyChecking=no -o UserKnownHostsFile=/dev/null -p 2222 -c aes128-ctr -C root@nas -- "
         "'/sbin/zfs receive '\\''pool/backup/my data'\\'''");
}

void TestListingIsParsed() {
  const auto entries = ZfsConnection::ParseListing("tank\t5\ntank/a\t9\ntank@s1\t10\ntank/a@s1\t11\n\n");
  assert(entries.size() == 4);
  assert(entries[0].kind == EntryKind::kDataset && entries[0].dataset == "tank" && entries[0].create_txg == 5);
  assert(entries[2].kind == EntryKind::kSnapshot && entries[2].dataset == "tank" && entries[2].snapshot == "s1");
  assert(entries[3].dataset == "tank/a" && entries[3].create_txg == 11);

  for (const char* bad : {"tank 5\n", "tank\tfive\n", "tank\t5x\n"}) {
    bool threw = false;
    try {
      (void)ZfsConnection::ParseListing(bad);
    } catch (const zreplicate::util::RemoteError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestEnumerateUsesRunnerOutput() {
  auto runner      = std::make_shared<RecordingRunner>();
  runner->next.out = "tank\t1\ntank@s1\t2\n";

  ZfsConnection local(HostEndpoint::Parse("tank"), SshOptions{}, runner);
  const auto    entries = local.Enumerate("tank");
  assert(entries.size() == 2);
  assert(runner->commands.front() == "zfs list -H -p -r -t filesystem,volume,snapshot -o name,createtxg -s createtxg tank");
}

template <class Error>
bool Raises(ZfsConnection& connection, RecordingRunner& runner, int exit_code, const std::string& err) {
  runner.next = CommandResult{exit_code, "", err};
  try {
    connection.DestroyDataset("tank/a");
  } catch (const Error&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

void TestFailuresAreClassified() {
  auto          runner = std::make_shared<RecordingRunner>();
  ZfsConnection remote(HostEndpoint::Parse("nas:tank"), SshOptions{}, runner);
  ZfsConnection local(HostEndpoint::Parse("tank"), SshOptions{}, runner);

  assert(Raises<zreplicate::util::ConnectionError>(remote, *runner, 255, "ssh: connect to host nas port 22: Connection refused"));
  assert(Raises<zreplicate::util::ConnectionError>(local, *runner, 127, "exec failed: zfs"));
  assert(Raises<zreplicate::util::NotFound>(local, *runner, 1, "cannot open 'tank/a': dataset does not exist"));
  assert(Raises<zreplicate::util::AlreadyExists>(local, *runner, 1, "cannot create 'tank/a': dataset already exists"));
  assert(Raises<zreplicate::util::Busy>(local, *runner, 1, "cannot destroy 'tank/a': dataset is busy"));
  assert(Raises<zreplicate::util::RemoteError>(local, *runner, 1, "permission denied"));
  // 255 from a local zfs is the tool's own status, not a transport failure.
  assert(!Raises<zreplicate::util::ConnectionError>(local, *runner, 255, "internal error"));
}

} // namespace

int main() {
  TestEndpointParsing();
  TestLocalCommandLines();
  TestRemoteCommandsGoThroughSsh();
  TestListingIsParsed();
  TestEnumerateUsesRunnerOutput();
  TestFailuresAreClassified();

  std::cout << "zreplicate_unit_zfs_connection: pass\n";
  return 0;
}
