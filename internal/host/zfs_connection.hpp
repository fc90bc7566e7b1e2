#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "host_connection.hpp"
#include "host_endpoint.hpp"
#include "internal/process/command_runner.hpp"

namespace zreplicate::host {

struct SshOptions {
  std::string ssh_command = "ssh";
  uint32_t    port        = 0;
  std::string cipher;
  bool        compression        = false;
  bool        trust_unknown_host = false;
  std::string identity_file;
  uint32_t    connect_timeout_sec = 0;
};

/*
  HostConnection backed by the zfs(8) command line.

  A local endpoint runs zfs directly; a remote endpoint runs it through ssh
  in batch mode, the remote command line shell-quoted into a single argument.
*/
class ZfsConnection final : public HostConnection {
 public:
  ZfsConnection(HostEndpoint endpoint, SshOptions ssh, process::CommandRunnerPtr runner, std::string zfs_command = "zfs");

  std::string Describe() const override;
  bool        IsLocal() const override;

  std::vector<ListingEntry> Enumerate(const std::string& root) override;

  void CreateDataset(const std::string& path, bool create_parents) override;
  void DestroyDataset(const std::string& path) override;
  void DestroyRecursively(const std::string& path) override;
  void DestroySnapshot(const std::string& dataset, const std::string& snapshot) override;

  process::Command SendCommand(const SendRequest& request) const override;
  process::Command ReceiveCommand(const std::string& path, bool force) const override;

  // Parses `zfs list -H -p -o name,createtxg` output. Throws util::RemoteError
  // on a malformed line.
  static std::vector<ListingEntry> ParseListing(std::string_view output);

 private:
  process::Command Zfs(std::vector<std::string> args) const;
  process::Command Wrap(process::Command command) const;

  // Runs `command` and maps a failure to the error taxonomy.
  process::CommandResult RunChecked(const process::Command& command, std::string_view action, const std::string& subject);

  HostEndpoint              endpoint_;
  SshOptions                ssh_;
  process::CommandRunnerPtr runner_;
  std::string               zfs_command_;
};

} // namespace zreplicate::host
