#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/host/host_endpoint.hpp"
#include "internal/host/zfs_connection.hpp"
#include "internal/lock/directory_lock_service.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/transfer/transfer_options.hpp"
#include "internal/util/errors.hpp"

namespace zreplicate::factory {

namespace {

host::SshOptions BuildSshOptions(const zreplicate::runtime::config::SshConfig& ssh) {
  host::SshOptions options;
  if (!ssh.ssh_command().empty()) {
    options.ssh_command = ssh.ssh_command();
  }
  options.port                = ssh.port();
  options.cipher              = ssh.cipher();
  options.compression         = ssh.compression();
  options.trust_unknown_host  = ssh.trust_unknown_host();
  options.identity_file       = ssh.identity_file();
  options.connect_timeout_sec = ssh.connect_timeout_sec();
  return options;
}

} // namespace

lock::LockServicePtr BuildLockService(const zreplicate::runtime::config::RuntimeConfig& config) {
  const auto& root = config.lock().root_path();
  return std::make_shared<lock::DirectoryLockService>(root.empty() ? kDefaultLockRoot : root);
}

Application Build(const zreplicate::runtime::config::RuntimeConfig& config) {
  const auto& replication = config.replication();
  if (replication.source().empty() || replication.destination().empty()) {
    throw util::InvalidArgument("source and destination are required");
  }

  const auto source_endpoint      = host::HostEndpoint::Parse(replication.source());
  const auto destination_endpoint = host::HostEndpoint::Parse(replication.destination());

  // ------------------------------------------------------------------
  // Host connections
  // ------------------------------------------------------------------
  const auto ssh         = BuildSshOptions(config.ssh());
  const auto zfs_command = config.transfer().zfs_command().empty() ? std::string("zfs") : config.transfer().zfs_command();
  auto       runner      = std::make_shared<process::SubprocessRunner>();

  Application app;
  app.source      = std::make_shared<host::ZfsConnection>(source_endpoint, ssh, runner, zfs_command);
  app.destination = std::make_shared<host::ZfsConnection>(destination_endpoint, ssh, runner, zfs_command);
  app.locks       = BuildLockService(config);

  // ------------------------------------------------------------------
  // Job
  // ------------------------------------------------------------------
  core::ReplicationJobOptions options;
  options.source_dataset      = source_endpoint.dataset;
  options.destination_dataset = destination_endpoint.dataset;
  options.clear_obsolete      = replication.clear_obsolete();
  options.create_destination  = replication.create_destination();
  options.allow_recursivize   = !config.transfer().disable_recursive_stream();
  options.daily_only          = config.retention().daily_only();
  if (!config.retention().snapshot_prefix().empty()) {
    options.snapshot_prefix = config.retention().snapshot_prefix();
  }
  options.lock_comment = config.lock().comment();
  options.extra_lock   = config.lock().extra_lock();

  app.job = std::make_unique<core::ReplicationJob>(app.source, app.destination, app.locks, std::move(options),
                                                   transfer::TransferOptions::FromConfig(config));
  return app;
}

} // namespace zreplicate::factory
