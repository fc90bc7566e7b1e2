#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/replication_job.hpp"
#include "internal/host/host_connection.hpp"
#include "internal/lock/lock_service.hpp"

namespace zreplicate::factory {

// Used when the configuration names no lock directory.
inline constexpr const char* kDefaultLockRoot = "/var/lock/zreplicate";

/*
  Application

  Everything one replication run needs, wired from the runtime config.
*/
struct Application {
  host::HostConnectionPtr source;
  host::HostConnectionPtr destination;
  lock::LockServicePtr    locks;

  std::unique_ptr<core::ReplicationJob> job;
};

/*
  Build

  Composition root: the only place that knows the concrete connection,
  runner and lock service types.
*/
Application Build(const zreplicate::runtime::config::RuntimeConfig& config);

lock::LockServicePtr BuildLockService(const zreplicate::runtime::config::RuntimeConfig& config);

} // namespace zreplicate::factory
