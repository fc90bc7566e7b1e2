#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/host/host_connection.hpp"
#include "internal/plan/operation.hpp"
#include "internal/process/command.hpp"
#include "transfer_options.hpp"

namespace zreplicate::transfer {

/*
  Runs an optimized schedule against two host connections.

  Steps run strictly one after another; later steps rely on destination
  state created by earlier ones. The first failure propagates and the rest
  of the schedule is not started.

  A replicate step is a pipeline
      source send → [filter] → destination receive
  whose stages run concurrently; it succeeds only if every stage exits 0.

  In dry-run mode each step is logged exactly as in a real run and then
  skipped: neither host is touched.
*/
class TransferExecutor {
 public:
  // Throws util::InvalidArgument if the options are unusable.
  TransferExecutor(host::HostConnectionPtr source, host::HostConnectionPtr destination, TransferOptions options);

  void Execute(const plan::OptimizedSchedule& schedule);
  void ExecuteStep(const plan::TransferStep& step);

  // Stages of one transfer, in stream order.
  std::vector<process::Command> TransferStages(const std::string& source_path, const std::string& destination_path,
                                               const std::optional<std::string>& base, const std::string& target, bool recursive,
                                               bool force) const;

  const TransferOptions& options() const {
    return options_;
  }

 private:
  void Transfer(const std::string& source_path, const std::string& destination_path, const std::optional<std::string>& base,
                const std::string& target, bool recursive, bool into_stub);

  process::Command FilterCommand() const;

  host::HostConnectionPtr source_;
  host::HostConnectionPtr destination_;
  TransferOptions         options_;
};

} // namespace zreplicate::transfer
