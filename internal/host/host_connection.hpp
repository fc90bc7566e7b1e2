#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/process/command.hpp"

namespace zreplicate::host {

enum class EntryKind {
  kDataset,
  kSnapshot,
};

/*
  One line of a host's dataset enumeration.

  For kSnapshot entries `dataset` is the owning dataset and `snapshot` the
  name after '@'. `create_txg` is the host's creation transaction group and
  orders entries chronologically.
*/
struct ListingEntry {
  EntryKind   kind = EntryKind::kDataset;
  std::string dataset;
  std::string snapshot;
  uint64_t    create_txg = 0;
};

/*
  Parameters of the send primitive.

  base absent → full stream of `target`; otherwise one incremental stream
  carrying every snapshot from base up to target.
*/
struct SendRequest {
  std::string                dataset;
  std::optional<std::string> base;
  std::string                target;
  bool                       recursive = false;
  bool                       dedup     = false;
};

/*
  Execution context on one host, local or reached over ssh.

  Primitive operations throw:
    util::ConnectionError  host unreachable, authentication failure
    util::NotFound / AlreadyExists / Busy / RemoteError  the host rejected it

  Streaming primitives are returned as commands; the transfer executor wires
  them into a pipeline.
*/
class HostConnection {
 public:
  virtual ~HostConnection() = default;

  virtual std::string Describe() const = 0;
  virtual bool        IsLocal() const  = 0;

  // Datasets and snapshots under `root` (inclusive), parents before children,
  // snapshots in creation order.
  virtual std::vector<ListingEntry> Enumerate(const std::string& root) = 0;

  virtual void CreateDataset(const std::string& path, bool create_parents) = 0;
  virtual void DestroyDataset(const std::string& path)                     = 0;
  virtual void DestroyRecursively(const std::string& path)                 = 0;
  virtual void DestroySnapshot(const std::string& dataset, const std::string& snapshot) = 0;

  virtual process::Command SendCommand(const SendRequest& request) const = 0;

  // force: allow a full stream to land in an existing empty dataset.
  virtual process::Command ReceiveCommand(const std::string& path, bool force) const = 0;
};

using HostConnectionPtr = std::shared_ptr<HostConnection>;

} // namespace zreplicate::host
