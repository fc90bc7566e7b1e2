#pragma once

#include <cstdint>
#include <string>

namespace zreplicate::runtime::config {
class RuntimeConfig;
}

namespace zreplicate::transfer {

/*
  Transfer-time behaviour of the executor.

  Compression and cipher are properties of the ssh tunnel and live in
  host::SshOptions instead.
*/
struct TransferOptions {
  bool dry_run  = false;
  bool dedup    = false;
  bool progress = false;

  // 0 → unlimited.
  uint64_t rate_limit_bytes_per_sec = 0;

  // 0 → OS default pipe capacity; otherwise at least config::kMinimumBufferSizeBytes.
  uint64_t buffer_size_bytes = 0;

  // Rate-limit / progress filter placed between send and receive.
  std::string filter_command = "pv";

  bool NeedsFilter() const {
    return progress || rate_limit_bytes_per_sec > 0;
  }

  // Throws util::InvalidArgument; called before any command starts.
  void Validate() const;

  static TransferOptions FromConfig(const zreplicate::runtime::config::RuntimeConfig& config);
};

} // namespace zreplicate::transfer
