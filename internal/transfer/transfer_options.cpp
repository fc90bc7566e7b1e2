#include "transfer_options.hpp"

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace zreplicate::transfer {

void TransferOptions::Validate() const {
  if (buffer_size_bytes != 0 && buffer_size_bytes < config::kMinimumBufferSizeBytes) {
    throw util::InvalidArgument("transfer buffer of " + std::to_string(buffer_size_bytes) + " bytes is below the minimum of " +
                                std::to_string(config::kMinimumBufferSizeBytes));
  }
  if (rate_limit_bytes_per_sec != 0 && !progress) {
    throw util::InvalidArgument("a rate limit requires progress display");
  }
  if (NeedsFilter() && filter_command.empty()) {
    throw util::InvalidArgument("progress or rate limiting needs a filter command");
  }
}

TransferOptions TransferOptions::FromConfig(const zreplicate::runtime::config::RuntimeConfig& config) {
  TransferOptions options;
  options.dry_run                  = config.replication().dry_run();
  options.dedup                    = config.transfer().dedup();
  options.progress                 = config.transfer().progress();
  options.rate_limit_bytes_per_sec = config.transfer().rate_limit_bytes_per_sec();
  options.buffer_size_bytes        = config.transfer().buffer_size_bytes();
  if (!config.transfer().filter_command().empty()) {
    options.filter_command = config.transfer().filter_command();
  }
  return options;
}

} // namespace zreplicate::transfer
