#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace zreplicate::config {

/*
  Parsed zreplicate command line.

  Only flags that were present are set; ApplyCommandLine layers them over the
  values loaded from the YAML file.
*/
struct CommandLineOptions {
  bool help    = false;
  bool verbose = false;

  std::optional<std::string> config_path;
  std::optional<std::string> source;
  std::optional<std::string> destination;

  bool dry_run             = false;
  bool progress            = false;
  bool compression         = false;
  bool dedup               = false;
  bool trust_unknown_host  = false;
  bool clear_obsolete      = false;
  bool create_destination  = false;
  bool no_recursive_stream = false;
  bool daily_only          = false;

  std::optional<uint64_t>    rate_limit_bytes_per_sec;
  std::optional<uint64_t>    buffer_size_bytes;
  std::optional<std::string> cipher;
  std::optional<uint32_t>    port;
  std::optional<std::string> lock_dir;
  std::optional<std::string> lock_comment;
  std::optional<std::string> extra_lock;
};

// Throws util::InvalidArgument on unknown flags, missing values or bad numbers.
CommandLineOptions ParseCommandLine(int argc, const char* const argv[]);

void ApplyCommandLine(const CommandLineOptions& options, zreplicate::runtime::config::RuntimeConfig* config);

// Accepts plain byte counts and K/M/G suffixes (powers of 1024).
uint64_t ParseByteSize(std::string_view text);

std::string Usage();

} // namespace zreplicate::config
