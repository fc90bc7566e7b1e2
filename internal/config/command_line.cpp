#include "command_line.hpp"

#include <cctype>
#include <limits>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace zreplicate::config {

namespace {

constexpr std::string_view kOsDefaultBuffer = "default";

std::string RequireValue(int argc, const char* const argv[], int* index) {
  const std::string flag = argv[*index];
  if (*index + 1 >= argc) {
    throw util::InvalidArgument("missing value for " + flag);
  }
  ++*index;
  return argv[*index];
}

uint64_t ParseUnsigned(std::string_view text, std::string_view what) {
  if (text.empty()) {
    throw util::InvalidArgument("empty value for " + std::string(what));
  }

  uint64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw util::InvalidArgument("invalid number for " + std::string(what) + ": " + std::string(text));
    }
    const uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      throw util::InvalidArgument("number out of range for " + std::string(what) + ": " + std::string(text));
    }
    value = value * 10 + digit;
  }
  return value;
}

} // namespace

uint64_t ParseByteSize(std::string_view text) {
  uint64_t multiplier = 1;
  if (!text.empty()) {
    switch (text.back()) {
      case 'k':
      case 'K':
        multiplier = 1024ULL;
        break;
      case 'm':
      case 'M':
        multiplier = 1024ULL * 1024;
        break;
      case 'g':
      case 'G':
        multiplier = 1024ULL * 1024 * 1024;
        break;
      default:
        break;
    }
    if (multiplier != 1) {
      text.remove_suffix(1);
    }
  }

  const uint64_t value = ParseUnsigned(text, "byte size");
  if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
    throw util::InvalidArgument("byte size out of range");
  }
  return value * multiplier;
}

CommandLineOptions ParseCommandLine(int argc, const char* const argv[]) {
  CommandLineOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "-n" || arg == "--dry-run") {
      options.dry_run = true;
    } else if (arg == "--config") {
      options.config_path = RequireValue(argc, argv, &i);
    } else if (arg == "--progress") {
      options.progress = true;
    } else if (arg == "--rate-limit") {
      options.rate_limit_bytes_per_sec = ParseByteSize(RequireValue(argc, argv, &i));
    } else if (arg == "--buffer-size") {
      const auto value = RequireValue(argc, argv, &i);
      if (value == kOsDefaultBuffer) {
        options.buffer_size_bytes = 0;
      } else {
        const auto bytes = ParseByteSize(value);
        if (bytes < kMinimumBufferSizeBytes) {
          throw util::InvalidArgument("--buffer-size must be at least " + std::to_string(kMinimumBufferSizeBytes) +
                                      " bytes (or \"default\")");
        }
        options.buffer_size_bytes = bytes;
      }
    } else if (arg == "--compress") {
      options.compression = true;
    } else if (arg == "--cipher") {
      options.cipher = RequireValue(argc, argv, &i);
    } else if (arg == "--dedup") {
      options.dedup = true;
    } else if (arg == "--trust-unknown-host") {
      options.trust_unknown_host = true;
    } else if (arg == "--clear-obsolete") {
      options.clear_obsolete = true;
    } else if (arg == "--create-destination") {
      options.create_destination = true;
    } else if (arg == "--no-recursive-stream") {
      options.no_recursive_stream = true;
    } else if (arg == "--daily-only") {
      options.daily_only = true;
    } else if (arg == "--port") {
      const auto port = ParseUnsigned(RequireValue(argc, argv, &i), "--port");
      if (port == 0 || port > 65535) {
        throw util::InvalidArgument("--port out of range");
      }
      options.port = static_cast<uint32_t>(port);
    } else if (arg == "--lock-dir") {
      options.lock_dir = RequireValue(argc, argv, &i);
    } else if (arg == "--lock-comment") {
      options.lock_comment = RequireValue(argc, argv, &i);
    } else if (arg == "--extra-lock") {
      options.extra_lock = RequireValue(argc, argv, &i);
    } else if (!arg.empty() && arg[0] == '-') {
      throw util::InvalidArgument("unknown option: " + arg);
    } else if (!options.source) {
      options.source = arg;
    } else if (!options.destination) {
      options.destination = arg;
    } else {
      throw util::InvalidArgument("unexpected argument: " + arg);
    }
  }

  if (options.rate_limit_bytes_per_sec && !options.progress) {
    throw util::InvalidArgument("--rate-limit requires --progress");
  }

  return options;
}

void ApplyCommandLine(const CommandLineOptions& options, zreplicate::runtime::config::RuntimeConfig* config) {
  if (options.verbose) {
    config->mutable_logging()->set_level("debug");
  }

  auto* replication = config->mutable_replication();
  if (options.source) replication->set_source(*options.source);
  if (options.destination) replication->set_destination(*options.destination);
  if (options.dry_run) replication->set_dry_run(true);
  if (options.clear_obsolete) replication->set_clear_obsolete(true);
  if (options.create_destination) replication->set_create_destination(true);

  auto* transfer = config->mutable_transfer();
  if (options.progress) transfer->set_progress(true);
  if (options.dedup) transfer->set_dedup(true);
  if (options.no_recursive_stream) transfer->set_disable_recursive_stream(true);
  if (options.rate_limit_bytes_per_sec) transfer->set_rate_limit_bytes_per_sec(*options.rate_limit_bytes_per_sec);
  if (options.buffer_size_bytes) transfer->set_buffer_size_bytes(*options.buffer_size_bytes);

  auto* ssh = config->mutable_ssh();
  if (options.compression) ssh->set_compression(true);
  if (options.trust_unknown_host) ssh->set_trust_unknown_host(true);
  if (options.cipher) ssh->set_cipher(*options.cipher);
  if (options.port) ssh->set_port(*options.port);

  auto* lock = config->mutable_lock();
  if (options.lock_dir) lock->set_root_path(*options.lock_dir);
  if (options.lock_comment) lock->set_comment(*options.lock_comment);
  if (options.extra_lock) lock->set_extra_lock(*options.extra_lock);

  if (options.daily_only) config->mutable_retention()->set_daily_only(true);
}

std::string Usage() {
  return "Usage: zreplicate [options] <[[user@]host:]source> <[[user@]host:]destination>\n"
         "\n"
         "A ':' before the first '/' always ends the host part: pool:x names dataset x\n"
         "on host pool. A ':' after the first '/' belongs to the dataset name.\n"
         "\n"
         "  -v, --verbose             debug logging\n"
         "  -n, --dry-run             log the schedule without touching either host\n"
         "      --config <file>       YAML runtime configuration\n"
         "      --progress            show transfer progress\n"
         "      --rate-limit <bytes>  limit transfer rate (requires --progress)\n"
         "      --buffer-size <bytes> channel buffer, >= 16384 or \"default\"\n"
         "      --compress            force ssh compression\n"
         "      --cipher <name>       ssh cipher\n"
         "      --dedup               deduplicated send stream\n"
         "      --trust-unknown-host  accept unknown ssh host keys\n"
         "      --clear-obsolete      destroy destination datasets missing on the source\n"
         "      --create-destination  create the destination dataset if missing\n"
         "      --no-recursive-stream one transfer per dataset\n"
         "      --daily-only          collapse source history to one daily snapshot first\n"
         "      --port <n>            ssh port\n"
         "      --lock-dir <dir>      lock directory\n"
         "      --lock-comment <text> comment stored with the lock\n"
         "      --extra-lock <name>   additional lock to hold during the run\n";
}

} // namespace zreplicate::config
