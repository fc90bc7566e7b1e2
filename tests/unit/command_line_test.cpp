#include "internal/config/command_line.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using zreplicate::config::CommandLineOptions;
using zreplicate::config::ParseCommandLine;

CommandLineOptions Parse(std::vector<const char*> args) {
  args.insert(args.begin(), "zreplicate");
  return ParseCommandLine(static_cast<int>(args.size()), args.data());
}

bool Rejects(std::vector<const char*> args) {
  try {
    (void)Parse(std::move(args));
  } catch (const zreplicate::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestByteSizes() {
  using zreplicate::config::ParseByteSize;
  assert(ParseByteSize("16384") == 16384);
  assert(ParseByteSize("64K") == 65536);
  assert(ParseByteSize("2m") == 2097152);
  assert(ParseByteSize("1G") == 1073741824ULL);
}

void TestPositionalsAndFlags() {
  const auto options = Parse({"-v", "--dry-run", "--clear-obsolete", "--cipher", "aes128-ctr", "--port", "2222", "tank",
                              "root@nas:backup/tank", "--no-recursive-stream"});
  assert(options.verbose);
  assert(options.dry_run);
  assert(options.clear_obsolete);
  assert(options.no_recursive_stream);
  assert(*options.cipher == "aes128-ctr");
  assert(*options.port == 2222);
  assert(*options.source == "tank");
  assert(*options.destination == "root@nas:backup/tank");
  assert(!options.progress);
}

void TestBufferSize() {
  assert(*Parse({"--buffer-size", "default"}).buffer_size_bytes == 0);
  assert(*Parse({"--buffer-size", "16K"}).buffer_size_bytes == 16384);
  assert(Rejects({"--buffer-size", "16383"}));
  assert(Rejects({"--buffer-size"}));
}

void TestRateLimitNeedsProgress() {
  assert(Rejects({"--rate-limit", "1M", "a", "b"}));
  const auto options = Parse({"--rate-limit", "1M", "--progress", "a", "b"});
  assert(*options.rate_limit_bytes_per_sec == 1048576);
}

void TestBadInput() {
  assert(Rejects({"--no-such-flag"}));
  assert(Rejects({"a", "b", "c"}));
  assert(Rejects({"--port", "70000"}));
  assert(Rejects({"--port", "22x"}));
}

void TestUsageExplainsHostSeparator() {
  const auto usage = zreplicate::config::Usage();
  assert(usage.find("[[user@]host:]source") != std::string::npos);
  assert(usage.find("pool:x") != std::string::npos);
}

void TestFlagsOverrideConfig() {
  zreplicate::runtime::config::RuntimeConfig config;
  config.mutable_replication()->set_source("from-file");
  config.mutable_transfer()->set_buffer_size_bytes(1 << 20);
  config.mutable_ssh()->set_port(22);

  zreplicate::config::ApplyCommandLine(Parse({"--buffer-size", "default", "--dedup", "-v", "tank", "backup"}), &config);

  assert(config.replication().source() == "tank");
  assert(config.replication().destination() == "backup");
  assert(config.transfer().buffer_size_bytes() == 0);
  assert(config.transfer().dedup());
  assert(config.logging().level() == "debug");
  assert(config.ssh().port() == 22);
}

} // namespace

int main() {
  TestByteSizes();
  TestPositionalsAndFlags();
  TestBufferSize();
  TestRateLimitNeedsProgress();
  TestBadInput();
  TestFlagsOverrideConfig();
  TestUsageExplainsHostSeparator();

  std::cout << "zreplicate_unit_command_line: pass\n";
  return 0;
}
