#include <iostream>
#include <string>

#include "internal/config/command_line.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace {

constexpr int kExitUsage       = 1;
constexpr int kExitFailure     = 2;
constexpr int kExitLockSkipped = 3;

void Shutdown() {
  zreplicate::observability::ShutdownTracing();
  zreplicate::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  zreplicate::runtime::config::RuntimeConfig config;

  // ------------------------------------------------------------
  // Command line and configuration
  // ------------------------------------------------------------
  try {
    const auto options = zreplicate::config::ParseCommandLine(argc, argv);
    if (options.help) {
      std::cout << zreplicate::config::Usage();
      return 0;
    }
    if (options.config_path) {
      config = zreplicate::config::ConfigLoader::LoadFromYaml(*options.config_path);
    }
    zreplicate::config::ApplyCommandLine(options, &config);
    zreplicate::config::ValidateConfig(config);

    if (config.replication().source().empty() || config.replication().destination().empty()) {
      throw zreplicate::util::InvalidArgument("source and destination are required");
    }
  } catch (const std::exception& e) {
    std::cerr << "zreplicate: " << e.what() << "\n\n" << zreplicate::config::Usage();
    return kExitUsage;
  }

  zreplicate::observability::InitializeLogging(config);
  zreplicate::observability::InitializeTracing(config);

  // ------------------------------------------------------------
  // Run
  // ------------------------------------------------------------
  int exit_code = 0;
  try {
    auto app = zreplicate::factory::Build(config);
    app.job->Run();
  } catch (const zreplicate::util::LockUnavailable& e) {
    ZREPLICATE_LOG_WARN("skipping run", {zreplicate::observability::StringField("reason", e.what())});
    exit_code = kExitLockSkipped;
  } catch (const std::invalid_argument& e) {
    ZREPLICATE_LOG_ERROR("invalid arguments", {zreplicate::observability::StringField("error", e.what())});
    exit_code = kExitUsage;
  } catch (const std::exception& e) {
    ZREPLICATE_LOG_ERROR("replication failed", {zreplicate::observability::StringField("error", e.what())});
    exit_code = kExitFailure;
  }

  Shutdown();
  return exit_code;
}
