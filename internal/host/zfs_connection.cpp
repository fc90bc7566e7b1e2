#include "zfs_connection.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace zreplicate::host {

namespace {

// ssh reserves exit status 255 for its own failures.
constexpr int kSshFailureExitCode = 255;

bool Contains(const std::string& haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string FirstLine(const std::string& text) {
  const auto end = text.find('\n');
  return end == std::string::npos ? text : text.substr(0, end);
}

} // namespace

ZfsConnection::ZfsConnection(HostEndpoint endpoint, SshOptions ssh, process::CommandRunnerPtr runner, std::string zfs_command)
    : endpoint_(std::move(endpoint)), ssh_(std::move(ssh)), runner_(std::move(runner)), zfs_command_(std::move(zfs_command)) {
  if (!runner_) {
    throw std::invalid_argument("ZfsConnection requires a command runner");
  }
}

std::string ZfsConnection::Describe() const {
  return endpoint_.IsLocal() ? "localhost" : endpoint_.Destination();
}

bool ZfsConnection::IsLocal() const {
  return endpoint_.IsLocal();
}

// ------------------------------------------------------------
// Command construction
// ------------------------------------------------------------

process::Command ZfsConnection::Zfs(std::vector<std::string> args) const {
  process::Command command;
  command.argv.reserve(args.size() + 1);
  command.argv.push_back(zfs_command_);
  for (auto& arg : args) {
    command.argv.push_back(std::move(arg));
  }
  return Wrap(std::move(command));
}

process::Command ZfsConnection::Wrap(process::Command command) const {
  if (endpoint_.IsLocal()) {
    return command;
  }

  process::Command ssh;
  ssh.argv = {ssh_.ssh_command, "-o", "BatchMode=yes"};
  if (ssh_.trust_unknown_host) {
    ssh.argv.insert(ssh.argv.end(), {"-o", "StrictHostKeyChecking=no", "-o", "UserKnownHostsFile=/dev/null"});
  }
  if (ssh_.connect_timeout_sec > 0) {
    ssh.argv.insert(ssh.argv.end(), {"-o", "ConnectTimeout=" + std::to_string(ssh_.connect_timeout_sec)});
  }
  if (ssh_.port > 0) {
    ssh.argv.insert(ssh.argv.end(), {"-p", std::to_string(ssh_.port)});
  }
  if (!ssh_.cipher.empty()) {
    ssh.argv.insert(ssh.argv.end(), {"-c", ssh_.cipher});
  }
  if (ssh_.compression) {
    ssh.argv.push_back("-C");
  }
  if (!ssh_.identity_file.empty()) {
    ssh.argv.insert(ssh.argv.end(), {"-i", ssh_.identity_file});
  }
  ssh.argv.push_back(endpoint_.Destination());
  ssh.argv.push_back("--");
  ssh.argv.push_back(command.ToString());
  return ssh;
}

process::Command ZfsConnection::SendCommand(const SendRequest& request) const {
  std::vector<std::string> args{"send"};
  if (request.recursive) {
    args.push_back("-R");
  }
  if (request.dedup) {
    args.push_back("-D");
  }
  if (request.base) {
    // -I carries every intermediate snapshot in the same stream.
    args.push_back("-I");
    args.push_back(request.dataset + "@" + *request.base);
  }
  args.push_back(request.dataset + "@" + request.target);
  return Zfs(std::move(args));
}

process::Command ZfsConnection::ReceiveCommand(const std::string& path, bool force) const {
  std::vector<std::string> args{"receive"};
  if (force) {
    args.push_back("-F");
  }
  args.push_back(path);
  return Zfs(std::move(args));
}

// ------------------------------------------------------------
// Primitive operations
// ------------------------------------------------------------

process::CommandResult ZfsConnection::RunChecked(const process::Command& command, std::string_view action, const std::string& subject) {
  process::CommandResult result;
  try {
    result = runner_->Run(command);
  } catch (const std::system_error& e) {
    throw util::ConnectionError("cannot " + std::string(action) + " " + subject + " on " + Describe() + ": " + e.what());
  }

  if (result.Ok()) {
    return result;
  }

  const std::string message = "cannot " + std::string(action) + " " + subject + " on " + Describe() + ": " +
                              (result.err.empty() ? "exit status " + std::to_string(result.exit_code) : FirstLine(result.err));

  if (result.exit_code == process::kExecFailedExitCode || (!IsLocal() && result.exit_code == kSshFailureExitCode)) {
    throw util::ConnectionError(message);
  }
  if (Contains(result.err, "does not exist")) {
    throw util::NotFound(message);
  }
  if (Contains(result.err, "already exists")) {
    throw util::AlreadyExists(message);
  }
  if (Contains(result.err, "busy")) {
    throw util::Busy(message);
  }
  throw util::RemoteError(message);
}

std::vector<ListingEntry> ZfsConnection::Enumerate(const std::string& root) {
  const auto command =
      Zfs({"list", "-H", "-p", "-r", "-t", "filesystem,volume,snapshot", "-o", "name,createtxg", "-s", "createtxg", root});
  const auto result = RunChecked(command, "enumerate", root);
  return ParseListing(result.out);
}

void ZfsConnection::CreateDataset(const std::string& path, bool create_parents) {
  std::vector<std::string> args{"create"};
  if (create_parents) {
    args.push_back("-p");
  }
  args.push_back(path);
  RunChecked(Zfs(std::move(args)), "create", path);
  ZREPLICATE_LOG_INFO("created dataset", {observability::StringField("host", Describe()), observability::StringField("dataset", path)});
}

void ZfsConnection::DestroyDataset(const std::string& path) {
  RunChecked(Zfs({"destroy", path}), "destroy", path);
  ZREPLICATE_LOG_INFO("destroyed dataset", {observability::StringField("host", Describe()), observability::StringField("dataset", path)});
}

void ZfsConnection::DestroyRecursively(const std::string& path) {
  RunChecked(Zfs({"destroy", "-r", path}), "destroy", path);
  ZREPLICATE_LOG_INFO("destroyed dataset tree",
                      {observability::StringField("host", Describe()), observability::StringField("dataset", path)});
}

void ZfsConnection::DestroySnapshot(const std::string& dataset, const std::string& snapshot) {
  const auto name = dataset + "@" + snapshot;
  RunChecked(Zfs({"destroy", name}), "destroy", name);
}

std::vector<ListingEntry> ZfsConnection::ParseListing(std::string_view output) {
  std::vector<ListingEntry> entries;

  while (!output.empty()) {
    const auto end  = output.find('\n');
    auto       line = output.substr(0, end);
    output          = end == std::string_view::npos ? std::string_view{} : output.substr(end + 1);

    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      continue;
    }

    const auto tab = line.find('\t');
    if (tab == std::string_view::npos) {
      throw util::RemoteError("malformed listing line: " + std::string(line));
    }
    const auto name = line.substr(0, tab);
    const auto txg  = line.substr(tab + 1);

    ListingEntry entry;
    const auto [ptr, ec] = std::from_chars(txg.data(), txg.data() + txg.size(), entry.create_txg);
    if (ec != std::errc() || ptr != txg.data() + txg.size()) {
      throw util::RemoteError("malformed createtxg in listing line: " + std::string(line));
    }

    const auto at = name.find('@');
    if (at == std::string_view::npos) {
      entry.kind    = EntryKind::kDataset;
      entry.dataset = std::string(name);
    } else {
      entry.kind     = EntryKind::kSnapshot;
      entry.dataset  = std::string(name.substr(0, at));
      entry.snapshot = std::string(name.substr(at + 1));
    }
    entries.push_back(std::move(entry));
  }

  return entries;
}

} // namespace zreplicate::host
