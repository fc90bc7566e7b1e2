#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace zreplicate::plan {

/*
  Operations produced by the diff planner.

  Closed sum types: consumers std::visit them exhaustively.
*/

// Create an empty destination dataset so data can be received into it or
// below it.
struct CreateStub {
  std::string path;

  bool operator==(const CreateStub&) const = default;
};

// Bring the destination from `base` (absent → full send) up to `target`.
// `destination_path` absent → inferred from the source path (newly stubbed
// subtrees). `into_stub` marks a full send landing in an empty dataset.
struct Replicate {
  std::string                source_path;
  std::optional<std::string> destination_path;
  std::optional<std::string> base;
  std::string                target;
  bool                       recursive = false;
  bool                       into_stub = false;

  bool operator==(const Replicate&) const = default;
};

// Remove one destination dataset that has no source counterpart.
struct Destroy {
  std::string path;

  bool operator==(const Destroy&) const = default;
};

// Remove a destination subtree whose root has no source counterpart.
struct DestroyRecursively {
  std::string path;

  bool operator==(const DestroyRecursively&) const = default;
};

using Operation         = std::variant<CreateStub, Replicate, Destroy, DestroyRecursively>;
using OperationSchedule = std::vector<Operation>;

/*
  Transfer steps produced by the schedule optimizer.

  Destination paths are always concrete here.
*/

struct ReplicateSingle {
  std::string                source_path;
  std::string                destination_path;
  std::optional<std::string> base;
  std::string                target;
  bool                       into_stub = false;

  bool operator==(const ReplicateSingle&) const = default;
};

// One stream carrying the whole source subtree rooted at `source_path`.
struct ReplicateRecursive {
  std::string                source_path;
  std::string                destination_path;
  std::optional<std::string> base;
  std::string                target;

  bool operator==(const ReplicateRecursive&) const = default;
};

using TransferStep      = std::variant<CreateStub, ReplicateSingle, ReplicateRecursive, Destroy, DestroyRecursively>;
using OptimizedSchedule = std::vector<TransferStep>;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// One-line human readable rendering, used for logs and dry runs.
std::string Describe(const Operation& operation);
std::string Describe(const TransferStep& step);

} // namespace zreplicate::plan
