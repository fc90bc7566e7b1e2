#pragma once

#include <cstdint>
#include <string>

namespace zreplicate::model {

/*
  Immutable point-in-time marker of one dataset.

  Snapshots of different datasets denote the same version point only when
  their names are equal.
*/
struct Snapshot {
  std::string name;
  // Host creation txg; strictly increasing along a dataset's history.
  uint64_t sequence = 0;
};

} // namespace zreplicate::model
