#include "schedule_optimizer.hpp"

#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/dataset_path.hpp"
#include "internal/observability/logging.hpp"

namespace zreplicate::plan {

using model::DatasetIndex;

ScheduleOptimizer::ScheduleOptimizer(const model::DatasetTree& source, std::string destination_root)
    : source_(source), destination_root_(std::move(destination_root)) {
}

OptimizedSchedule ScheduleOptimizer::Optimize(const OperationSchedule& schedule, bool allow_recursivize) const {
  std::unordered_map<std::string, const Replicate*> replicate_by_source;
  std::unordered_set<std::string>                   stub_paths;
  for (const auto& operation : schedule) {
    if (const auto* replicate = std::get_if<Replicate>(&operation)) {
      replicate_by_source.emplace(replicate->source_path, replicate);
    } else if (const auto* stub = std::get_if<CreateStub>(&operation)) {
      stub_paths.insert(stub->path);
    }
  }

  auto destination_of = [&](const Replicate& op) {
    return op.destination_path.value_or(model::InferDestinationPath(op.source_path, source_.RootPath(), destination_root_));
  };

  // uniform[i]: dataset i and its whole subtree carry identical, non-stub
  // replicates. Children come after parents in pre-order, so walk it backwards.
  std::vector<bool> uniform(source_.Size(), false);
  if (allow_recursivize) {
    const auto order = source_.PreOrder();
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
      const auto& dataset = source_.At(*it);

      const auto found = replicate_by_source.find(dataset.path);
      if (found == replicate_by_source.end()) {
        continue;
      }
      const Replicate& op = *found->second;
      if (!op.destination_path || op.into_stub || stub_paths.count(destination_of(op)) != 0) {
        continue;
      }

      bool same = true;
      for (const auto& [name, child] : dataset.children) {
        const auto child_op = replicate_by_source.find(source_.At(child).path);
        if (!uniform[child] || child_op == replicate_by_source.end() || child_op->second->base != op.base ||
            child_op->second->target != op.target) {
          same = false;
          break;
        }
      }
      uniform[*it] = same;
    }
  }

  OptimizedSchedule optimized;
  std::size_t       merged = 0;

  for (const auto& operation : schedule) {
    std::visit(Overloaded{
                   [&](const CreateStub& op) { optimized.push_back(op); },
                   [&](const Destroy& op) { optimized.push_back(op); },
                   [&](const DestroyRecursively& op) { optimized.push_back(op); },
                   [&](const Replicate& op) {
                     const auto index = source_.Find(op.source_path);

                     if (index) {
                       const auto& dataset = source_.At(*index);
                       if (dataset.parent && uniform[*dataset.parent]) {
                         ++merged;
                         return;
                       }
                       if (uniform[*index] && !dataset.children.empty()) {
                         optimized.push_back(ReplicateRecursive{op.source_path, destination_of(op), op.base, op.target});
                         return;
                       }
                     }

                     if (op.recursive) {
                       optimized.push_back(ReplicateRecursive{op.source_path, destination_of(op), op.base, op.target});
                       return;
                     }
                     optimized.push_back(ReplicateSingle{op.source_path, destination_of(op), op.base, op.target, op.into_stub});
                   },
               },
               operation);
  }

  ZREPLICATE_LOG_DEBUG("optimized schedule", {observability::IntField("operations", static_cast<int64_t>(schedule.size())),
                                              observability::IntField("steps", static_cast<int64_t>(optimized.size())),
                                              observability::IntField("merged", static_cast<int64_t>(merged))});
  return optimized;
}

} // namespace zreplicate::plan
