#include "operation.hpp"

namespace zreplicate::plan {

namespace {

std::string Range(const std::optional<std::string>& base, const std::string& target) {
  return (base ? "@" + *base : std::string("(full)")) + " -> @" + target;
}

} // namespace

std::string Describe(const Operation& operation) {
  return std::visit(Overloaded{
                        [](const CreateStub& op) { return "create-stub " + op.path; },
                        [](const Replicate& op) {
                          return std::string(op.recursive ? "replicate-recursive " : "replicate ") + op.source_path + " " +
                                 Range(op.base, op.target) + " into " + op.destination_path.value_or("(inferred)");
                        },
                        [](const Destroy& op) { return "destroy " + op.path; },
                        [](const DestroyRecursively& op) { return "destroy-recursive " + op.path; },
                    },
                    operation);
}

std::string Describe(const TransferStep& step) {
  return std::visit(Overloaded{
                        [](const CreateStub& op) { return "create-stub " + op.path; },
                        [](const ReplicateSingle& op) {
                          return "replicate " + op.source_path + " " + Range(op.base, op.target) + " into " + op.destination_path;
                        },
                        [](const ReplicateRecursive& op) {
                          return "replicate-recursive " + op.source_path + " " + Range(op.base, op.target) + " into " +
                                 op.destination_path;
                        },
                        [](const Destroy& op) { return "destroy " + op.path; },
                        [](const DestroyRecursively& op) { return "destroy-recursive " + op.path; },
                    },
                    step);
}

} // namespace zreplicate::plan
