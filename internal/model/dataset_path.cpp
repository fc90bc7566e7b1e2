#include "dataset_path.hpp"

#include <stdexcept>

namespace zreplicate::model {

std::vector<std::string> SplitPath(std::string_view path) {
  std::vector<std::string> components;
  while (!path.empty()) {
    const auto slash = path.find('/');
    const auto part  = path.substr(0, slash);
    if (!part.empty()) {
      components.emplace_back(part);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slash + 1);
  }
  return components;
}

std::string JoinPath(std::string_view base, std::string_view relative) {
  if (relative.empty()) {
    return std::string(base);
  }
  if (base.empty()) {
    return std::string(relative);
  }
  std::string joined(base);
  joined.push_back('/');
  joined.append(relative);
  return joined;
}

bool IsSameOrDescendant(std::string_view path, std::string_view ancestor) {
  if (path.size() < ancestor.size() || path.substr(0, ancestor.size()) != ancestor) {
    return false;
  }
  return path.size() == ancestor.size() || path[ancestor.size()] == '/';
}

std::string RelativeTo(std::string_view path, std::string_view root) {
  if (!IsSameOrDescendant(path, root)) {
    throw std::invalid_argument(std::string(path) + " is not under " + std::string(root));
  }
  if (path.size() == root.size()) {
    return {};
  }
  return std::string(path.substr(root.size() + 1));
}

std::string InferDestinationPath(std::string_view source_path, std::string_view source_root, std::string_view destination_root) {
  return JoinPath(destination_root, RelativeTo(source_path, source_root));
}

} // namespace zreplicate::model
