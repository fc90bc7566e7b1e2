#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace zreplicate::model {

/*
  Helpers for slash-delimited dataset paths ("pool/a/b").
*/

std::vector<std::string> SplitPath(std::string_view path);

// "pool/a" + "b" → "pool/a/b"; an empty relative path returns `base`.
std::string JoinPath(std::string_view base, std::string_view relative);

// True if `path` equals `ancestor` or lies below it.
bool IsSameOrDescendant(std::string_view path, std::string_view ancestor);

// "pool/a/b" relative to "pool" → "a/b". Throws std::invalid_argument if
// `path` is not under `root`.
std::string RelativeTo(std::string_view path, std::string_view root);

// Maps a source dataset onto the destination tree: strips `source_root` and
// appends the remainder to `destination_root`.
std::string InferDestinationPath(std::string_view source_path, std::string_view source_root, std::string_view destination_root);

} // namespace zreplicate::model
