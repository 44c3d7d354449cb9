#pragma once
#include <filesystem>
#include <string>

namespace remote
{

// Logical remote path of `item_parent_dir` below `tree_root`: "" for the root itself,
// otherwise components joined by '/'. Both paths absolute, parent under root.
std::string resolve_dest_path(const std::filesystem::path &item_parent_dir,
                              const std::filesystem::path &tree_root);

// Joins logical remote paths without leading, trailing or doubled '/'.
std::string join_remote(const std::string &a, const std::string &b);

}  // namespace remote
