#pragma once
#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace gitpane::worktree {

using PathOidMap = std::map<std::string, std::string>; // path -> 40-hex blob id

// Enumerate regular files under root, excluding the .gitpane directory, as repo-relative
// slash-separated paths
void enumerate_paths(const std::filesystem::path& root, std::set<std::string>& out_paths);

// Build path->hex map for working directory contents
auto build_working_map(const std::filesystem::path& root) -> PathOidMap;

// Resolve a repo-relative path under root; throws if it is absolute or escapes root.
auto resolve(const std::filesystem::path& root, std::string_view rel) -> std::filesystem::path;

} // namespace gitpane::worktree
