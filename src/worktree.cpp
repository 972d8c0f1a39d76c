#include "gitpane/worktree.hpp"

#include "gitpane/consts.hpp"
#include "gitpane/fs.hpp"
#include "gitpane/util.hpp"

#include <stdexcept>

namespace gitpane::worktree {

void enumerate_paths(const std::filesystem::path &root, std::set<std::string> &out_paths) {
  for (auto it = std::filesystem::recursive_directory_iterator(root);
       it != std::filesystem::recursive_directory_iterator(); ++it) {
    const auto &p = it->path();
    if (p.filename().generic_string() == consts::kStateDir) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file()) {
      continue;
    }
    out_paths.insert(std::filesystem::relative(p, root).generic_string());
  }
}

PathOidMap build_working_map(const std::filesystem::path &root) {
  PathOidMap m;
  std::set<std::string> paths;
  enumerate_paths(root, paths);
  for (const auto &rel : paths) {
    m[rel] = compute_blob_hex_oid(fs::read_file(root / rel));
  }
  return m;
}

std::filesystem::path resolve(const std::filesystem::path &root, std::string_view rel) {
  const std::filesystem::path p{rel};
  if (rel.empty() || p.is_absolute()) {
    throw std::runtime_error("worktree: invalid path '" + std::string(rel) + "'");
  }
  const auto normal = p.lexically_normal();
  const auto first = normal.begin();
  if (first == normal.end() || *first == ".." || first->generic_string() == consts::kStateDir) {
    throw std::runtime_error("worktree: path escapes the workspace: " + std::string(rel));
  }
  return root / normal;
}

} // namespace gitpane::worktree
