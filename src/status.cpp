#include "gitpane/status.hpp"

#include <set>

namespace gitpane {

std::vector<ChangedFile> compute_changes(const worktree::PathOidMap &baseline,
                                         const worktree::PathOidMap &working) {
  std::set<std::string> all;
  for (const auto &[p, _] : baseline)
    all.insert(p);
  for (const auto &[p, _] : working)
    all.insert(p);

  std::vector<ChangedFile> out;
  for (const auto &path : all) {
    const auto it_b = baseline.find(path);
    const auto it_w = working.find(path);
    const bool in_b = it_b != baseline.end();
    const bool in_w = it_w != working.end();
    if (in_b && in_w) {
      if (it_b->second != it_w->second)
        out.push_back(make_changed_file(path, 'M'));
    } else if (in_b) {
      out.push_back(make_changed_file(path, 'D'));
    } else {
      out.push_back(make_changed_file(path, '?'));
    }
  }
  return out;
}

} // namespace gitpane
