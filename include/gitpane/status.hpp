#pragma once
#include "gitpane/change_tree.hpp"
#include "gitpane/worktree.hpp"

#include <vector>

namespace gitpane {

// Compare a recorded baseline (path -> blob id) with the working snapshot:
// changed content is 'M', baseline-only paths are 'D', working-only paths are '?'.
// Output is sorted by path.
auto compute_changes(const worktree::PathOidMap& baseline, const worktree::PathOidMap& working)
    -> std::vector<ChangedFile>;

} // namespace gitpane
