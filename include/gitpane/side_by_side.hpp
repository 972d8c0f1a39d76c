#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitpane::diff {

enum class RowKind : std::uint8_t { Added, Removed, Unchanged, Modified };

// One paired row of a side-by-side view: old content on the left, new on the right.
struct DiffRow {
  std::string left;
  std::string right;
  std::optional<int> left_line;
  std::optional<int> right_line;
  RowKind kind = RowKind::Unchanged;
};

// Pair a unified diff into rows, hunk by hunk. Within a hunk a run of removals is matched
// positionally against the run of additions that directly follows it: the first min(m, n)
// rows are Modified, the rest Removed or Added. There is no content-similarity matching.
auto pair_side_by_side(std::string_view text) -> std::vector<DiffRow>;

} // namespace gitpane::diff
