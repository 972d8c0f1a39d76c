#include "gitpane/side_by_side.hpp"

#include "gitpane/consts.hpp"
#include "gitpane/diff_parser.hpp"

#include <algorithm>

namespace gitpane::diff {

namespace {

struct Hunk {
  std::size_t patch = 0;
  std::size_t index = 0;
  int left = 1;
  int right = 1;
  std::vector<std::string_view> lines; // body and no-newline lines, markers included
};

void pair_hunk(const Hunk &h, std::vector<DiffRow> &rows) {
  int left_n = h.left;
  int right_n = h.right;
  const auto &lines = h.lines;
  std::size_t i = 0;

  while (i < lines.size()) {
    const char m = body_marker(lines[i]);

    if (m == consts::kRemoveMarker) {
      struct Side {
        std::string_view text;
        int line;
      };
      std::vector<Side> removals;
      std::vector<Side> additions;
      std::size_t j = i;
      while (j < lines.size() && body_marker(lines[j]) == consts::kRemoveMarker) {
        removals.push_back({body_content(lines[j]), left_n++});
        ++j;
      }
      while (j < lines.size() && body_marker(lines[j]) == consts::kAddMarker) {
        additions.push_back({body_content(lines[j]), right_n++});
        ++j;
      }

      const std::size_t n = std::max(removals.size(), additions.size());
      for (std::size_t k = 0; k < n; ++k) {
        const bool has_left = k < removals.size();
        const bool has_right = k < additions.size();
        DiffRow row;
        if (has_left) {
          row.left = std::string(removals[k].text);
          row.left_line = removals[k].line;
        }
        if (has_right) {
          row.right = std::string(additions[k].text);
          row.right_line = additions[k].line;
        }
        row.kind = has_left && has_right ? RowKind::Modified
                   : has_left            ? RowKind::Removed
                                         : RowKind::Added;
        rows.push_back(std::move(row));
      }
      i = j;
    } else if (m == consts::kNoNewlineMarker) {
      // ends any run above it and has no row of its own
      ++i;
    } else if (m == consts::kAddMarker) {
      rows.push_back(DiffRow{.right = std::string(body_content(lines[i])),
                             .right_line = right_n++,
                             .kind = RowKind::Added});
      ++i;
    } else {
      const std::string content(body_content(lines[i]));
      rows.push_back(DiffRow{.left = content,
                             .right = content,
                             .left_line = left_n++,
                             .right_line = right_n++,
                             .kind = RowKind::Unchanged});
      ++i;
    }
  }
}

} // namespace

std::vector<DiffRow> pair_side_by_side(std::string_view text) {
  std::vector<DiffRow> rows;
  std::optional<Hunk> current;

  auto flush = [&] {
    if (current)
      pair_hunk(*current, rows);
    current.reset();
  };

  for (const auto &sl : scan_diff(text)) {
    if (current && (sl.patch != current->patch || sl.hunk != current->index))
      flush();

    switch (sl.role) {
    case LineRole::HunkHeader:
      flush();
      // counters are seeded per hunk; a zero start (empty side) is seeded as 1
      current = Hunk{.patch = sl.patch,
                     .index = sl.hunk,
                     .left = sl.range->old_start > 0 ? sl.range->old_start : 1,
                     .right = sl.range->new_start > 0 ? sl.range->new_start : 1};
      break;
    case LineRole::Body:
    case LineRole::NoNewlineMarker:
      if (current)
        current->lines.push_back(sl.text);
      break;
    case LineRole::Malformed:
      // an unparsable header closes the hunk above it
      if (sl.text.starts_with(consts::kHunkPrefix))
        flush();
      break;
    case LineRole::FileHeader:
      flush();
      break;
    }
  }
  flush();
  return rows;
}

} // namespace gitpane::diff
