#include "gitpane/side_by_side.hpp"

#include <algorithm>
#include <iostream>
#include <string>

using gitpane::diff::pair_side_by_side;
using gitpane::diff::RowKind;

static int failures = 0;

static void expect(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

int main() {
  // ctx / old -> new1 / +new2
  {
    const auto rows = pair_side_by_side("@@ -1,2 +1,3 @@\n ctx\n-old\n+new1\n+new2\n");
    expect(rows.size() == 3, "example: 3 rows");
    if (rows.size() == 3) {
      expect(rows[0].kind == RowKind::Unchanged && rows[0].left == "ctx" &&
                 rows[0].right == "ctx" && rows[0].left_line == 1 && rows[0].right_line == 1,
             "row 0 unchanged");
      expect(rows[1].kind == RowKind::Modified && rows[1].left == "old" &&
                 rows[1].right == "new1" && rows[1].left_line == 2 && rows[1].right_line == 2,
             "row 1 modified");
      expect(rows[2].kind == RowKind::Added && rows[2].left.empty() && !rows[2].left_line &&
                 rows[2].right == "new2" && rows[2].right_line == 3,
             "row 2 added");
    }
  }

  // m removals against n additions: max(m, n) rows, min(m, n) of them modified
  for (int m = 0; m <= 4; ++m) {
    for (int n = 0; n <= 4; ++n) {
      if (m == 0 && n == 0)
        continue;
      std::string text = "@@ -1," + std::to_string(m) + " +1," + std::to_string(n) + " @@\n";
      for (int i = 0; i < m; ++i)
        text += "-r" + std::to_string(i) + "\n";
      for (int i = 0; i < n; ++i)
        text += "+a" + std::to_string(i) + "\n";
      const auto rows = pair_side_by_side(text);
      const auto modified = std::ranges::count_if(
          rows, [](const auto &r) { return r.kind == RowKind::Modified; });
      const std::string tag = "m=" + std::to_string(m) + " n=" + std::to_string(n);
      expect(rows.size() == static_cast<std::size_t>(std::max(m, n)), tag + ": row count");
      expect(modified == std::min(m, n), tag + ": modified count");
    }
  }

  // a deletion-only hunk starting at 0 on the new side
  {
    const auto rows = pair_side_by_side("--- a/f\n+++ /dev/null\n@@ -1,2 +0,0 @@\n-x\n-y\n");
    expect(rows.size() == 2, "delete: 2 rows");
    if (rows.size() == 2) {
      expect(rows[0].kind == RowKind::Removed && rows[0].left_line == 1 && !rows[0].right_line,
             "delete row 0");
      expect(rows[1].kind == RowKind::Removed && rows[1].left_line == 2, "delete row 1");
    }
  }

  // a no-newline marker ends the removal run, so the last line shows as removed + added
  {
    const auto rows = pair_side_by_side(
        "@@ -1,2 +1,2 @@\n a\n-b\n\\ No newline at end of file\n+B\n"
        "\\ No newline at end of file\n");
    expect(rows.size() == 3, "marker: 3 rows, got " + std::to_string(rows.size()));
    if (rows.size() == 3) {
      expect(rows[1].kind == RowKind::Removed && rows[1].left == "b" && rows[1].left_line == 2 &&
                 !rows[1].right_line,
             "marker: removal row");
      expect(rows[2].kind == RowKind::Added && rows[2].right == "B" && rows[2].right_line == 2 &&
                 !rows[2].left_line,
             "marker: addition row");
    }
  }

  // nothing under an unparsable header is paired
  {
    const auto rows = pair_side_by_side("@@ -1 +1 @@\n-a\n+b\n@@ bad @@\n-c\n+d\n");
    expect(rows.size() == 1 && rows[0].kind == RowKind::Modified && rows[0].right == "b",
           "degraded hunk skipped");
  }

  // each file patch gets its own counters
  {
    const auto rows = pair_side_by_side("diff --git a/p b/p\n--- a/p\n+++ b/p\n@@ -3 +3 @@\n-p\n+P\n"
                                        "diff --git a/q b/q\n--- a/q\n+++ b/q\n@@ -9 +9,2 @@\n q\n+Q\n");
    expect(rows.size() == 3, "two files: 3 rows");
    if (rows.size() == 3) {
      expect(rows[0].left_line == 3 && rows[0].right_line == 3, "file p numbering");
      expect(rows[1].left_line == 9 && rows[1].right_line == 9, "file q context");
      expect(rows[2].right_line == 10 && rows[2].kind == RowKind::Added, "file q added");
    }
  }

  expect(pair_side_by_side("").empty(), "empty input");

  if (failures)
    return 1;
  std::cout << "OK\n";
  return 0;
}
