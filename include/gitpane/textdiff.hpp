#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitpane::diff {

struct Labels {
  std::string old_label = "a/file"; // "/dev/null" for an added file
  std::string new_label = "b/file"; // "/dev/null" for a deleted file
};

// Unified diff of two texts with `context` lines around each change, in the layout
// `git diff` prints ("---"/"+++" headers, "@@ -s,c +s,c @@" hunks, "\ No newline at end of
// file" markers). Returns "" when the texts are identical.
std::string unified_diff(std::string_view old_text, std::string_view new_text,
                         const Labels& labels, int context = 3);

// Split text into lines without their terminators ("a\nb\n" -> {"a", "b"}).
std::vector<std::string> split_lines(std::string_view text);

} // namespace gitpane::diff
