#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitpane::diff {

enum class LineKind : std::uint8_t { Add, Remove, Context, Header };

// One line of a diff in single-column form. `content` has the +/-/space marker stripped;
// header lines keep their full text.
struct UnifiedLine {
  std::string content;
  LineKind kind = LineKind::Context;
  std::optional<int> old_line; // Remove and Context
  std::optional<int> new_line; // Add and Context
};

// "@@ -old_start,old_count +new_start,new_count @@"; omitted counts are 1.
struct HunkRange {
  int old_start = 0;
  int old_count = 1;
  int new_start = 0;
  int new_count = 1;

  bool operator==(const HunkRange &) const = default;
};

// Parse a hunk header line. Trailing section text after the closing "@@" is allowed.
auto parse_hunk_header(std::string_view line) -> std::optional<HunkRange>;

enum class LineRole : std::uint8_t {
  FileHeader,      // "--- a/x" / "+++ b/x"
  HunkHeader,      // "@@ ... @@" that parsed
  Body,            // ' ', '+', '-' or empty line belonging to a hunk
  NoNewlineMarker, // "\ No newline at end of file"
  Malformed,       // unparsable hunk header and its body, or a line with no valid marker
};

// A raw diff line tagged with its role. Metadata lines ahead of a patch's first hunk
// ("diff --git", "index", mode and rename notices) never appear in scan output.
struct ScannedLine {
  LineRole role = LineRole::Malformed;
  std::string_view text;         // raw line, marker included
  std::size_t patch = 0;         // file patch ordinal
  std::size_t hunk = 0;          // hunk ordinal across the whole diff (0 before the first)
  std::optional<HunkRange> range; // HunkHeader only
};

// Split raw diff text into roles. Views point into `text`, which must outlive the result.
auto scan_diff(std::string_view text) -> std::vector<ScannedLine>;

// Body line helpers: marker character (' ' for an empty line) and the text after it.
auto body_marker(std::string_view line) -> char;
auto body_content(std::string_view line) -> std::string_view;

// Single-column view. Never throws on malformed input: bad lines degrade to Context
// lines without numbers.
auto parse_unified(std::string_view text) -> std::vector<UnifiedLine>;

} // namespace gitpane::diff
