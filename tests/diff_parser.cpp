#include "gitpane/diff_parser.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using gitpane::diff::LineKind;
using gitpane::diff::parse_unified;

static int failures = 0;

static void expect(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

static void check_line(const gitpane::diff::UnifiedLine &ul, LineKind kind,
                       const std::string &content, std::optional<int> old_line,
                       std::optional<int> new_line, const std::string &what) {
  expect(ul.kind == kind, what + ": kind");
  expect(ul.content == content, what + ": content '" + ul.content + "'");
  expect(ul.old_line == old_line, what + ": old line");
  expect(ul.new_line == new_line, what + ": new line");
}

int main() {
  // metadata ahead of the first hunk is dropped, headers are kept
  {
    const std::string text = "diff --git a/f.txt b/f.txt\n"
                             "index 1234567..89abcde 100644\n"
                             "--- a/f.txt\n"
                             "+++ b/f.txt\n"
                             "@@ -1,3 +1,4 @@\n"
                             " ctx\n"
                             "-old\n"
                             "+new1\n"
                             "+new2\n"
                             " tail\n";
    const auto lines = parse_unified(text);
    expect(lines.size() == 8, "basic: 8 lines, got " + std::to_string(lines.size()));
    if (lines.size() == 8) {
      check_line(lines[0], LineKind::Header, "--- a/f.txt", std::nullopt, std::nullopt, "---");
      check_line(lines[1], LineKind::Header, "+++ b/f.txt", std::nullopt, std::nullopt, "+++");
      check_line(lines[2], LineKind::Header, "@@ -1,3 +1,4 @@", std::nullopt, std::nullopt, "@@");
      check_line(lines[3], LineKind::Context, "ctx", 1, 1, "ctx");
      check_line(lines[4], LineKind::Remove, "old", 2, std::nullopt, "old");
      check_line(lines[5], LineKind::Add, "new1", std::nullopt, 2, "new1");
      check_line(lines[6], LineKind::Add, "new2", std::nullopt, 3, "new2");
      check_line(lines[7], LineKind::Context, "tail", 3, 4, "tail");
    }
  }

  // counters reset per hunk and are strictly increasing inside one
  {
    const std::string text = "--- a/x\n+++ b/x\n"
                             "@@ -2,3 +2,2 @@\n a\n-b\n c\n"
                             "@@ -20 +19,3 @@\n-t\n+u\n+v\n+w\n";
    const auto lines = parse_unified(text);
    int last_old = 0;
    int last_new = 0;
    for (const auto &ul : lines) {
      if (ul.kind == LineKind::Header && ul.content.starts_with("@@")) {
        last_old = 0;
        last_new = 0;
        continue;
      }
      if (ul.old_line) {
        expect(*ul.old_line > last_old, "old counter monotonic at '" + ul.content + "'");
        last_old = *ul.old_line;
      }
      if (ul.new_line) {
        expect(*ul.new_line > last_new, "new counter monotonic at '" + ul.content + "'");
        last_new = *ul.new_line;
      }
    }
    expect(lines.size() == 11, "two hunks: 11 lines");
    if (lines.size() == 11) {
      check_line(lines[3], LineKind::Context, "a", 2, 2, "hunk1 a");
      check_line(lines[6], LineKind::Header, "@@ -20 +19,3 @@", std::nullopt, std::nullopt, "h2");
      check_line(lines[7], LineKind::Remove, "t", 20, std::nullopt, "hunk2 t");
      check_line(lines[8], LineKind::Add, "u", std::nullopt, 19, "hunk2 u");
      check_line(lines[10], LineKind::Add, "w", std::nullopt, 21, "hunk2 w");
    }
  }

  // an unparsable hunk header degrades to a numberless context line
  {
    const auto lines = parse_unified("@@ garbage @@\n@@ -1 +1 @@\n-a\n+b\n");
    expect(lines.size() == 4, "malformed: 4 lines");
    if (lines.size() == 4) {
      check_line(lines[0], LineKind::Context, "@@ garbage @@", std::nullopt, std::nullopt,
                 "malformed header");
      check_line(lines[2], LineKind::Remove, "a", 1, std::nullopt, "after malformed");
    }
  }

  // the body under an unparsable header is kept as numberless context
  {
    const auto lines = parse_unified("--- a/f\n+++ b/f\n@@ bogus @@\n ctx\n-old\n+new\n");
    expect(lines.size() == 6, "degraded body kept: got " + std::to_string(lines.size()));
    if (lines.size() == 6) {
      check_line(lines[3], LineKind::Context, " ctx", std::nullopt, std::nullopt, "degraded ctx");
      check_line(lines[4], LineKind::Context, "-old", std::nullopt, std::nullopt, "degraded old");
      check_line(lines[5], LineKind::Context, "+new", std::nullopt, std::nullopt, "degraded new");
    }
  }

  // a bad header after a finished hunk does not continue that hunk's counters
  {
    const auto lines = parse_unified("@@ -1 +1 @@\n-a\n+b\n@@ -x +y @@\n-c\n+d\n@@ -9 +9 @@\n-e\n+f\n");
    expect(lines.size() == 9, "bad second header: 9 lines");
    if (lines.size() == 9) {
      check_line(lines[4], LineKind::Context, "-c", std::nullopt, std::nullopt, "no numbers for -c");
      check_line(lines[5], LineKind::Context, "+d", std::nullopt, std::nullopt, "no numbers for +d");
      check_line(lines[7], LineKind::Remove, "e", 9, std::nullopt, "next valid hunk");
      check_line(lines[8], LineKind::Add, "f", std::nullopt, 9, "next valid hunk add");
    }
  }

  // "---" inside a hunk that still expects removals is a removed line
  {
    const auto lines = parse_unified("--- a/m\n+++ b/m\n@@ -1,2 +1,1 @@\n--- rule\n keep\n");
    expect(lines.size() == 5, "dash body: 5 lines");
    if (lines.size() == 5)
      check_line(lines[3], LineKind::Remove, "-- rule", 1, std::nullopt, "dash body");
  }

  // no-newline markers carry no numbers and do not advance the counters
  {
    const auto lines =
        parse_unified("@@ -1,2 +1,2 @@\n a\n-b\n\\ No newline at end of file\n+B\n"
                      "\\ No newline at end of file\n");
    expect(lines.size() == 6, "no newline: 6 lines");
    if (lines.size() == 6) {
      check_line(lines[3], LineKind::Context, "\\ No newline at end of file", std::nullopt,
                 std::nullopt, "marker");
      check_line(lines[4], LineKind::Add, "B", std::nullopt, 2, "after marker");
    }
  }

  expect(parse_unified("").empty(), "empty input");

  {
    const auto r = gitpane::diff::parse_hunk_header("@@ -5 +7,0 @@ fn()");
    expect(r && r->old_start == 5 && r->old_count == 1 && r->new_start == 7 && r->new_count == 0,
           "hunk header with omitted count and section text");
    expect(!gitpane::diff::parse_hunk_header("@@ -x +1 @@"), "bad hunk header");
  }

  if (failures)
    return 1;
  std::cout << "OK\n";
  return 0;
}
