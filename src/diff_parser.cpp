#include "gitpane/diff_parser.hpp"

#include "gitpane/consts.hpp"
#include "gitpane/log.hpp"

#include <charconv>

namespace gitpane::diff {

namespace {

// Consume a run of digits from the front of `sv`.
bool take_number(std::string_view &sv, int &out) {
  const auto *end = sv.data() + sv.size();
  auto [ptr, ec] = std::from_chars(sv.data(), end, out);
  if (ec != std::errc{} || out < 0)
    return false;
  sv.remove_prefix(static_cast<std::size_t>(ptr - sv.data()));
  return true;
}

bool take_literal(std::string_view &sv, std::string_view lit) {
  if (!sv.starts_with(lit))
    return false;
  sv.remove_prefix(lit.size());
  return true;
}

// "<start>[,<count>]"
bool take_range(std::string_view &sv, int &start, int &count) {
  if (!take_number(sv, start))
    return false;
  count = 1;
  if (take_literal(sv, ","))
    return take_number(sv, count);
  return true;
}

bool is_file_header(std::string_view line) {
  return line.starts_with(consts::kOldFilePrefix) || line.starts_with(consts::kNewFilePrefix);
}

// Degraded: after an unparsable hunk header, until the next valid header or patch
enum class ScanState : std::uint8_t { Preamble, InHunk, AfterHunk, Degraded };

} // namespace

std::optional<HunkRange> parse_hunk_header(std::string_view line) {
  HunkRange r{};
  if (!take_literal(line, "@@ -") || !take_range(line, r.old_start, r.old_count))
    return std::nullopt;
  if (!take_literal(line, " +") || !take_range(line, r.new_start, r.new_count))
    return std::nullopt;
  if (!take_literal(line, " @@"))
    return std::nullopt;
  return r;
}

char body_marker(std::string_view line) {
  return line.empty() ? consts::kContextMarker : line.front();
}

std::string_view body_content(std::string_view line) {
  return line.empty() ? line : line.substr(1);
}

std::vector<ScannedLine> scan_diff(std::string_view text) {
  std::vector<ScannedLine> out;
  if (text.empty())
    return out;

  ScanState state = ScanState::Preamble;
  std::size_t patch = 0;
  std::size_t hunk = 0;
  int old_left = 0;
  int new_left = 0;
  bool patch_has_content = false;

  auto push = [&](LineRole role, std::string_view line) {
    out.push_back(ScannedLine{.role = role, .text = line, .patch = patch, .hunk = hunk});
    patch_has_content = true;
  };
  auto begin_patch = [&] {
    if (patch_has_content)
      ++patch;
    patch_has_content = false;
    state = ScanState::Preamble;
  };

  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string_view line =
        nl == std::string_view::npos ? text.substr(pos) : text.substr(pos, nl - pos);
    pos = nl == std::string_view::npos ? text.size() : nl + 1;

    if (line.starts_with(consts::kGitDiffPrefix)) {
      begin_patch();
      continue;
    }

    if (line.starts_with(consts::kHunkPrefix)) {
      if (auto range = parse_hunk_header(line)) {
        ++hunk;
        push(LineRole::HunkHeader, line);
        out.back().range = range;
        old_left = range->old_count;
        new_left = range->new_count;
        state = (old_left > 0 || new_left > 0) ? ScanState::InHunk : ScanState::AfterHunk;
      } else {
        log::debug("diff: unparsable hunk header '" + std::string(line) + "'");
        push(LineRole::Malformed, line);
        state = ScanState::Degraded;
      }
      continue;
    }

    switch (state) {
    case ScanState::Preamble:
      if (is_file_header(line))
        push(LineRole::FileHeader, line);
      // everything else ahead of the first hunk is patch metadata
      break;

    case ScanState::InHunk: {
      const char m = body_marker(line);
      if (m == consts::kNoNewlineMarker) {
        push(LineRole::NoNewlineMarker, line);
        break;
      }
      if (m != consts::kContextMarker && m != consts::kAddMarker && m != consts::kRemoveMarker) {
        push(LineRole::Malformed, line);
        break;
      }
      push(LineRole::Body, line);
      if (m != consts::kAddMarker && old_left > 0)
        --old_left;
      if (m != consts::kRemoveMarker && new_left > 0)
        --new_left;
      if (old_left == 0 && new_left == 0)
        state = ScanState::AfterHunk;
      break;
    }

    case ScanState::Degraded:
      // body of a hunk whose ranges are unknown: kept, but without line numbers
      push(LineRole::Malformed, line);
      break;

    case ScanState::AfterHunk: {
      if (line.starts_with(consts::kOldFilePrefix)) {
        // next file of a plain "diff -u" stream without "diff --git" separators
        begin_patch();
        push(LineRole::FileHeader, line);
        break;
      }
      if (line.starts_with(consts::kNewFilePrefix)) {
        push(LineRole::FileHeader, line);
        break;
      }
      const char m = body_marker(line);
      if (m == consts::kNoNewlineMarker) {
        push(LineRole::NoNewlineMarker, line);
      } else if (m == consts::kContextMarker || m == consts::kAddMarker ||
                 m == consts::kRemoveMarker) {
        // hunk counts are advisory; keep attributing body lines to the last hunk
        if (hunk > 0)
          push(LineRole::Body, line);
        else
          push(LineRole::Malformed, line);
      } else {
        push(LineRole::Malformed, line);
      }
      break;
    }
    }
  }
  return out;
}

std::vector<UnifiedLine> parse_unified(std::string_view text) {
  std::vector<UnifiedLine> lines;
  const auto scanned = scan_diff(text);
  lines.reserve(scanned.size());

  int old_n = 0;
  int new_n = 0;
  for (const auto &sl : scanned) {
    switch (sl.role) {
    case LineRole::FileHeader:
      lines.push_back({.content = std::string(sl.text), .kind = LineKind::Header});
      break;
    case LineRole::HunkHeader:
      old_n = sl.range->old_start;
      new_n = sl.range->new_start;
      lines.push_back({.content = std::string(sl.text), .kind = LineKind::Header});
      break;
    case LineRole::Body: {
      UnifiedLine ul{.content = std::string(body_content(sl.text))};
      switch (body_marker(sl.text)) {
      case consts::kAddMarker:
        ul.kind = LineKind::Add;
        ul.new_line = new_n++;
        break;
      case consts::kRemoveMarker:
        ul.kind = LineKind::Remove;
        ul.old_line = old_n++;
        break;
      default:
        ul.kind = LineKind::Context;
        ul.old_line = old_n++;
        ul.new_line = new_n++;
        break;
      }
      lines.push_back(std::move(ul));
      break;
    }
    case LineRole::NoNewlineMarker:
    case LineRole::Malformed:
      lines.push_back({.content = std::string(sl.text), .kind = LineKind::Context});
      break;
    }
  }
  return lines;
}

} // namespace gitpane::diff
