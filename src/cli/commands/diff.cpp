#include "gitpane/config.hpp"
#include "gitpane/diff_cache.hpp"
#include "gitpane/highlight.hpp"
#include "gitpane/viewport.hpp"
#include "gitpane/workspace.hpp"

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

std::string line_no(const std::optional<int> &n) {
  std::ostringstream os;
  os << std::setw(5);
  if (n)
    os << *n;
  else
    os << "";
  return os.str();
}

std::string render(gitpane::TokenCache &cache, gitpane::Highlighter &hl, std::string_view code,
                   std::string_view language) {
  std::string out;
  for (const auto &tok : cache.tokens(hl, code, language))
    out += tok.text;
  return out;
}

char unified_marker(gitpane::diff::LineKind kind) {
  switch (kind) {
  case gitpane::diff::LineKind::Add:
    return '+';
  case gitpane::diff::LineKind::Remove:
    return '-';
  case gitpane::diff::LineKind::Header:
    return '@';
  case gitpane::diff::LineKind::Context:
    break;
  }
  return ' ';
}

char split_marker(gitpane::diff::RowKind kind) {
  switch (kind) {
  case gitpane::diff::RowKind::Added:
    return '+';
  case gitpane::diff::RowKind::Removed:
    return '-';
  case gitpane::diff::RowKind::Modified:
    return '~';
  case gitpane::diff::RowKind::Unchanged:
    break;
  }
  return ' ';
}

} // namespace

// gitpane diff <path> [--unified|--split] [--row N] [--mode unstaged|staged|branch] [--against B]
int cmd_diff(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: gitpane diff <path> [--unified|--split] [--row N]\n";
    return 2;
  }
  const std::filesystem::path root = std::filesystem::current_path();
  gitpane::DiffKey key{.path = argv[1]};
  std::optional<gitpane::DiffView> view;
  std::size_t row = 0;

  for (int i = 2; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--unified") {
      view = gitpane::DiffView::Unified;
    } else if (arg == "--split") {
      view = gitpane::DiffView::Split;
    } else if (arg == "--row" && i + 1 < argc) {
      const std::string_view v = argv[++i];
      if (std::from_chars(v.data(), v.data() + v.size(), row).ec != std::errc{}) {
        std::cerr << "diff: bad --row value '" << v << "'\n";
        return 2;
      }
    } else if (arg == "--mode" && i + 1 < argc) {
      const auto mode = gitpane::parse_diff_mode(argv[++i]);
      if (!mode) {
        std::cerr << "diff: unknown mode '" << argv[i] << "'\n";
        return 2;
      }
      key.mode = *mode;
    } else if (arg == "--against" && i + 1 < argc) {
      key.compare_target = argv[++i];
    } else {
      std::cerr << "diff: unknown argument '" << arg << "'\n";
      return 2;
    }
  }

  try {
    const auto settings = gitpane::load_settings(root);
    const gitpane::DiffView mode = view.value_or(settings.diff_view);
    gitpane::BaselineDiffProvider provider{root, settings.context_lines};
    gitpane::DiffLoader loader;
    const gitpane::ParsedDiff &parsed = loader.load(provider, key);
    if (parsed.raw.empty()) {
      std::cout << "No differences in " << key.path << " ("
                << gitpane::diff_mode_name(key.mode) << ")\n";
      return 0;
    }

    gitpane::PlainHighlighter hl;
    gitpane::TokenCache cache{settings.token_cache_capacity};
    const std::string_view language = gitpane::language_from_path(key.path);
    const auto max_rows = static_cast<std::size_t>(settings.max_visible_rows);

    const std::size_t total =
        mode == gitpane::DiffView::Unified ? parsed.lines.size() : parsed.rows.size();
    const auto win = gitpane::visible_window(total, row, max_rows);
    for (std::size_t i = win.start; i < win.end; ++i) {
      std::cout << (i == row ? '>' : ' ');
      if (mode == gitpane::DiffView::Unified) {
        const auto &ul = parsed.lines[i];
        std::cout << line_no(ul.old_line) << line_no(ul.new_line) << ' '
                  << unified_marker(ul.kind) << ' ' << render(cache, hl, ul.content, language)
                  << "\n";
      } else {
        const auto &r = parsed.rows[i];
        std::cout << line_no(r.left_line) << ' ' << std::left << std::setw(40)
                  << render(cache, hl, r.left, language) << std::right << ' '
                  << split_marker(r.kind) << ' ' << line_no(r.right_line) << ' '
                  << render(cache, hl, r.right, language) << "\n";
      }
    }
    if (win.end < total)
      std::cout << "  ... " << total - win.end << " more rows\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "diff: " << e.what() << "\n";
    return 1;
  }
}
