#include "gitpane/config.hpp"
#include "gitpane/edit_session.hpp"
#include "gitpane/workspace.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

bool parse_row(std::string_view v, std::size_t &out) {
  const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  return ec == std::errc{} && ptr == v.data() + v.size();
}

} // namespace

// gitpane edit <path> <row> <text> [<row> <text>]... [--unified]
// Rows index the diff view as `gitpane diff` prints it.
int cmd_edit(int argc, char **argv) {
  std::vector<std::string> args;
  gitpane::DiffView view = gitpane::DiffView::Split;
  bool view_given = false;
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    if (a == "--unified") {
      view = gitpane::DiffView::Unified;
      view_given = true;
    } else if (a == "--split") {
      view = gitpane::DiffView::Split;
      view_given = true;
    } else {
      args.emplace_back(a);
    }
  }
  if (args.size() < 3 || args.size() % 2 == 0) {
    std::cerr << "usage: gitpane edit <path> <row> <text> [<row> <text>]... [--unified]\n";
    return 2;
  }

  std::vector<std::pair<std::size_t, std::string>> changes;
  for (std::size_t i = 1; i < args.size(); i += 2) {
    std::size_t row = 0;
    if (!parse_row(args[i], row)) {
      std::cerr << "edit: bad row '" << args[i] << "'\n";
      return 2;
    }
    changes.emplace_back(row, args[i + 1]);
  }

  const std::filesystem::path root = std::filesystem::current_path();
  try {
    const auto settings = gitpane::load_settings(root);
    if (!view_given)
      view = settings.diff_view;
    gitpane::BaselineDiffProvider diffs{root, settings.context_lines};
    gitpane::LocalFileProvider files{root};
    gitpane::EditSession session{diffs, files};

    const gitpane::DiffKey key{.path = args[0]};
    const auto entered = session.enter(key, view, changes.front().first);
    if (entered != gitpane::EnterResult::Entered) {
      std::cerr << "edit: " << gitpane::describe(entered) << "\n";
      return 1;
    }

    for (const auto &[row, text] : changes) {
      if (row >= session.row_count()) {
        std::cerr << "edit: " << gitpane::describe(gitpane::EnterResult::NoSuchRow) << "\n";
        session.cancel();
        return 1;
      }
      session.move_to(row);
      if (!session.set_buffer(text)) {
        std::cerr << "edit: row " << row << ": "
                  << gitpane::describe(gitpane::EnterResult::NotEditable) << "\n";
        session.cancel();
        return 1;
      }
    }

    const auto result = session.save();
    if (result.outcome == gitpane::SaveOutcome::NoChanges)
      std::cout << "No changes to save\n";
    else
      std::cout << "Saved " << result.lines_written << " line(s) to " << key.path << "\n";
    return 0;
  } catch (const gitpane::ConflictError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "edit: " << e.what() << "\n";
    return 1;
  }
}
