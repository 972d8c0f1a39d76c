#include "gitpane/change_tree.hpp"
#include "gitpane/config.hpp"
#include "gitpane/viewport.hpp"
#include "gitpane/workspace.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

// gitpane status [--collapse <dir>]... [--select N]
int cmd_status(int argc, char **argv) {
  const std::filesystem::path root = std::filesystem::current_path();
  if (!std::filesystem::exists(root / gitpane::consts::kStateDir)) {
    std::cerr << "status: not a gitpane workspace (run `gitpane init`)\n";
    return 1;
  }

  std::vector<std::string> collapse;
  std::size_t select = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--collapse" && i + 1 < argc) {
      collapse.emplace_back(argv[++i]);
    } else if (arg == "--select" && i + 1 < argc) {
      const std::string_view v = argv[++i];
      if (std::from_chars(v.data(), v.data() + v.size(), select).ec != std::errc{}) {
        std::cerr << "status: bad --select value '" << v << "'\n";
        return 2;
      }
    } else {
      std::cerr << "status: unknown argument '" << arg << "'\n";
      return 2;
    }
  }

  try {
    const auto settings = gitpane::load_settings(root);
    gitpane::BaselineStatusProvider provider{root};
    gitpane::TreeView view;
    view.refresh(provider.changed_files());
    for (const auto &dir : collapse) {
      if (!view.toggle(dir))
        std::cerr << "status: no folder '" << dir << "'\n";
    }
    view.select(select);

    const auto &rows = view.rows();
    if (rows.empty()) {
      std::cout << "No changes\n";
      return 0;
    }

    const auto win = gitpane::visible_window(rows.size(), view.selection(),
                                             static_cast<std::size_t>(settings.max_visible_rows));
    if (win.start > 0)
      std::cout << "  ... " << win.start << " more above\n";
    for (std::size_t i = win.start; i < win.end; ++i) {
      const gitpane::TreeNode &node = *rows[i];
      std::cout << (i == view.selection() ? "> " : "  ")
                << std::string(static_cast<std::size_t>(node.depth) * 2, ' ');
      if (node.is_folder()) {
        std::cout << (node.expanded ? "v " : "+ ") << node.name << "/";
      } else {
        std::cout << node.record->code << ' ' << node.name << "  (" << node.record->status_text
                  << ")";
      }
      std::cout << "  " << gitpane::severity_color(node.severity) << "\n";
    }
    if (win.end < rows.size())
      std::cout << "  ... " << rows.size() - win.end << " more below\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
