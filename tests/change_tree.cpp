#include "gitpane/change_tree.hpp"

#include <iostream>
#include <string>
#include <vector>

using gitpane::ChangedFile;
using gitpane::make_changed_file;
using gitpane::Severity;

static int failures = 0;

static void expect(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

static std::vector<std::string> paths(const std::vector<const gitpane::TreeNode *> &rows) {
  std::vector<std::string> out;
  for (const auto *n : rows)
    out.push_back(n->path);
  return out;
}

int main() {
  const std::vector<ChangedFile> files = {
      make_changed_file("src/lib/b.cpp", 'D'),
      make_changed_file("src/a.cpp", 'M'),
      make_changed_file("README.md", '?'),
      make_changed_file("src/c.cpp", 'A'),
  };

  const auto forest = gitpane::build_tree(files);
  expect(forest.size() == 2, "two roots");
  const auto rows = gitpane::flatten(forest);
  const std::vector<std::string> expected = {"README.md", "src",      "src/a.cpp",
                                             "src/c.cpp", "src/lib", "src/lib/b.cpp"};
  expect(paths(rows) == expected, "flatten order");
  if (forest.size() == 2) {
    const auto &src = forest[1];
    expect(src.is_folder() && src.severity == Severity::Deleted, "folder takes highest severity");
    expect(src.children.size() == 3 && src.children[2].depth == 1, "src children");
    expect(forest[0].record && forest[0].record->status_text == "Untracked", "file record");
    expect(gitpane::files_in_folder(src) ==
               std::vector<std::string>{"src/a.cpp", "src/c.cpp", "src/lib/b.cpp"},
           "files_in_folder");
  }
  expect(gitpane::severity_color(Severity::Deleted) == "#FF4444", "deleted color");
  expect(gitpane::classify_status('X').text == "Unknown", "unknown status");

  // toggling returns a new forest and leaves the input alone
  {
    const auto toggled = gitpane::toggle_folder(forest, "src");
    expect(gitpane::flatten(toggled).size() == 2, "collapsed src hides children");
    expect(gitpane::flatten(forest).size() == 6, "input forest untouched");
    const auto again = gitpane::toggle_folder(toggled, "src");
    expect(paths(gitpane::flatten(again)) == expected, "double toggle restores");
  }

  // collapsed folders stay collapsed across a refresh; new folders start expanded
  {
    gitpane::TreeView view;
    view.refresh({make_changed_file("A/x", 'M'), make_changed_file("B/y", 'M')});
    expect(view.toggle("A") && view.toggle("B"), "toggle A and B");
    expect(!view.toggle("nope"), "toggle missing folder");
    view.refresh({make_changed_file("A/x", 'M'), make_changed_file("B/y", 'M'),
                  make_changed_file("A/w", 'A'), make_changed_file("C/z", '?')});
    expect(paths(view.rows()) == std::vector<std::string>{"A", "B", "C", "C/z"},
           "expansion preserved");
    expect(!view.forest()[0].expanded && !view.forest()[1].expanded && view.forest()[2].expanded,
           "flags preserved");
  }

  // a collapsed nested folder hides files added under it later
  {
    gitpane::TreeView view;
    view.refresh({make_changed_file("A/B/one.txt", 'M'), make_changed_file("A/top.txt", 'M')});
    expect(view.toggle("A/B"), "toggle A/B");
    view.refresh({make_changed_file("A/B/one.txt", 'M'), make_changed_file("A/B/two.txt", 'A'),
                  make_changed_file("A/top.txt", 'M')});
    expect(paths(view.rows()) == std::vector<std::string>{"A", "A/B", "A/top.txt"},
           "new file under collapsed A/B stays hidden");
    expect(view.toggle("A/B") && view.rows().size() == 5, "expanding A/B shows both files");
  }

  // selection is clamped to the flattened range
  {
    gitpane::TreeView view;
    view.refresh(files);
    view.select(10);
    expect(view.selection() == 5, "select clamps to last row");
    view.move(-1);
    expect(view.selected() && view.selected()->path == "src/lib", "move up");
    expect(view.toggle_selected(), "toggle selected folder");
    expect(view.rows().size() == 5 && view.selection() == 4, "selection after collapse");
    view.move(-100);
    expect(view.selection() == 0, "move clamps at top");
    expect(!view.toggle_selected(), "toggle on a file");
    view.refresh({});
    expect(view.selection() == 0 && view.selected() == nullptr, "empty tree");
  }

  if (failures)
    return 1;
  std::cout << "OK\n";
  return 0;
}
