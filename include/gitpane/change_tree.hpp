#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitpane {

// Ordered from lowest to highest priority; a folder shows its highest-priority child.
enum class Severity : std::uint8_t {
  None,
  Untracked,
  Modified,
  Added,
  Renamed,
  Copied,
  Conflict,
  Deleted,
};

// "#RRGGBB" display color for a severity class
auto severity_color(Severity s) -> std::string_view;

// A changed file as reported by a status provider.
struct ChangedFile {
  std::string path;        // slash-delimited, repo-relative
  char code = ' ';         // status letter: M A D R C ? U
  Severity severity = Severity::None;
  bool staged = false;
  std::string status_text; // "Modified", "Added", ...
};

struct StatusClass {
  Severity severity;
  std::string_view text;
};

// Map a status letter to its severity and display text ("Unknown" for anything else).
auto classify_status(char code) -> StatusClass;

auto make_changed_file(std::string path, char code, bool staged = false) -> ChangedFile;

enum class NodeKind : std::uint8_t { File, Folder };

struct TreeNode {
  NodeKind kind = NodeKind::File;
  std::string name;
  std::string path;   // unique within one snapshot
  int depth = 0;
  Severity severity = Severity::None;
  std::optional<ChangedFile> record; // files only
  bool expanded = true;              // folders only
  std::vector<TreeNode> children;    // folders only

  [[nodiscard]] bool is_folder() const { return kind == NodeKind::Folder; }
};

using Forest = std::vector<TreeNode>;

// Build the folder/file forest from a flat list of records; all folders start expanded.
// Paths must be unique.
auto build_tree(std::vector<ChangedFile> files) -> Forest;

// Depth-first pre-order walk that only descends into expanded folders.
// Pointers stay valid while `forest` is alive and unmodified.
auto flatten(const Forest& forest) -> std::vector<const TreeNode*>;

// New forest with the folder at `path` toggled; `forest` itself is untouched.
auto toggle_folder(const Forest& forest, std::string_view path) -> Forest;

// Carry each folder's `expanded` flag from `previous` to the same path in `fresh`.
// Folders that did not exist before stay expanded.
auto preserve_expansion(const Forest& previous, Forest fresh) -> Forest;

// Paths of every file at or below `node`
auto files_in_folder(const TreeNode& node) -> std::vector<std::string>;

// Forest plus a selection index into its flattened form, kept in range across refreshes
// and folder toggles.
class TreeView {
public:
  // Rebuild from a fresh status snapshot, keeping fold state
  void refresh(std::vector<ChangedFile> files);

  // Toggle the folder at `path`; returns false if no such folder exists
  bool toggle(std::string_view path);

  // Toggle the folder under the selection; returns false on a file or an empty tree
  bool toggle_selected();

  void move(int delta);
  void select(std::size_t index);

  [[nodiscard]] const Forest& forest() const { return forest_; }
  [[nodiscard]] const std::vector<const TreeNode*>& rows() const { return rows_; }
  [[nodiscard]] std::size_t selection() const { return selection_; }
  [[nodiscard]] const TreeNode* selected() const;

private:
  void reflow();

  Forest forest_;
  std::vector<const TreeNode*> rows_;
  std::size_t selection_ = 0;
};

} // namespace gitpane
