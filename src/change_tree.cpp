#include "gitpane/change_tree.hpp"

#include <algorithm>
#include <functional>
#include <map>

namespace gitpane {

std::string_view severity_color(Severity s) {
  switch (s) {
  case Severity::Untracked:
    return "#888888";
  case Severity::Modified:
    return "#FFAA00";
  case Severity::Added:
    return "#44FF44";
  case Severity::Renamed:
  case Severity::Copied:
    return "#00AAFF";
  case Severity::Conflict:
    return "#FF00FF";
  case Severity::Deleted:
    return "#FF4444";
  case Severity::None:
    break;
  }
  return "#FFFFFF";
}

StatusClass classify_status(char code) {
  switch (code) {
  case 'M':
    return {Severity::Modified, "Modified"};
  case 'A':
    return {Severity::Added, "Added"};
  case 'D':
    return {Severity::Deleted, "Deleted"};
  case 'R':
    return {Severity::Renamed, "Renamed"};
  case 'C':
    return {Severity::Copied, "Copied"};
  case '?':
    return {Severity::Untracked, "Untracked"};
  case 'U':
    return {Severity::Conflict, "Conflict"};
  default:
    return {Severity::None, "Unknown"};
  }
}

ChangedFile make_changed_file(std::string path, char code, bool staged) {
  const auto cls = classify_status(code);
  return ChangedFile{.path = std::move(path),
                     .code = code,
                     .severity = cls.severity,
                     .staged = staged,
                     .status_text = std::string(cls.text)};
}

namespace {

TreeNode *find_child(std::vector<TreeNode> &children, std::string_view name) {
  auto it = std::ranges::find_if(children, [&](const TreeNode &n) { return n.name == name; });
  return it == children.end() ? nullptr : &*it;
}

Severity aggregate_severity(TreeNode &node) {
  if (!node.is_folder())
    return node.severity;
  Severity top = Severity::None;
  for (auto &child : node.children)
    top = std::max(top, aggregate_severity(child));
  node.severity = top;
  return top;
}

} // namespace

Forest build_tree(std::vector<ChangedFile> files) {
  std::ranges::sort(files, [](const ChangedFile &a, const ChangedFile &b) { return a.path < b.path; });

  Forest roots;
  for (auto &file : files) {
    std::vector<TreeNode> *level = &roots;
    std::string prefix;
    std::string_view rest = file.path;
    int depth = 0;

    for (;;) {
      const std::size_t slash = rest.find('/');
      const std::string_view part = rest.substr(0, slash);
      if (!prefix.empty())
        prefix.push_back('/');
      prefix.append(part);

      if (slash == std::string_view::npos) {
        std::string name(part); // `part` views file.path, which is moved below
        const Severity sev = file.severity;
        level->push_back(TreeNode{.kind = NodeKind::File,
                                  .name = std::move(name),
                                  .path = prefix,
                                  .depth = depth,
                                  .severity = sev,
                                  .record = std::move(file)});
        break;
      }

      TreeNode *folder = find_child(*level, part);
      if (!folder) {
        level->push_back(TreeNode{.kind = NodeKind::Folder,
                                  .name = std::string(part),
                                  .path = prefix,
                                  .depth = depth});
        folder = &level->back();
      }
      level = &folder->children;
      rest.remove_prefix(slash + 1);
      ++depth;
    }
  }

  for (auto &node : roots)
    aggregate_severity(node);
  return roots;
}

std::vector<const TreeNode *> flatten(const Forest &forest) {
  std::vector<const TreeNode *> out;
  std::function<void(const Forest &)> walk = [&](const Forest &nodes) {
    for (const auto &node : nodes) {
      out.push_back(&node);
      if (node.is_folder() && node.expanded)
        walk(node.children);
    }
  };
  walk(forest);
  return out;
}

Forest toggle_folder(const Forest &forest, std::string_view path) {
  Forest out;
  out.reserve(forest.size());
  for (const auto &node : forest) {
    TreeNode copy = node;
    if (node.is_folder()) {
      if (node.path == path)
        copy.expanded = !node.expanded;
      else
        copy.children = toggle_folder(node.children, path);
    }
    out.push_back(std::move(copy));
  }
  return out;
}

Forest preserve_expansion(const Forest &previous, Forest fresh) {
  std::map<std::string, bool, std::less<>> state;
  std::function<void(const Forest &)> collect = [&](const Forest &nodes) {
    for (const auto &node : nodes) {
      if (!node.is_folder())
        continue;
      state[node.path] = node.expanded;
      collect(node.children);
    }
  };
  std::function<void(Forest &)> apply = [&](Forest &nodes) {
    for (auto &node : nodes) {
      if (!node.is_folder())
        continue;
      const auto it = state.find(node.path);
      node.expanded = it == state.end() ? true : it->second;
      apply(node.children);
    }
  };
  collect(previous);
  apply(fresh);
  return fresh;
}

std::vector<std::string> files_in_folder(const TreeNode &node) {
  std::vector<std::string> out;
  std::function<void(const TreeNode &)> walk = [&](const TreeNode &n) {
    if (!n.is_folder()) {
      if (n.record)
        out.push_back(n.path);
      return;
    }
    for (const auto &child : n.children)
      walk(child);
  };
  walk(node);
  return out;
}

// TreeView

void TreeView::refresh(std::vector<ChangedFile> files) {
  forest_ = preserve_expansion(forest_, build_tree(std::move(files)));
  reflow();
}

bool TreeView::toggle(std::string_view path) {
  // folders hidden under a collapsed parent can still be toggled
  std::function<bool(const Forest &)> exists = [&](const Forest &nodes) {
    return std::ranges::any_of(nodes, [&](const TreeNode &n) {
      return n.is_folder() && (n.path == path || exists(n.children));
    });
  };
  if (!exists(forest_))
    return false;
  forest_ = toggle_folder(forest_, path);
  reflow();
  return true;
}

bool TreeView::toggle_selected() {
  const TreeNode *node = selected();
  if (!node || !node->is_folder())
    return false;
  const std::string path = node->path;
  return toggle(path);
}

void TreeView::move(int delta) {
  if (rows_.empty())
    return;
  const auto last = static_cast<long long>(rows_.size()) - 1;
  const long long next = static_cast<long long>(selection_) + delta;
  selection_ = static_cast<std::size_t>(std::clamp(next, 0LL, last));
}

void TreeView::select(std::size_t index) {
  selection_ = index;
  reflow();
}

const TreeNode *TreeView::selected() const {
  return selection_ < rows_.size() ? rows_[selection_] : nullptr;
}

void TreeView::reflow() {
  rows_ = flatten(forest_);
  if (rows_.empty())
    selection_ = 0;
  else if (selection_ >= rows_.size())
    selection_ = rows_.size() - 1;
}

} // namespace gitpane
