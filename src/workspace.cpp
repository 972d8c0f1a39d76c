#include "gitpane/workspace.hpp"

#include "gitpane/fs.hpp"
#include "gitpane/log.hpp"
#include "gitpane/status.hpp"
#include "gitpane/textdiff.hpp"
#include "gitpane/util.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

namespace gitpane {

// BaselineStore

BaselineStore::BaselineStore(std::filesystem::path root)
    : root_(std::move(root)), objects_(root_ / consts::kStateDir) {}

bool BaselineStore::exists() const { return fs::exists(manifest_path()); }

worktree::PathOidMap BaselineStore::manifest() const {
  worktree::PathOidMap m;
  if (!exists())
    return m;
  std::istringstream iss(fs::read_text(manifest_path()));
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    strutil::rstrip_newlines(line);
    if (line.empty())
      continue;
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos || !looks_hex40(std::string_view(line).substr(0, sp))) {
      throw std::runtime_error("baseline: malformed manifest line " + std::to_string(lineno));
    }
    m[line.substr(sp + 1)] = line.substr(0, sp);
  }
  return m;
}

void BaselineStore::write_manifest(const worktree::PathOidMap &m) const {
  std::ostringstream os;
  for (const auto &[path, hex] : m)
    os << hex << consts::kSpace << path << consts::kLF;
  fs::write_text_atomic(manifest_path(), os.str());
}

std::size_t BaselineStore::record(const std::vector<std::string> &paths) {
  worktree::PathOidMap m;
  std::set<std::string> targets;
  if (paths.empty()) {
    worktree::enumerate_paths(root_, targets);
  } else {
    m = manifest();
    targets.insert(paths.begin(), paths.end());
  }

  std::size_t recorded = 0;
  for (const auto &rel : targets) {
    const auto abs = worktree::resolve(root_, rel);
    const auto key = abs.lexically_relative(root_).generic_string();
    if (!fs::exists(abs)) {
      m.erase(key);
      log::debug("baseline: dropped " + key);
      continue;
    }
    m[key] = objects_.write_blob(fs::read_text(abs));
    ++recorded;
  }
  write_manifest(m);
  log::info("baseline: recorded " + std::to_string(recorded) + " file(s)");
  return recorded;
}

std::optional<std::string> BaselineStore::read(std::string_view path) const {
  const auto m = manifest();
  const auto it = m.find(std::string(path));
  if (it == m.end())
    return std::nullopt;
  return objects_.read_blob(it->second);
}

// LocalFileProvider

std::string LocalFileProvider::read_file(std::string_view path) {
  return fs::read_text(worktree::resolve(root_, path));
}

WriteStatus LocalFileProvider::write_file(std::string_view path, std::string_view text,
                                          std::string_view expected_oid) {
  const auto abs = worktree::resolve(root_, path);
  if (!expected_oid.empty()) {
    if (!fs::exists(abs) || compute_blob_hex_oid(fs::read_file(abs)) != expected_oid) {
      log::warn("workspace: " + std::string(path) + " changed before write; not writing");
      return WriteStatus::Conflict;
    }
  }
  fs::write_text_atomic(abs, text);
  return WriteStatus::Written;
}

// BaselineDiffProvider

std::string BaselineDiffProvider::get_diff(std::string_view path, DiffMode mode,
                                           std::string_view compare_target) {
  if (mode != DiffMode::Working) {
    log::debug("workspace: " + std::string(diff_mode_name(mode)) + " diff against '" +
               std::string(compare_target) + "' is not available for a local baseline");
    return {};
  }
  const auto abs = worktree::resolve(store_.root(), path);
  const std::optional<std::string> before = store_.read(path);
  const bool on_disk = fs::exists(abs);
  if (!before && !on_disk) {
    throw std::runtime_error("workspace: no such file: " + std::string(path));
  }
  const std::string after = on_disk ? fs::read_text(abs) : std::string{};
  const std::string old_text = before.value_or(std::string{});
  if (before && on_disk && *before == after)
    return {};

  const std::string p(path);
  diff::Labels labels{.old_label = before ? "a/" + p : "/dev/null",
                      .new_label = on_disk ? "b/" + p : "/dev/null"};
  std::ostringstream os;
  os << "diff --git a/" << p << " b/" << p << '\n';
  if (!before)
    os << "new file mode 100644\n";
  else if (!on_disk)
    os << "deleted file mode 100644\n";
  os << "index " << compute_blob_hex_oid(old_text).substr(0, 7) << ".."
     << compute_blob_hex_oid(after).substr(0, 7) << '\n';
  os << diff::unified_diff(old_text, after, labels, context_);
  return os.str();
}

// BaselineStatusProvider

std::vector<ChangedFile> BaselineStatusProvider::changed_files() {
  return compute_changes(store_.manifest(), worktree::build_working_map(store_.root()));
}

} // namespace gitpane
