#pragma once
#include "gitpane/consts.hpp"
#include "gitpane/object_store.hpp"
#include "gitpane/providers.hpp"
#include "gitpane/worktree.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitpane {

// Recorded snapshot of a workspace: blobs in .gitpane/objects plus a manifest at
// .gitpane/baseline with one "<40-hex> <path>" line per file.
class BaselineStore {
public:
  explicit BaselineStore(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] auto state_dir() const -> std::filesystem::path { return root_ / consts::kStateDir; }
  [[nodiscard]] auto manifest_path() const -> std::filesystem::path {
    return state_dir() / consts::kBaselineFile;
  }

  // Has a baseline been recorded yet?
  [[nodiscard]] bool exists() const;

  // Snapshot the given paths (every working file when empty). Paths that no longer exist
  // are dropped from the baseline. Returns the number of files recorded.
  std::size_t record(const std::vector<std::string>& paths = {});

  [[nodiscard]] auto manifest() const -> worktree::PathOidMap;

  // Baseline content of `path`, or nullopt if it is not part of the baseline
  [[nodiscard]] auto read(std::string_view path) const -> std::optional<std::string>;

private:
  void write_manifest(const worktree::PathOidMap& m) const;

  std::filesystem::path root_;
  ObjectStore objects_;
};

// Reads and atomically rewrites files under a workspace root.
class LocalFileProvider final : public FileProvider {
public:
  explicit LocalFileProvider(std::filesystem::path root) : root_(std::move(root)) {}

  std::string read_file(std::string_view path) override;
  WriteStatus write_file(std::string_view path, std::string_view text,
                         std::string_view expected_oid) override;

private:
  std::filesystem::path root_;
};

// Working file versus its recorded baseline. Staged and branch diffs have no meaning
// without a VCS and come back empty.
class BaselineDiffProvider final : public DiffProvider {
public:
  explicit BaselineDiffProvider(std::filesystem::path root, int context = consts::kDefaultContextLines)
      : store_(std::move(root)), context_(context) {}

  std::string get_diff(std::string_view path, DiffMode mode,
                       std::string_view compare_target) override;

private:
  BaselineStore store_;
  int context_;
};

// Changed files versus the baseline; every file is untracked before one is recorded.
class BaselineStatusProvider final : public StatusProvider {
public:
  explicit BaselineStatusProvider(std::filesystem::path root) : store_(std::move(root)) {}

  std::vector<ChangedFile> changed_files() override;

private:
  BaselineStore store_;
};

} // namespace gitpane
