#pragma once
#include "gitpane/change_tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitpane {

// Which pair of snapshots a diff compares.
enum class DiffMode : std::uint8_t { Working, Staged, Branch };

auto diff_mode_name(DiffMode mode) -> std::string_view;
auto parse_diff_mode(std::string_view name) -> std::optional<DiffMode>;

// Source of unified-diff text. Returns "" (not an error) when there are no differences;
// throws std::runtime_error when the diff cannot be produced.
class DiffProvider {
public:
  virtual ~DiffProvider() = default;
  virtual std::string get_diff(std::string_view path, DiffMode mode,
                               std::string_view compare_target) = 0;
};

enum class WriteStatus : std::uint8_t { Written, Conflict };

class FileProvider {
public:
  virtual ~FileProvider() = default;
  // Full file text; throws std::runtime_error if it cannot be read.
  virtual std::string read_file(std::string_view path) = 0;
  // Replace the whole file in one operation. When `expected_oid` is non-empty and the
  // content on disk no longer has that blob id, nothing is written and Conflict is returned.
  virtual WriteStatus write_file(std::string_view path, std::string_view text,
                                 std::string_view expected_oid) = 0;
};

class StatusProvider {
public:
  virtual ~StatusProvider() = default;
  virtual std::vector<ChangedFile> changed_files() = 0;
};

} // namespace gitpane
