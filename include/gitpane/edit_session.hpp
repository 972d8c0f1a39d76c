#pragma once
#include "gitpane/config.hpp"
#include "gitpane/diff_cache.hpp"
#include "gitpane/diff_parser.hpp"
#include "gitpane/providers.hpp"
#include "gitpane/side_by_side.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gitpane {

enum class SessionState : std::uint8_t { Closed, Open, Saving };

enum class EnterResult : std::uint8_t {
  Entered,
  AlreadyOpen, // another session has not been closed yet
  NoSuchRow,   // cursor is past the last row
  NotEditable, // the row has no new-side line (removals, headers)
  Stale,       // the file no longer matches the diff at that line
};

// User-facing message for a refused entry ("" for Entered)
auto describe(EnterResult r) -> std::string_view;

// What a diff row maps to in the working file: the 1-based new-side line and the text the
// diff recorded for it.
struct RowTarget {
  std::optional<int> line;
  std::string content;
};

auto row_targets(const std::vector<diff::UnifiedLine>& lines) -> std::vector<RowTarget>;
auto row_targets(const std::vector<diff::DiffRow>& rows) -> std::vector<RowTarget>;

// A save found edited lines that changed underneath the session. Nothing was written and
// the session is still open with its edits.
class ConflictError : public std::runtime_error {
public:
  ConflictError(const std::string& path, std::vector<int> lines);
  [[nodiscard]] const std::vector<int>& lines() const { return lines_; }

private:
  std::vector<int> lines_;
};

enum class SaveOutcome : std::uint8_t { Saved, NoChanges };

struct SaveResult {
  SaveOutcome outcome = SaveOutcome::NoChanges;
  std::size_t lines_written = 0;
  bool refresh_needed = false; // diff and status views are out of date
};

/**
 * Line-edit session over one file, driven from a diff view.
 *
 * The user moves a cursor over diff rows; only the focused row's text is held in the
 * active buffer. Moving away commits the buffer into `edits` (keyed by absolute file line)
 * when it differs from the baseline. save() verifies every edited line against a fresh
 * diff and file read and writes all edits at once, or throws ConflictError and writes
 * nothing.
 *
 * Provider exceptions propagate; after one the session keeps its previous state.
 */
class EditSession {
public:
  EditSession(DiffProvider& diffs, FileProvider& files);

  EnterResult enter(const DiffKey& key, DiffView view, std::size_t cursor_row);

  // Replace the active buffer; false on a row that has no file line.
  bool set_buffer(std::string text);

  void move(int delta);
  void move_to(std::size_t row);

  SaveResult save();

  // Discard the session without any I/O; returns how many edited lines were dropped.
  std::size_t cancel();

  [[nodiscard]] SessionState state() const { return state_; }
  [[nodiscard]] bool is_open() const { return state_ != SessionState::Closed; }
  [[nodiscard]] const std::string& file_path() const;
  [[nodiscard]] std::size_t cursor_row() const;
  [[nodiscard]] std::size_t row_count() const;
  [[nodiscard]] const std::string& active_buffer() const;
  [[nodiscard]] const std::map<int, std::string>& edits() const;
  [[nodiscard]] const std::string& baseline_oid() const;
  [[nodiscard]] bool editable() const;
  [[nodiscard]] std::optional<int> current_line() const;
  // Text to display for a file line: the pending edit if any, else the baseline.
  [[nodiscard]] std::optional<std::string> display_line(int line) const;
  [[nodiscard]] bool is_edited(int line) const;

private:
  struct Data {
    DiffKey key;
    DiffView view = DiffView::Split;
    std::vector<RowTarget> rows;
    std::vector<std::string> baseline;
    std::string baseline_oid;
    std::map<int, std::string> edits;
    std::size_t cursor = 0;
    std::string buffer;
  };

  [[nodiscard]] const Data& data() const;
  [[nodiscard]] const std::string* baseline_at(int line) const;
  void commit_buffer();
  void load_buffer();
  void close();

  DiffProvider& diffs_;
  FileProvider& files_;
  SessionState state_ = SessionState::Closed;
  std::optional<Data> data_;
};

} // namespace gitpane
