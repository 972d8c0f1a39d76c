#include "gitpane/edit_session.hpp"

#include "gitpane/log.hpp"
#include "gitpane/util.hpp"

#include <algorithm>
#include <sstream>

namespace gitpane {

namespace {

std::string conflict_message(const std::string &path, const std::vector<int> &lines) {
  std::ostringstream os;
  os << "edit: " << path << " has been modified (line";
  if (lines.size() > 1)
    os << 's';
  for (std::size_t i = 0; i < lines.size(); ++i)
    os << (i ? ", " : " ") << lines[i];
  os << "). Please exit and re-enter edit mode to see latest changes.";
  return os.str();
}

std::vector<RowTarget> targets_for(std::string_view diff_text, DiffView view) {
  if (view == DiffView::Unified)
    return row_targets(diff::parse_unified(diff_text));
  return row_targets(diff::pair_side_by_side(diff_text));
}

// New-side content the diff records for each line it covers
std::map<int, std::string> expected_lines(std::string_view diff_text) {
  std::map<int, std::string> out;
  for (auto &ul : diff::parse_unified(diff_text)) {
    if (ul.new_line)
      out[*ul.new_line] = std::move(ul.content);
  }
  return out;
}

} // namespace

std::string_view describe(EnterResult r) {
  switch (r) {
  case EnterResult::Entered:
    return "";
  case EnterResult::AlreadyOpen:
    return "An edit session is already open. Save or cancel it first.";
  case EnterResult::NoSuchRow:
    return "No diff row at the cursor.";
  case EnterResult::NotEditable:
    return "Cannot edit this line.";
  case EnterResult::Stale:
    return "File has been modified since diff was generated. Refresh to see latest changes.";
  }
  return "";
}

std::vector<RowTarget> row_targets(const std::vector<diff::UnifiedLine> &lines) {
  std::vector<RowTarget> out;
  out.reserve(lines.size());
  for (const auto &ul : lines) {
    RowTarget t{.content = ul.content};
    if (ul.kind == diff::LineKind::Add || ul.kind == diff::LineKind::Context)
      t.line = ul.new_line;
    out.push_back(std::move(t));
  }
  return out;
}

std::vector<RowTarget> row_targets(const std::vector<diff::DiffRow> &rows) {
  std::vector<RowTarget> out;
  out.reserve(rows.size());
  for (const auto &row : rows)
    out.push_back(RowTarget{.line = row.right_line, .content = row.right});
  return out;
}

ConflictError::ConflictError(const std::string &path, std::vector<int> lines)
    : std::runtime_error(conflict_message(path, lines)), lines_(std::move(lines)) {}

EditSession::EditSession(DiffProvider &diffs, FileProvider &files)
    : diffs_(diffs), files_(files) {}

EnterResult EditSession::enter(const DiffKey &key, DiffView view, std::size_t cursor_row) {
  if (state_ != SessionState::Closed)
    return EnterResult::AlreadyOpen;

  const std::string text = diffs_.get_diff(key.path, key.mode, key.compare_target);
  auto rows = targets_for(text, view);
  if (cursor_row >= rows.size())
    return EnterResult::NoSuchRow;
  const RowTarget &target = rows[cursor_row];
  if (!target.line)
    return EnterResult::NotEditable;

  const std::string content = files_.read_file(key.path);
  auto lines = strutil::split_text_lines(content);
  const int line = *target.line;
  if (line < 1 || static_cast<std::size_t>(line) > lines.size() ||
      lines[static_cast<std::size_t>(line) - 1] != target.content) {
    log::warn("edit: " + key.path + " line " + std::to_string(line) +
              " does not match the diff; refusing to edit");
    return EnterResult::Stale;
  }

  std::string buffer = target.content;
  data_ = Data{.key = key,
               .view = view,
               .rows = std::move(rows),
               .baseline = std::move(lines),
               .baseline_oid = compute_blob_hex_oid(content),
               .cursor = cursor_row,
               .buffer = std::move(buffer)};
  state_ = SessionState::Open;
  log::info("edit: opened " + key.path + " at line " + std::to_string(line));
  return EnterResult::Entered;
}

bool EditSession::set_buffer(std::string text) {
  if (state_ != SessionState::Open || !editable())
    return false;
  data_->buffer = std::move(text);
  return true;
}

void EditSession::move(int delta) {
  if (state_ != SessionState::Open)
    return;
  const auto last = static_cast<long long>(data_->rows.size()) - 1;
  const long long next = static_cast<long long>(data_->cursor) + delta;
  move_to(static_cast<std::size_t>(std::clamp(next, 0LL, last)));
}

void EditSession::move_to(std::size_t row) {
  if (state_ != SessionState::Open)
    return;
  commit_buffer();
  data_->cursor = std::min(row, data_->rows.size() - 1);
  load_buffer();
}

SaveResult EditSession::save() {
  if (state_ != SessionState::Open)
    throw std::logic_error("edit: save without an open session");

  commit_buffer();
  if (data_->edits.empty()) {
    log::info("edit: no changes to save in " + data_->key.path);
    close();
    return {.outcome = SaveOutcome::NoChanges};
  }

  state_ = SessionState::Saving;
  const Data &d = *data_;
  try {
    const auto expected =
        expected_lines(diffs_.get_diff(d.key.path, d.key.mode, d.key.compare_target));
    const std::string current = files_.read_file(d.key.path);
    auto lines = strutil::split_text_lines(current);

    const std::string current_oid = compute_blob_hex_oid(current);
    if (current_oid != d.baseline_oid)
      log::info("edit: " + d.key.path + " changed on disk since the session started");

    std::vector<int> conflicts;
    for (const auto &[line, _] : d.edits) {
      const auto idx = static_cast<std::size_t>(line) - 1;
      const std::string *base = baseline_at(line);
      if (idx >= lines.size() || !base || lines[idx] != *base) {
        conflicts.push_back(line);
        continue;
      }
      if (auto it = expected.find(line); it != expected.end() && it->second != lines[idx])
        conflicts.push_back(line);
    }
    if (!conflicts.empty())
      throw ConflictError(d.key.path, std::move(conflicts));

    for (const auto &[line, text] : d.edits)
      lines[static_cast<std::size_t>(line) - 1] = text;

    if (files_.write_file(d.key.path, strutil::join_lines(lines), current_oid) ==
        WriteStatus::Conflict) {
      std::vector<int> all;
      for (const auto &[line, _] : d.edits)
        all.push_back(line);
      throw ConflictError(d.key.path, std::move(all));
    }
  } catch (const ConflictError &e) {
    log::warn(e.what());
    state_ = SessionState::Open;
    throw;
  } catch (const std::exception &e) {
    log::error("edit: save failed: " + std::string(e.what()));
    state_ = SessionState::Open;
    throw;
  }

  const std::size_t written = d.edits.size();
  log::info("edit: saved " + std::to_string(written) + " line(s) to " + d.key.path);
  close();
  return {.outcome = SaveOutcome::Saved, .lines_written = written, .refresh_needed = true};
}

std::size_t EditSession::cancel() {
  if (state_ != SessionState::Open)
    return 0;
  commit_buffer();
  const std::size_t dropped = data_->edits.size();
  log::info("edit: discarded " + std::to_string(dropped) + " edit(s) in " + data_->key.path);
  close();
  return dropped;
}

const EditSession::Data &EditSession::data() const {
  if (!data_)
    throw std::logic_error("edit: no open session");
  return *data_;
}

const std::string &EditSession::file_path() const { return data().key.path; }
std::size_t EditSession::cursor_row() const { return data().cursor; }
std::size_t EditSession::row_count() const { return data().rows.size(); }
const std::string &EditSession::active_buffer() const { return data().buffer; }
const std::map<int, std::string> &EditSession::edits() const { return data().edits; }
const std::string &EditSession::baseline_oid() const { return data().baseline_oid; }

bool EditSession::editable() const {
  if (!data_)
    return false;
  const auto line = current_line();
  return line && baseline_at(*line) != nullptr;
}

std::optional<int> EditSession::current_line() const {
  if (!data_)
    return std::nullopt;
  return data_->rows[data_->cursor].line;
}

std::optional<std::string> EditSession::display_line(int line) const {
  const Data &d = data();
  if (auto it = d.edits.find(line); it != d.edits.end())
    return it->second;
  if (const std::string *base = baseline_at(line))
    return *base;
  return std::nullopt;
}

bool EditSession::is_edited(int line) const { return data().edits.contains(line); }

const std::string *EditSession::baseline_at(int line) const {
  const Data &d = data();
  if (line < 1 || static_cast<std::size_t>(line) > d.baseline.size())
    return nullptr;
  return &d.baseline[static_cast<std::size_t>(line) - 1];
}

void EditSession::commit_buffer() {
  if (!editable())
    return;
  const int line = *current_line();
  if (data_->buffer != *baseline_at(line))
    data_->edits[line] = data_->buffer;
  else
    data_->edits.erase(line);
}

void EditSession::load_buffer() {
  if (!editable()) {
    data_->buffer.clear();
    return;
  }
  const int line = *current_line();
  const auto it = data_->edits.find(line);
  data_->buffer = it != data_->edits.end() ? it->second : *baseline_at(line);
}

void EditSession::close() {
  data_.reset();
  state_ = SessionState::Closed;
}

} // namespace gitpane
