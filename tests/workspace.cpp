#include "gitpane/edit_session.hpp"
#include "gitpane/fs.hpp"
#include "gitpane/util.hpp"
#include "gitpane/workspace.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static int run(const fs::path &root) {
  write_file(root / "a.txt", "one\ntwo\nthree\n");
  write_file(root / "src/b.txt", "bee\n");
  fs::create_directories(root / gitpane::consts::kStateDir);

  gitpane::BaselineStatusProvider status{root};
  if (status.changed_files().size() != 2) {
    std::cerr << "everything is untracked before a baseline\n";
    return 1;
  }

  gitpane::BaselineStore store{root};
  if (store.record() != 2 || !store.exists()) {
    std::cerr << "baseline not recorded\n";
    return 1;
  }
  if (store.read("a.txt") != "one\ntwo\nthree\n" || store.read("missing.txt")) {
    std::cerr << "baseline content\n";
    return 1;
  }
  if (!status.changed_files().empty()) {
    std::cerr << "clean workspace reports changes\n";
    return 1;
  }

  write_file(root / "a.txt", "one\nTWO\nthree\n");
  write_file(root / "c.txt", "new\n");
  fs::remove(root / "src/b.txt");
  const auto changes = status.changed_files();
  if (changes.size() != 3 || changes[0].path != "a.txt" || changes[0].code != 'M' ||
      changes[1].path != "c.txt" || changes[1].code != '?' || changes[2].path != "src/b.txt" ||
      changes[2].code != 'D') {
    std::cerr << "status after changes\n";
    return 1;
  }

  gitpane::BaselineDiffProvider diffs{root};
  const auto text = diffs.get_diff("a.txt", gitpane::DiffMode::Working, "");
  if (text.find("diff --git a/a.txt b/a.txt\n") == std::string::npos ||
      text.find("-two\n+TWO\n") == std::string::npos) {
    std::cerr << "working diff:\n" << text;
    return 1;
  }
  if (!diffs.get_diff("a.txt", gitpane::DiffMode::Staged, "").empty()) {
    std::cerr << "staged diff has no meaning here\n";
    return 1;
  }
  const auto gone = diffs.get_diff("src/b.txt", gitpane::DiffMode::Working, "");
  if (gone.find("+++ /dev/null") == std::string::npos || gone.find("-bee") == std::string::npos) {
    std::cerr << "deleted file diff:\n" << gone;
    return 1;
  }
  bool threw = false;
  try {
    diffs.get_diff("../escape.txt", gitpane::DiffMode::Working, "");
  } catch (const std::runtime_error &) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "path outside the workspace accepted\n";
    return 1;
  }

  // the write precondition is the blob id of what was last read
  gitpane::LocalFileProvider files{root};
  const std::string stale = gitpane::compute_blob_hex_oid(std::string_view{"one\ntwo\nthree\n"});
  if (files.write_file("a.txt", "clobber\n", stale) != gitpane::WriteStatus::Conflict ||
      gitpane::fs::read_text(root / "a.txt") != "one\nTWO\nthree\n") {
    std::cerr << "stale precondition must refuse the write\n";
    return 1;
  }

  // end to end: split rows are 0 one, 1 two|TWO, 2 three
  gitpane::EditSession session{diffs, files};
  if (session.enter({.path = "a.txt"}, gitpane::DiffView::Split, 1) !=
      gitpane::EnterResult::Entered) {
    std::cerr << "enter on workspace file\n";
    return 1;
  }
  session.set_buffer("Two!");
  const auto saved = session.save();
  if (saved.lines_written != 1 || gitpane::fs::read_text(root / "a.txt") != "one\nTwo!\nthree\n") {
    std::cerr << "saved content\n";
    return 1;
  }
  if (fs::exists(root / "a.txt.tmp")) {
    std::cerr << "temporary file left behind\n";
    return 1;
  }

  // re-recording one path keeps the rest of the manifest
  if (store.record({"a.txt", "src/b.txt"}) != 1) {
    std::cerr << "partial record\n";
    return 1;
  }
  const auto manifest = store.manifest();
  if (manifest.size() != 1 || !manifest.contains("a.txt")) {
    std::cerr << "manifest after partial record has " << manifest.size() << " entries\n";
    return 1;
  }
  return 0;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitpane_workspace_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  int rc = 1;
  try {
    rc = run(root);
  } catch (const std::exception &e) {
    std::cerr << "unexpected: " << e.what() << "\n";
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
