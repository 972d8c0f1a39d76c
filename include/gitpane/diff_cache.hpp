#pragma once
#include "gitpane/diff_parser.hpp"
#include "gitpane/providers.hpp"
#include "gitpane/side_by_side.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitpane {

// Identifies one diff: the selected file, the diff mode and what it is compared against.
struct DiffKey {
  std::string path;
  DiffMode mode = DiffMode::Working;
  std::string compare_target; // branch name in Branch mode, empty otherwise

  bool operator==(const DiffKey &) const = default;
};

struct ParsedDiff {
  std::string raw;
  std::vector<diff::UnifiedLine> lines;
  std::vector<diff::DiffRow> rows;
};

auto parse_diff(std::string raw) -> ParsedDiff;

// Cache of the last parsed diff with last-request-wins semantics: every begin() bumps a
// generation, and a result delivered with an older ticket is dropped.
class DiffLoader {
public:
  using Ticket = std::uint64_t;

  // Start loading `key`; any request still in flight is superseded.
  Ticket begin(DiffKey key);

  // Deliver the text fetched for `ticket`. Returns false (and changes nothing) when a newer
  // request has been started since.
  bool complete(Ticket ticket, std::string text);

  // Synchronous fetch through `provider`. Reuses the cached parse when `key` is unchanged.
  const ParsedDiff &load(DiffProvider &provider, const DiffKey &key);

  // Forget the cached parse so the next load() refetches (after a save, for instance).
  void invalidate();

  [[nodiscard]] const ParsedDiff *current() const;
  [[nodiscard]] const std::optional<DiffKey> &key() const { return key_; }
  [[nodiscard]] bool pending() const { return pending_; }
  [[nodiscard]] Ticket generation() const { return generation_; }

private:
  Ticket generation_ = 0;
  std::optional<DiffKey> key_;
  std::optional<ParsedDiff> parsed_;
  bool pending_ = false;
};

} // namespace gitpane
