#include "gitpane/providers.hpp"

namespace gitpane {

std::string_view diff_mode_name(DiffMode mode) {
  switch (mode) {
  case DiffMode::Staged:
    return "staged";
  case DiffMode::Branch:
    return "branch";
  case DiffMode::Working:
    break;
  }
  return "unstaged";
}

std::optional<DiffMode> parse_diff_mode(std::string_view name) {
  if (name == "unstaged" || name == "working")
    return DiffMode::Working;
  if (name == "staged" || name == "cached")
    return DiffMode::Staged;
  if (name == "branch")
    return DiffMode::Branch;
  return std::nullopt;
}

} // namespace gitpane
